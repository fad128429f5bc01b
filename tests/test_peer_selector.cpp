#include <catch2/catch_test_macros.hpp>
#include "c19/peer_selector.hpp"
#include <map>
#include <set>

using namespace c19;

TEST_CASE("PeerSelector bounds", "[peers]") {
    PeerSelector selector(7);
    std::vector<std::string> peers{"a:1", "b:1", "c:1", "d:1", "e:1"};

    SECTION("Returns exactly fanout peers when enough exist") {
        auto chosen = selector.select(peers, 3);
        REQUIRE(chosen.size() == 3);
    }

    SECTION("Returns all peers when fanout exceeds the set") {
        auto chosen = selector.select(peers, 10);
        REQUIRE(chosen.size() == 5);
        REQUIRE(std::set<std::string>(chosen.begin(), chosen.end()) ==
                std::set<std::string>(peers.begin(), peers.end()));
    }

    SECTION("Zero fanout or no peers") {
        REQUIRE(selector.select(peers, 0).empty());
        REQUIRE(selector.select({}, 3).empty());
    }

    SECTION("No duplicates, even when the input repeats") {
        std::vector<std::string> repeated{"a:1", "a:1", "b:1", "b:1", "c:1"};
        for (int i = 0; i < 50; ++i) {
            auto chosen = selector.select(repeated, 3);
            REQUIRE(chosen.size() == 3);
            REQUIRE(std::set<std::string>(chosen.begin(), chosen.end()).size() == 3);
        }
    }

    SECTION("Only known peers are returned") {
        std::set<std::string> known(peers.begin(), peers.end());
        for (int i = 0; i < 50; ++i) {
            for (const auto& p : selector.select(peers, 2)) {
                REQUIRE(known.count(p) == 1);
            }
        }
    }
}

TEST_CASE("PeerSelector spreads choices", "[peers]") {
    PeerSelector selector(42);
    std::vector<std::string> peers{"a", "b", "c", "d"};

    std::map<std::string, int> hits;
    constexpr int rounds = 4000;
    for (int i = 0; i < rounds; ++i) {
        for (const auto& p : selector.select(peers, 1)) {
            ++hits[p];
        }
    }

    // Each peer should get roughly a quarter of the picks
    REQUIRE(hits.size() == 4);
    for (const auto& [peer, count] : hits) {
        REQUIRE(count > rounds / 4 - 300);
        REQUIRE(count < rounds / 4 + 300);
    }
}

TEST_CASE("PeerSelector with equal seeds is reproducible", "[peers]") {
    PeerSelector a(99);
    PeerSelector b(99);
    std::vector<std::string> peers{"p1", "p2", "p3", "p4", "p5", "p6"};

    for (int i = 0; i < 10; ++i) {
        REQUIRE(a.select(peers, 2) == b.select(peers, 2));
    }
}
