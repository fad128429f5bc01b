#include <catch2/catch_test_macros.hpp>
#include "c19/types.hpp"
#include <unordered_set>

using namespace c19;

TEST_CASE("Key basic operations", "[types]") {
    SECTION("Empty key") {
        Key key;
        REQUIRE(key.empty());
        REQUIRE(key.size() == 0);
    }

    SECTION("String key") {
        Key key("alpha");
        REQUIRE(!key.empty());
        REQUIRE(key.size() == 5);
        REQUIRE(key.view() == "alpha");
        REQUIRE(key.str() == "alpha");
    }

    SECTION("Key equality and ordering") {
        Key a1("a");
        Key a2("a");
        Key b("b");

        REQUIRE(a1 == a2);
        REQUIRE(!(a1 == b));
        REQUIRE(a1 < b);
        REQUIRE(!(b < a1));
    }

    SECTION("Key hashing") {
        Key k1("test");
        Key k2("test");

        REQUIRE(k1.hash() == k2.hash());
        REQUIRE(k1.hash() != 0);
        REQUIRE(std::hash<Key>{}(k1) == k1.hash());

        std::unordered_set<Key> set{Key("x"), Key("y"), Key("x")};
        REQUIRE(set.size() == 2);
    }
}

TEST_CASE("Entry expiry", "[types]") {
    SECTION("No ttl never expires") {
        auto e = Entry::make("v", 1000);
        REQUIRE(!e.is_expired(1000));
        REQUIRE(!e.is_expired(UINT64_MAX));
    }

    SECTION("Expired once age reaches ttl") {
        auto e = Entry::make("v", 1000, 500);
        REQUIRE(!e.is_expired(1000));
        REQUIRE(!e.is_expired(1499));
        REQUIRE(e.is_expired(1500));
        REQUIRE(e.is_expired(9000));
    }

    SECTION("Clock behind creation time is not expired") {
        auto e = Entry::make("v", 5000, 10);
        REQUIRE(!e.is_expired(4000));
    }

    SECTION("Tombstone carries no value") {
        auto t = Entry::make_tombstone(42, 100);
        REQUIRE(t.tombstone);
        REQUIRE(t.value.empty());
        REQUIRE(t.created_at == 42);
        REQUIRE(t.ttl == 100u);
    }

    SECTION("Value view") {
        auto e = Entry::make("hello", 1);
        REQUIRE(e.value_view() == "hello");
        REQUIRE(!e.tombstone);
    }
}

TEST_CASE("Status", "[types]") {
    SECTION("Default is ok") {
        Status s;
        REQUIRE(s.ok());
        REQUIRE(static_cast<bool>(s));
        REQUIRE(s.code() == ErrorCode::Ok);
    }

    SECTION("Error carries code and message") {
        auto s = Status::error(ErrorCode::Timeout, "peer slow");
        REQUIRE(s.is_error());
        REQUIRE(!s);
        REQUIRE(s.code() == ErrorCode::Timeout);
        REQUIRE(s.message() == "peer slow");
        REQUIRE(s.to_string().find("peer slow") != std::string::npos);
    }

    SECTION("Every code has a name") {
        REQUIRE(std::string(error_code_string(ErrorCode::MalformedMessage)).size() > 0);
        REQUIRE(std::string(error_code_string(ErrorCode::PeerUnreachable)).size() > 0);
    }
}

TEST_CASE("Byte conversions", "[types]") {
    auto bytes = to_bytes("abc");
    REQUIRE(bytes.size() == 3);
    REQUIRE(bytes[0] == 'a');
    REQUIRE(as_string(bytes) == "abc");
}

TEST_CASE("Wall clock", "[types]") {
    auto t1 = now_ms();
    auto t2 = now_ms();
    REQUIRE(t1 > 1600000000000ULL);
    REQUIRE(t2 >= t1);
}
