#include <catch2/catch_test_macros.hpp>
#include "c19/data_seeder.hpp"
#include <filesystem>
#include <fstream>

using namespace c19;

TEST_CASE("DataSeeder loads JSON", "[seeder]") {
    Timestamp now = 20000;
    ClockFn clock = [&now]() { return now; };
    EntryStore store(4, clock);
    Reconciler reconciler(store, clock);

    SECTION("Values, ttl and timestamps") {
        DataSeeder seeder(reconciler, std::nullopt, clock);
        auto stats = seeder.load_json(R"({
            "greeting": {"value": "hello"},
            "config": {"value": {"a": [1, 2]}, "ttl": 5000},
            "count": {"value": 42, "ts": 100}
        })");

        REQUIRE(stats.applied == 3);

        auto greeting = store.get(Key("greeting"));
        REQUIRE(greeting);
        REQUIRE(greeting->value_view() == "hello");
        REQUIRE(greeting->created_at == now);
        REQUIRE(!greeting->ttl);

        auto config = store.get(Key("config"));
        REQUIRE(config->value_view() == R"({"a": [1, 2]})");
        REQUIRE(config->ttl == 5000u);

        auto count = store.get(Key("count"));
        REQUIRE(count->value_view() == "42");
        REQUIRE(count->created_at == 100);
    }

    SECTION("Default ttl applies when none given") {
        DataSeeder seeder(reconciler, 60000, clock);
        seeder.load_json(R"({"a": {"value": "x"}, "b": {"value": "y", "ttl": 10}})");

        REQUIRE(store.lookup(Key("a"))->ttl == 60000u);
        REQUIRE(store.lookup(Key("b"))->ttl == 10u);
    }

    SECTION("Seeded entries merge like remote ones") {
        store.put(Key("a"), Entry::make("local", 30000));
        DataSeeder seeder(reconciler, std::nullopt, clock);
        auto stats = seeder.load_json(R"({"a": {"value": "seed", "ts": 1}})");

        REQUIRE(stats.stale == 1);
        REQUIRE(store.get(Key("a"))->value_view() == "local");
    }

    SECTION("Malformed input throws") {
        DataSeeder seeder(reconciler, std::nullopt, clock);
        REQUIRE_THROWS(seeder.load_json("[]"));
        REQUIRE_THROWS(seeder.load_json(R"({"a": "not an object"})"));
        REQUIRE_THROWS(seeder.load_json(R"({"a": {"ttl": 5}})"));
        REQUIRE_THROWS(seeder.load_json(R"({"a": {"value": 1, "ttl": 0}})"));
        REQUIRE_THROWS(seeder.load_json(R"({"a": {"value": 1, "ts": -5}})"));
        REQUIRE_THROWS(seeder.load_json(R"({"": {"value": 1}})"));
        REQUIRE(store.size() == 0);
    }
}

TEST_CASE("DataSeeder loads files", "[seeder]") {
    EntryStore store;
    Reconciler reconciler(store);
    DataSeeder seeder(reconciler, std::nullopt);

    SECTION("Existing file") {
        auto path = std::filesystem::temp_directory_path() /
                    ("c19_seed_" + std::to_string(now_ms()) + ".json");
        {
            std::ofstream out(path);
            out << R"({"k1": {"value": "v1"}, "k2": {"value": "v2"}})";
        }

        auto stats = seeder.load_file(path);
        std::filesystem::remove(path);

        REQUIRE(stats.applied == 2);
        REQUIRE(store.get(Key("k2"))->value_view() == "v2");
    }

    SECTION("Missing file") {
        REQUIRE_THROWS(seeder.load_file("/nonexistent/c19/seed.json"));
    }
}
