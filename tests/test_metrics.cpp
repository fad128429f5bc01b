#include <catch2/catch_test_macros.hpp>
#include "c19/metrics.hpp"
#include "c19/store.hpp"
#include <thread>
#include <vector>

using namespace c19;

TEST_CASE("Counter", "[metrics]") {
    Counter counter;
    REQUIRE(counter.get() == 0);

    SECTION("Increments") {
        counter.inc();
        counter.inc(4);
        REQUIRE(counter.get() == 5);
        counter.reset();
        REQUIRE(counter.get() == 0);
    }

    SECTION("Concurrent increments are not lost") {
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&counter]() {
                for (int j = 0; j < 1000; ++j) {
                    counter.inc();
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(counter.get() == 8000);
    }
}

TEST_CASE("Gauge", "[metrics]") {
    Gauge gauge;
    REQUIRE(gauge.get() == 0.0);

    gauge.set(3.0);
    gauge.inc();
    gauge.inc(2.5);
    gauge.dec(0.5);
    REQUIRE(gauge.get() == 6.0);
}

TEST_CASE("LatencyHistogram", "[metrics]") {
    LatencyHistogram histogram;

    SECTION("Empty") {
        auto snap = histogram.snapshot();
        REQUIRE(snap.count == 0);
        REQUIRE(snap.sum == 0.0);
        REQUIRE(snap.buckets.back().second == 0);
    }

    SECTION("Cumulative buckets") {
        histogram.observe(0.3);
        histogram.observe(0.9);
        histogram.observe(40.0);
        histogram.observe(100000.0);

        auto snap = histogram.snapshot();
        REQUIRE(snap.count == 4);

        for (const auto& [bound, count] : snap.buckets) {
            if (bound == 0.5) REQUIRE(count == 1);
            if (bound == 1.0) REQUIRE(count == 2);
            if (bound == 50.0) REQUIRE(count == 3);
        }
        REQUIRE(snap.buckets.back().second == 4);
    }

    SECTION("Reset") {
        histogram.observe(7.0);
        histogram.reset();
        REQUIRE(histogram.snapshot().count == 0);
    }
}

TEST_CASE("LatencyTimer records on scope exit", "[metrics]") {
    LatencyHistogram histogram;
    {
        LatencyTimer timer(histogram);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    auto snap = histogram.snapshot();
    REQUIRE(snap.count == 1);
    REQUIRE(snap.sum >= 5.0);
}

TEST_CASE("Global metrics", "[metrics]") {
    auto& m = metrics();

    auto before = m.push_rounds_total.get();
    m.push_rounds_total.inc();
    REQUIRE(metrics().push_rounds_total.get() == before + 1);

    double t1 = m.uptime_seconds();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(m.uptime_seconds() > t1);
}

TEST_CASE("MetricsCollector", "[metrics]") {
    EntryStore store;
    store.put(Key("a"), Entry::make("1", now_ms()));
    store.put(Key("b"), Entry::make("2", now_ms()));

    MetricsCollector collector;
    collector.set_store(&store);

    SECTION("Collect reads the store size") {
        collector.collect();
        REQUIRE(metrics().store_entries.get() == 2.0);
    }

    SECTION("Prometheus text") {
        collector.collect();
        auto output = collector.export_prometheus();

        REQUIRE(output.find("# TYPE c19_push_rounds_total counter") != std::string::npos);
        REQUIRE(output.find("c19_pull_rounds_total") != std::string::npos);
        REQUIRE(output.find("c19_peer_timeouts_total") != std::string::npos);
        REQUIRE(output.find("c19_malformed_messages_total") != std::string::npos);
        REQUIRE(output.find("c19_store_entries 2.00") != std::string::npos);
        REQUIRE(output.find("c19_exchange_latency_ms_bucket{le=\"+Inf\"}") != std::string::npos);
        REQUIRE(output.find("c19_uptime_seconds") != std::string::npos);
    }
}
