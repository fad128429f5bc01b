#pragma once

#include "types.hpp"
#include <string>
#include <sstream>
#include <atomic>
#include <mutex>
#include <memory>
#include <chrono>
#include <vector>

namespace c19 {

class IStore;

// Histogram bucket for latency tracking
struct HistogramBucket {
    double upper_bound;
    std::unique_ptr<std::atomic<uint64_t>> count;

    HistogramBucket(double bound) : upper_bound(bound), count(std::make_unique<std::atomic<uint64_t>>(0)) {}
};

// Latency histogram with fixed millisecond buckets
class LatencyHistogram {
public:
    LatencyHistogram();

    void observe(double value_ms);

    // Cumulative bucket counts and sum for Prometheus format
    struct Snapshot {
        std::vector<std::pair<double, uint64_t>> buckets;
        uint64_t count;
        double sum;
    };

    Snapshot snapshot() const;
    void reset();

private:
    std::vector<HistogramBucket> buckets_;
    std::atomic<uint64_t> count_{0};
    std::atomic<double> sum_{0};

    static constexpr double DEFAULT_BUCKETS[] = {
        0.1, 0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000
    };
};

// Counter metric
class Counter {
public:
    Counter() = default;

    void inc(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }
    void reset() { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

// Gauge metric (can go up or down)
class Gauge {
public:
    Gauge() = default;

    void set(double v) { value_.store(v, std::memory_order_relaxed); }
    void inc(double n = 1) {
        double old = value_.load();
        while (!value_.compare_exchange_weak(old, old + n));
    }
    void dec(double n = 1) { inc(-n); }
    double get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0};
};

// All process-wide metrics
struct Metrics {
    // Gossip rounds
    Counter push_rounds_total;
    Counter pull_rounds_total;
    Counter push_rounds_skipped_total;

    // Traffic
    Counter messages_sent_total;
    Counter messages_received_total;
    Counter malformed_messages_total;
    Counter peer_failures_total;
    Counter peer_timeouts_total;

    // Reconciliation
    Counter entries_applied_total;
    Counter entries_stale_total;
    Counter entries_expired_total;
    Counter entries_purged_total;

    // Local API
    Counter local_puts_total;
    Counter local_deletes_total;

    Gauge store_entries;
    Gauge exchanges_in_flight;

    LatencyHistogram exchange_latency_ms;

    std::chrono::steady_clock::time_point start_time;

    Metrics() : start_time(std::chrono::steady_clock::now()) {}

    double uptime_seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time).count();
    }
};

// Global metrics instance
Metrics& metrics();

// Gathers gauges from their sources and renders the metrics
class MetricsCollector {
public:
    MetricsCollector();

    void set_store(const IStore* store) { store_ = store; }

    // Update gauges from sources
    void collect();

    // Export to Prometheus text format
    std::string export_prometheus() const;

private:
    const IStore* store_ = nullptr;
    mutable std::mutex mutex_;

    void write_counter(std::ostringstream& out, const std::string& name,
                       const std::string& help, uint64_t value) const;
    void write_gauge(std::ostringstream& out, const std::string& name,
                     const std::string& help, double value) const;
    void write_histogram(std::ostringstream& out, const std::string& name,
                         const std::string& help,
                         const LatencyHistogram::Snapshot& snap) const;
};

// RAII timer for latency measurement
class LatencyTimer {
public:
    explicit LatencyTimer(LatencyHistogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now())
    {}

    ~LatencyTimer() {
        auto end = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start_).count();
        histogram_.observe(ms);
    }

    LatencyTimer(const LatencyTimer&) = delete;
    LatencyTimer& operator=(const LatencyTimer&) = delete;

private:
    LatencyHistogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace c19
