#include "c19/metrics.hpp"
#include "c19/store.hpp"
#include <iomanip>
#include <cmath>
#include <limits>

namespace c19 {

static Metrics g_metrics;

Metrics& metrics() {
    return g_metrics;
}

// LatencyHistogram implementation

LatencyHistogram::LatencyHistogram() {
    for (double bound : DEFAULT_BUCKETS) {
        buckets_.emplace_back(bound);
    }
    buckets_.emplace_back(std::numeric_limits<double>::infinity());
}

void LatencyHistogram::observe(double value_ms) {
    for (auto& bucket : buckets_) {
        if (value_ms <= bucket.upper_bound) {
            bucket.count->fetch_add(1, std::memory_order_relaxed);
            break;
        }
    }

    count_.fetch_add(1, std::memory_order_relaxed);

    double old_sum = sum_.load(std::memory_order_relaxed);
    while (!sum_.compare_exchange_weak(old_sum, old_sum + value_ms,
                                        std::memory_order_relaxed));
}

LatencyHistogram::Snapshot LatencyHistogram::snapshot() const {
    Snapshot snap;
    snap.count = count_.load(std::memory_order_relaxed);
    snap.sum = sum_.load(std::memory_order_relaxed);

    uint64_t cumulative = 0;
    for (const auto& bucket : buckets_) {
        cumulative += bucket.count->load(std::memory_order_relaxed);
        snap.buckets.emplace_back(bucket.upper_bound, cumulative);
    }

    return snap;
}

void LatencyHistogram::reset() {
    for (auto& bucket : buckets_) {
        bucket.count->store(0, std::memory_order_relaxed);
    }
    count_.store(0, std::memory_order_relaxed);
    sum_.store(0, std::memory_order_relaxed);
}

// MetricsCollector implementation

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::collect() {
    if (store_) {
        metrics().store_entries.set(static_cast<double>(store_->size()));
    }
}

void MetricsCollector::write_counter(std::ostringstream& out,
                                     const std::string& name,
                                     const std::string& help,
                                     uint64_t value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
}

void MetricsCollector::write_gauge(std::ostringstream& out,
                                   const std::string& name,
                                   const std::string& help,
                                   double value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << std::fixed << std::setprecision(2) << value << "\n";
}

void MetricsCollector::write_histogram(std::ostringstream& out,
                                       const std::string& name,
                                       const std::string& help,
                                       const LatencyHistogram::Snapshot& snap) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " histogram\n";

    for (const auto& [bound, count] : snap.buckets) {
        out << name << "_bucket{le=\"";
        if (std::isinf(bound)) {
            out << "+Inf";
        } else {
            out << std::fixed << std::setprecision(1) << bound;
        }
        out << "\"} " << count << "\n";
    }

    out << name << "_sum " << std::fixed << std::setprecision(3) << snap.sum << "\n";
    out << name << "_count " << snap.count << "\n";
}

std::string MetricsCollector::export_prometheus() const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;

    auto& m = metrics();

    // Rounds
    write_counter(out, "c19_push_rounds_total",
                  "Push rounds started", m.push_rounds_total.get());
    write_counter(out, "c19_push_rounds_skipped_total",
                  "Push rounds skipped with nothing to publish", m.push_rounds_skipped_total.get());
    write_counter(out, "c19_pull_rounds_total",
                  "Pull rounds started", m.pull_rounds_total.get());

    // Traffic
    write_counter(out, "c19_messages_sent_total",
                  "Gossip messages sent", m.messages_sent_total.get());
    write_counter(out, "c19_messages_received_total",
                  "Gossip messages received", m.messages_received_total.get());
    write_counter(out, "c19_malformed_messages_total",
                  "Undecodable messages dropped", m.malformed_messages_total.get());
    write_counter(out, "c19_peer_failures_total",
                  "Failed exchanges with peers", m.peer_failures_total.get());
    write_counter(out, "c19_peer_timeouts_total",
                  "Exchanges abandoned at the per-peer deadline", m.peer_timeouts_total.get());

    // Reconciliation
    write_counter(out, "c19_entries_applied_total",
                  "Remote entries that won reconciliation", m.entries_applied_total.get());
    write_counter(out, "c19_entries_stale_total",
                  "Remote entries that lost reconciliation", m.entries_stale_total.get());
    write_counter(out, "c19_entries_expired_total",
                  "Remote entries refused as already expired", m.entries_expired_total.get());
    write_counter(out, "c19_entries_purged_total",
                  "Entries removed by the expiry sweeper", m.entries_purged_total.get());

    // Local API
    write_counter(out, "c19_local_puts_total",
                  "Local writes", m.local_puts_total.get());
    write_counter(out, "c19_local_deletes_total",
                  "Local deletes", m.local_deletes_total.get());

    write_gauge(out, "c19_store_entries",
                "Entries held in the local store", m.store_entries.get());
    write_gauge(out, "c19_exchanges_in_flight",
                "Per-peer exchanges currently running", m.exchanges_in_flight.get());

    write_histogram(out, "c19_exchange_latency_ms",
                    "Per-peer exchange latency in milliseconds",
                    m.exchange_latency_ms.snapshot());

    write_gauge(out, "c19_uptime_seconds",
                "Time since process start in seconds", m.uptime_seconds());

    return out.str();
}

}  // namespace c19
