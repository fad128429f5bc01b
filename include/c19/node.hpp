#pragma once

#include "types.hpp"
#include "config.hpp"
#include "store.hpp"
#include "peer_provider.hpp"
#include "transport.hpp"
#include "gossip_engine.hpp"
#include "expiry_sweeper.hpp"
#include "metrics.hpp"
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <memory>

namespace c19 {

// One replica: owns the store and everything that keeps it in sync.
// Transport and peer provider default to TCP and the configured static list.
class Node {
public:
    explicit Node(const Config& config,
                  std::unique_ptr<ITransport> transport = nullptr,
                  std::unique_ptr<IPeerProvider> peers = nullptr,
                  ClockFn clock = now_ms);
    ~Node();

    // Start all services (requires scheduler for background tasks)
    elio::coro::task<Status> start(elio::runtime::scheduler& sched);

    // Stop all services gracefully
    elio::coro::task<void> stop();

    // Local access to the replicated state. A local write made at or after the
    // stored entry's timestamp always takes effect: one landing in the same
    // millisecond as the stored entry is stamped just past it.
    std::optional<Entry> get(std::string_view key) const;
    Status put(std::string_view key, std::string_view value,
               std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    Status remove(std::string_view key);

    // Access components
    IStore& store() { return *store_; }
    GossipEngine& engine() { return *engine_; }
    ExpirySweeper& sweeper() { return *sweeper_; }
    MetricsCollector& metrics() { return *metrics_collector_; }
    elio::io::io_context& io_context() { return io_ctx_; }

    const Config& config() const { return config_; }

private:
    Config config_;
    ClockFn clock_;
    elio::io::io_context io_ctx_;  // Owned io_context for all async I/O
    std::unique_ptr<EntryStore> store_;
    std::unique_ptr<IPeerProvider> peers_;
    std::unique_ptr<ITransport> transport_;
    std::unique_ptr<GossipEngine> engine_;
    std::unique_ptr<ExpirySweeper> sweeper_;
    std::unique_ptr<MetricsCollector> metrics_collector_;

    std::atomic<bool> running_{false};
    std::atomic<Timestamp> last_stamp_{0};  // Highest timestamp given to a local write

    Status check_key(std::string_view key) const;
    bool write_local(const Key& key, Entry entry);
    void seed();
};

}  // namespace c19
