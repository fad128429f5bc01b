#pragma once

#include "types.hpp"
#include "config.hpp"
#include "store.hpp"
#include "reconciler.hpp"
#include "digest.hpp"
#include "peer_selector.hpp"
#include "peer_provider.hpp"
#include "transport.hpp"
#include "timer.hpp"
#include <elio/coro/task.hpp>
#include <elio/runtime/scheduler.hpp>
#include <elio/io/io_context.hpp>
#include <elio/time/timer.hpp>
#include <atomic>
#include <mutex>

namespace c19 {

// Anti-entropy state machine.
//
// Two independent cycles run on their own timers:
//   push: every push_interval, send the entries changed since the previous
//         push (or the whole store with force_publish) to r0 random peers,
//         fire-and-forget.
//   pull: every pull_interval, send our digest to r0 random peers and merge
//         what they return. The responder also lists keys it wants; those,
//         and any returned entry we beat, are pushed back in the same cycle,
//         so one pull in either direction converges both sides.
//
// Every per-peer exchange runs as its own coroutine bounded by `timeout`;
// one slow or dead peer never delays the others.
class GossipEngine {
public:
    GossipEngine(IStore& store, ITransport& transport, IPeerProvider& peers,
                 const ConnectionConfig& config, elio::io::io_context& io_ctx,
                 ClockFn clock = now_ms);
    ~GossipEngine();

    GossipEngine(const GossipEngine&) = delete;
    GossipEngine& operator=(const GossipEngine&) = delete;

    // Lifecycle. start() fails with InvalidArgument on a bad configuration.
    // stop() returns once both timer loops have exited and in-flight
    // exchanges have finished or been given up on.
    Status start(elio::runtime::scheduler& sched);
    elio::coro::task<void> stop();
    bool is_running() const { return running_; }

    // Dispatch of a message received from a peer; returns the reply, if any
    std::optional<protocol::Message> handle_message(const protocol::Message& msg);

    // Next push payload; nullopt when nothing changed and force_publish is off.
    // Batches larger than max_message_size are split across calls.
    std::optional<protocol::Message> next_push();

    protocol::PullRequestMessage make_pull_request() const;

    // Merges a pull response; returns the entries to push back, if any
    std::optional<protocol::PushMessage> handle_pull_response(const protocol::PullResponseMessage& resp);

    std::vector<std::string> select_peers();

    // One round each; per-peer exchanges are spawned on the scheduler
    void push_round();
    void pull_round();

    size_t in_flight() const { return in_flight_.load(); }
    size_t active_loops() const { return loops_.load(); }

private:
    IStore& store_;
    ITransport& transport_;
    IPeerProvider& peers_;
    ConnectionConfig config_;
    elio::io::io_context& io_ctx_;
    ClockFn clock_;

    Reconciler reconciler_;
    DigestBuilder digests_;
    PeerSelector selector_;

    elio::runtime::scheduler* sched_ = nullptr;
    std::atomic<bool> running_{false};
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> loops_{0};

    std::mutex publish_mutex_;
    uint64_t published_revision_ = 0;
    size_t full_push_cursor_ = 0;

    void on_push(const EntryList& entries);
    protocol::PullResponseMessage on_pull_request(const protocol::PullRequestMessage& req);
    void record(const MergeStats& stats);
    size_t payload_budget() const;

    void spawn_exchange(elio::coro::task<void> task);

    elio::coro::task<void> push_loop();
    elio::coro::task<void> pull_loop();
    elio::coro::task<void> push_to_peer(std::string peer, protocol::Message msg);
    elio::coro::task<void> pull_from_peer(std::string peer, protocol::Message req);
};

}  // namespace c19
