#pragma once

#include "store.hpp"
#include "timer.hpp"
#include <elio/coro/task.hpp>
#include <elio/runtime/scheduler.hpp>
#include <elio/io/io_context.hpp>
#include <elio/time/timer.hpp>
#include <atomic>

namespace c19 {

// Periodically removes expired entries (tombstones included) from a store
class ExpirySweeper {
public:
    ExpirySweeper(IStore& store, std::chrono::milliseconds interval,
                  elio::io::io_context& io_ctx, ClockFn clock = now_ms);

    // Fails with InvalidArgument for a non-positive interval
    Status start(elio::runtime::scheduler& sched);
    // Returns once the sweep loop has exited
    elio::coro::task<void> stop();
    bool is_running() const { return running_; }
    size_t active_loops() const { return loops_.load(); }

    size_t sweep_once();

private:
    IStore& store_;
    std::chrono::milliseconds interval_;
    elio::io::io_context& io_ctx_;
    ClockFn clock_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> loops_{0};

    elio::coro::task<void> sweep_loop();
};

}  // namespace c19
