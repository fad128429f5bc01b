#pragma once

#include "types.hpp"
#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <elio/time/timer.hpp>
#include <atomic>

namespace c19 {

// Longest a timer loop sleeps before looking at its running flag again
constexpr std::chrono::milliseconds LOOP_SLICE{50};

// Sleeps for `interval` in slices of at most LOOP_SLICE. Returns false as
// soon as `running` is cleared.
elio::coro::task<bool> sleep_while_running(elio::io::io_context& io_ctx,
                                           std::chrono::milliseconds interval,
                                           const std::atomic<bool>& running);

// Balances a counter of live coroutines on scope exit
struct CountGuard {
    std::atomic<size_t>& count;

    ~CountGuard() { count.fetch_sub(1); }
};

}  // namespace c19
