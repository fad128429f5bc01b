#include "c19/timer.hpp"
#include <algorithm>

namespace c19 {

elio::coro::task<bool> sleep_while_running(elio::io::io_context& io_ctx,
                                           std::chrono::milliseconds interval,
                                           const std::atomic<bool>& running) {
    auto deadline = Clock::now() + interval;

    while (running) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) {
            co_return true;
        }
        co_await elio::time::sleep_for(io_ctx, std::min(left, LOOP_SLICE));
    }
    co_return false;
}

}  // namespace c19
