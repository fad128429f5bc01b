#include "c19/expiry_sweeper.hpp"
#include "c19/logger.hpp"
#include "c19/metrics.hpp"

namespace c19 {

ExpirySweeper::ExpirySweeper(IStore& store, std::chrono::milliseconds interval,
                             elio::io::io_context& io_ctx, ClockFn clock)
    : store_(store)
    , interval_(interval)
    , io_ctx_(io_ctx)
    , clock_(std::move(clock))
{}

Status ExpirySweeper::start(elio::runtime::scheduler& sched) {
    if (interval_.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument, "purge_interval must be positive");
    }

    if (running_.exchange(true)) {
        return Status::error(ErrorCode::InternalError, "Expiry sweeper already running");
    }

    loops_.fetch_add(1);
    auto task = sweep_loop();
    sched.spawn(task.release());
    return Status::make_ok();
}

elio::coro::task<void> ExpirySweeper::stop() {
    running_ = false;

    while (loops_.load() > 0) {
        co_await elio::time::sleep_for(io_ctx_, std::chrono::milliseconds(10));
    }
}

size_t ExpirySweeper::sweep_once() {
    auto removed = store_.purge_expired(clock_());
    metrics().entries_purged_total.inc(removed);
    metrics().store_entries.set(static_cast<double>(store_.size()));

    if (removed > 0) {
        Logger::instance().debug("Purged " + std::to_string(removed) + " expired entries");
    }
    return removed;
}

elio::coro::task<void> ExpirySweeper::sweep_loop() {
    CountGuard guard{loops_};

    while (co_await sleep_while_running(io_ctx_, interval_, running_)) {
        sweep_once();
    }
}

}  // namespace c19
