#include "c19/gossip_engine.hpp"
#include "c19/logger.hpp"
#include "c19/metrics.hpp"
#include <algorithm>
#include <unordered_set>

namespace c19 {

namespace {

// Balances the in-flight count taken when an exchange was spawned
struct InFlightGuard {
    std::atomic<size_t>& count;

    ~InFlightGuard() {
        count.fetch_sub(1);
        metrics().exchanges_in_flight.dec();
    }
};

// Keeps the leading entries whose encodings fit in `budget` bytes, dropping
// any single entry too large for a message. Returns how many input entries
// were consumed, kept or dropped.
size_t fit_entries(EntryList& entries, size_t budget) {
    EntryList kept;
    size_t used = 0;
    size_t consumed = 0;

    for (auto& item : entries) {
        auto size = protocol::Codec::entry_size(item.first, item.second);
        if (size > budget) {
            Logger::instance().warning("Entry '" + item.first.str() + "' (" +
                                       std::to_string(size) + " bytes) exceeds the message size");
            ++consumed;
            continue;
        }
        if (used + size > budget) {
            break;
        }
        used += size;
        ++consumed;
        kept.push_back(std::move(item));
    }

    entries = std::move(kept);
    return consumed;
}

void note_failure(const std::string& what, const std::string& peer, const Status& status) {
    metrics().peer_failures_total.inc();
    if (status.code() == ErrorCode::Timeout) {
        metrics().peer_timeouts_total.inc();
    }
    Logger::instance().warning(what + " " + peer + " failed: " + status.to_string());
}

}  // namespace

GossipEngine::GossipEngine(IStore& store, ITransport& transport, IPeerProvider& peers,
                           const ConnectionConfig& config, elio::io::io_context& io_ctx,
                           ClockFn clock)
    : store_(store)
    , transport_(transport)
    , peers_(peers)
    , config_(config)
    , io_ctx_(io_ctx)
    , clock_(std::move(clock))
    , reconciler_(store, clock_)
    , digests_(store)
{}

GossipEngine::~GossipEngine() = default;

Status GossipEngine::start(elio::runtime::scheduler& sched) {
    auto status = config_.validate();
    if (!status) {
        return status;
    }

    if (running_.exchange(true)) {
        return Status::error(ErrorCode::InternalError, "Gossip engine already running");
    }
    sched_ = &sched;

    loops_.fetch_add(2);

    auto push_task = push_loop();
    sched.spawn(push_task.release());

    auto pull_task = pull_loop();
    sched.spawn(pull_task.release());

    Logger::instance().info("Gossip started: push every " +
                            std::to_string(config_.push_interval.count()) + "ms, pull every " +
                            std::to_string(config_.pull_interval.count()) + "ms, fanout " +
                            std::to_string(config_.r0));
    return Status::make_ok();
}

elio::coro::task<void> GossipEngine::stop() {
    running_ = false;

    // Timer loops notice within one slice
    while (loops_.load() > 0) {
        co_await elio::time::sleep_for(io_ctx_, std::chrono::milliseconds(10));
    }

    // Give running exchanges up to one timeout to finish
    auto deadline = Clock::now() + config_.timeout + LOOP_SLICE;
    while (in_flight_.load() > 0 && Clock::now() < deadline) {
        co_await elio::time::sleep_for(io_ctx_, std::chrono::milliseconds(10));
    }

    if (auto left = in_flight_.load(); left > 0) {
        Logger::instance().warning("Abandoning " + std::to_string(left) + " in-flight exchanges");
    }
}

std::optional<protocol::Message> GossipEngine::handle_message(const protocol::Message& msg) {
    return std::visit([this](const auto& m) -> std::optional<protocol::Message> {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, protocol::PushMessage> ||
                      std::is_same_v<T, protocol::FullPushMessage>) {
            on_push(m.entries);
            return std::nullopt;
        }
        else if constexpr (std::is_same_v<T, protocol::PullRequestMessage>) {
            return protocol::Message{on_pull_request(m)};
        }
        else if constexpr (std::is_same_v<T, protocol::PullResponseMessage>) {
            Logger::instance().debug("Ignoring unsolicited pull response");
            return std::nullopt;
        }
        else {
            Logger::instance().warning("Peer reported error: " + m.message);
            return std::nullopt;
        }
    }, msg);
}

void GossipEngine::on_push(const EntryList& entries) {
    record(reconciler_.apply(entries));
}

protocol::PullResponseMessage GossipEngine::on_pull_request(const protocol::PullRequestMessage& req) {
    protocol::PullResponseMessage resp;

    // Identical versions mean identical contents
    if (req.version == store_.version()) {
        return resp;
    }

    auto budget = payload_budget();

    // Requested keys take at most half the budget, entries the rest
    resp.requested = digests_.wanted_by(req.digest);
    size_t requested_size = 0;
    size_t kept = 0;
    for (const auto& key : resp.requested) {
        if (requested_size + 4 + key.size() > budget / 2) {
            break;
        }
        requested_size += 4 + key.size();
        ++kept;
    }
    resp.requested.resize(kept);

    resp.entries = digests_.entries_for(req.digest);
    auto total = resp.entries.size();
    auto consumed = fit_entries(resp.entries, budget - 4 - requested_size);
    if (consumed < total) {
        Logger::instance().debug("Pull response holds " + std::to_string(resp.entries.size()) +
                                 " of " + std::to_string(total) + " entries, rest next cycle");
    }
    return resp;
}

std::optional<protocol::Message> GossipEngine::next_push() {
    std::lock_guard lock(publish_mutex_);

    if (config_.force_publish) {
        auto revision = store_.revision();
        auto entries = store_.snapshot();
        published_revision_ = revision;
        if (entries.empty()) {
            return std::nullopt;
        }

        // A store larger than one message goes out in turns
        auto start = full_push_cursor_ % entries.size();
        std::rotate(entries.begin(), entries.begin() + start, entries.end());
        auto total = entries.size();
        auto consumed = fit_entries(entries, payload_budget());
        full_push_cursor_ = consumed < total ? start + consumed : 0;
        if (entries.empty()) {
            return std::nullopt;
        }
        return protocol::Message{protocol::FullPushMessage{std::move(entries)}};
    }

    auto changes = store_.changes_since(published_revision_);
    auto total = changes.entries.size();
    auto consumed = fit_entries(changes.entries, payload_budget());

    // Changes are oldest first; stop the watermark at the last one consumed
    published_revision_ = consumed < total ? changes.revisions[consumed - 1] : changes.revision;
    if (changes.entries.empty()) {
        return std::nullopt;
    }
    return protocol::Message{protocol::PushMessage{std::move(changes.entries)}};
}

protocol::PullRequestMessage GossipEngine::make_pull_request() const {
    auto snapshot = digests_.build_versioned();

    protocol::PullRequestMessage req;
    req.version = snapshot.version;
    req.digest = std::move(snapshot.digest);
    return req;
}

size_t GossipEngine::payload_budget() const {
    // Less the entry count that leads every entry list
    return config_.max_message_size - 4;
}

std::optional<protocol::PushMessage> GossipEngine::handle_pull_response(
    const protocol::PullResponseMessage& resp)
{
    auto now = clock_();
    MergeStats stats;
    EntryList backfill;
    std::unordered_set<Key> queued;

    for (const auto& [key, entry] : resp.entries) {
        if (reconciler_.merge(key, entry, stats)) {
            continue;
        }
        // Ours beats theirs: send it back so the responder converges too
        auto local = store_.lookup(key);
        if (local && !local->is_expired(now) && supersedes(*local, entry) &&
            queued.insert(key).second) {
            backfill.emplace_back(key, std::move(*local));
        }
    }

    for (const auto& key : resp.requested) {
        if (queued.count(key)) {
            continue;
        }
        auto local = store_.lookup(key);
        if (local && !local->is_expired(now)) {
            queued.insert(key);
            backfill.emplace_back(key, std::move(*local));
        }
    }

    record(stats);

    // Keys left out are asked for again on a later pull
    fit_entries(backfill, payload_budget());
    if (backfill.empty()) {
        return std::nullopt;
    }
    return protocol::PushMessage{std::move(backfill)};
}

std::vector<std::string> GossipEngine::select_peers() {
    auto fanout = static_cast<size_t>(std::max(config_.r0, 0));
    return selector_.select(peers_.current_peers(), fanout);
}

void GossipEngine::record(const MergeStats& stats) {
    metrics().entries_applied_total.inc(stats.applied);
    metrics().entries_stale_total.inc(stats.stale);
    metrics().entries_expired_total.inc(stats.expired);

    if (stats.applied > 0) {
        Logger::instance().debug("Merged " + std::to_string(stats.applied) + " entries (" +
                                 std::to_string(stats.stale) + " stale, " +
                                 std::to_string(stats.expired) + " expired)");
    }
}

void GossipEngine::spawn_exchange(elio::coro::task<void> task) {
    in_flight_.fetch_add(1);
    metrics().exchanges_in_flight.inc();
    sched_->spawn(task.release());
}

void GossipEngine::push_round() {
    auto targets = select_peers();
    if (targets.empty()) {
        return;
    }

    auto msg = next_push();
    if (!msg) {
        metrics().push_rounds_skipped_total.inc();
        return;
    }

    metrics().push_rounds_total.inc();
    Logger::instance().debug(std::string("Push round: ") + protocol::message_name(*msg) +
                             " to " + std::to_string(targets.size()) + " peers");

    for (auto& peer : targets) {
        spawn_exchange(push_to_peer(std::move(peer), *msg));
    }
}

void GossipEngine::pull_round() {
    auto targets = select_peers();
    if (targets.empty()) {
        return;
    }

    metrics().pull_rounds_total.inc();
    protocol::Message req{make_pull_request()};
    Logger::instance().debug("Pull round to " + std::to_string(targets.size()) + " peers");

    for (auto& peer : targets) {
        spawn_exchange(pull_from_peer(std::move(peer), req));
    }
}

elio::coro::task<void> GossipEngine::push_loop() {
    CountGuard guard{loops_};

    while (co_await sleep_while_running(io_ctx_, config_.push_interval, running_)) {
        push_round();
    }
}

elio::coro::task<void> GossipEngine::pull_loop() {
    CountGuard guard{loops_};

    while (co_await sleep_while_running(io_ctx_, config_.pull_interval, running_)) {
        pull_round();
    }
}

elio::coro::task<void> GossipEngine::push_to_peer(std::string peer, protocol::Message msg) {
    InFlightGuard guard{in_flight_};
    LatencyTimer timer(metrics().exchange_latency_ms);

    auto status = co_await transport_.send(peer, std::move(msg), config_.timeout);
    if (!status) {
        note_failure("Push to", peer, status);
    }
}

elio::coro::task<void> GossipEngine::pull_from_peer(std::string peer, protocol::Message req) {
    InFlightGuard guard{in_flight_};
    LatencyTimer timer(metrics().exchange_latency_ms);

    auto result = co_await transport_.request(peer, std::move(req), config_.timeout);
    if (!result.status) {
        note_failure("Pull from", peer, result.status);
        co_return;
    }

    if (!result.response) {
        note_failure("Pull from", peer,
                     Status::error(ErrorCode::MalformedMessage, "empty reply"));
        co_return;
    }

    if (auto* resp = std::get_if<protocol::PullResponseMessage>(&*result.response)) {
        auto backfill = handle_pull_response(*resp);
        if (backfill && running_) {
            auto status = co_await transport_.send(peer, protocol::Message{std::move(*backfill)},
                                                   config_.timeout);
            if (!status) {
                note_failure("Backfill to", peer, status);
            }
        }
    } else if (auto* err = std::get_if<protocol::ErrorMessage>(&*result.response)) {
        note_failure("Pull from", peer, Status::error(err->code, err->message));
    } else {
        metrics().malformed_messages_total.inc();
        note_failure("Pull from", peer,
                     Status::error(ErrorCode::MalformedMessage,
                                   std::string("unexpected ") + protocol::message_name(*result.response)));
    }
}

}  // namespace c19
