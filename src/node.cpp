#include "c19/node.hpp"
#include "c19/data_seeder.hpp"
#include "c19/reconciler.hpp"
#include "c19/logger.hpp"

namespace c19 {

Node::Node(const Config& config, std::unique_ptr<ITransport> transport,
           std::unique_ptr<IPeerProvider> peers, ClockFn clock)
    : config_(config)
    , clock_(std::move(clock))
    , io_ctx_()
    , peers_(std::move(peers))
    , transport_(std::move(transport))
{
    store_ = std::make_unique<EntryStore>(config_.state.shards, clock_);

    if (!peers_) {
        peers_ = std::make_unique<StaticPeerProvider>(config_.connection.peers);
    }
    if (!transport_) {
        transport_ = std::make_unique<TcpTransport>(config_.connection, io_ctx_);
    }

    engine_ = std::make_unique<GossipEngine>(*store_, *transport_, *peers_,
                                             config_.connection, io_ctx_, clock_);
    sweeper_ = std::make_unique<ExpirySweeper>(*store_, config_.state.purge_interval,
                                               io_ctx_, clock_);

    metrics_collector_ = std::make_unique<MetricsCollector>();
    metrics_collector_->set_store(store_.get());
}

Node::~Node() = default;

elio::coro::task<Status> Node::start(elio::runtime::scheduler& sched) {
    auto status = config_.validate();
    if (!status) {
        co_return status;
    }

    status = peers_->init();
    if (!status) {
        co_return status;
    }

    seed();

    status = co_await transport_->start(sched, [this](const protocol::Message& msg) {
        return engine_->handle_message(msg);
    });
    if (!status) {
        co_return status;
    }

    status = engine_->start(sched);
    if (!status) {
        co_await transport_->stop();
        co_return status;
    }

    status = sweeper_->start(sched);
    if (!status) {
        co_await engine_->stop();
        co_await transport_->stop();
        co_return status;
    }

    running_ = true;
    co_return Status::make_ok();
}

elio::coro::task<void> Node::stop() {
    if (!running_.exchange(false)) {
        co_return;
    }

    co_await sweeper_->stop();
    co_await engine_->stop();
    co_await transport_->stop();
    metrics_collector_->collect();
}

void Node::seed() {
    if (config_.state.seed_file.empty()) {
        return;
    }

    std::optional<uint64_t> default_ttl;
    if (config_.state.ttl) {
        default_ttl = static_cast<uint64_t>(config_.state.ttl->count());
    }

    Reconciler reconciler(*store_, clock_);
    DataSeeder seeder(reconciler, default_ttl, clock_);
    try {
        auto stats = seeder.load_file(config_.state.seed_file);
        Logger::instance().info("Seeded " + std::to_string(stats.applied) + " entries from " +
                                config_.state.seed_file);
    } catch (const std::exception& e) {
        Logger::instance().warning(std::string("Ignoring seed file: ") + e.what());
    }
}

Status Node::check_key(std::string_view key) const {
    if (key.empty()) {
        return Status::error(ErrorCode::InvalidArgument, "Empty key");
    }
    if (key.size() > MAX_KEY_SIZE) {
        return Status::error(ErrorCode::KeyTooLarge,
                            "Key exceeds " + std::to_string(MAX_KEY_SIZE) + " bytes");
    }
    return Status::make_ok();
}

std::optional<Entry> Node::get(std::string_view key) const {
    if (!check_key(key)) {
        return std::nullopt;
    }
    return store_->get(Key(key));
}

Status Node::put(std::string_view key, std::string_view value,
                 std::optional<std::chrono::milliseconds> ttl) {
    auto status = check_key(key);
    if (!status) {
        return status;
    }

    if (!ttl) {
        ttl = config_.state.ttl;
    }
    if (ttl && ttl->count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument, "ttl must be positive");
    }

    std::optional<uint64_t> ttl_ms;
    if (ttl) {
        ttl_ms = static_cast<uint64_t>(ttl->count());
    }

    c19::metrics().local_puts_total.inc();
    if (!write_local(Key(key), Entry::make(value, clock_(), ttl_ms))) {
        // The stored entry carries a later timestamp than our clock
        Logger::instance().debug("Local write to '" + std::string(key) +
                                 "' lost to a newer entry");
    }
    return Status::make_ok();
}

Status Node::remove(std::string_view key) {
    auto status = check_key(key);
    if (!status) {
        return status;
    }

    Key k(key);
    bool existed = store_->get(k).has_value();
    c19::metrics().local_deletes_total.inc();

    if (config_.state.replicate_deletes) {
        auto ttl = static_cast<uint64_t>(config_.state.tombstone_ttl.count());
        write_local(k, Entry::make_tombstone(clock_(), ttl));
    } else {
        store_->erase(k);
    }

    if (!existed) {
        return Status::error(ErrorCode::NotFound, "Key not found: " + std::string(key));
    }
    return Status::make_ok();
}

bool Node::write_local(const Key& key, Entry entry) {
    auto now = entry.created_at;

    for (int attempt = 0; attempt < 4; ++attempt) {
        auto stored = store_->lookup(key);

        // Same millisecond as the stored entry, or a stamp we handed out
        // ourselves in an earlier write
        entry.created_at = now;
        if (stored && (stored->created_at == now ||
                       (stored->created_at > now && stored->created_at <= last_stamp_.load()))) {
            entry.created_at = stored->created_at + 1;
        }

        auto last = last_stamp_.load();
        while (last < entry.created_at &&
               !last_stamp_.compare_exchange_weak(last, entry.created_at)) {
        }

        if (store_->put(key, entry)) {
            return true;
        }

        // Retry only if another write slipped in since the lookup
        auto current = store_->lookup(key);
        bool changed = current.has_value() != stored.has_value() ||
                       (current && compare_entries(*current, *stored) != 0);
        if (!changed) {
            return false;
        }
    }
    return false;
}

}  // namespace c19
