#include "c19/store.hpp"
#include "c19/reconciler.hpp"
#include <xxhash.h>
#include <algorithm>

namespace c19 {

namespace {

void append_u64(ByteBuffer& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back((v >> (i * 8)) & 0xFF);
    }
}

}  // namespace

uint64_t entry_fingerprint(const Key& key, const Entry& entry) {
    ByteBuffer buf;
    buf.reserve(key.size() + entry.value.size() + 34);

    append_u64(buf, key.size());
    buf.insert(buf.end(), key.view().begin(), key.view().end());
    append_u64(buf, entry.created_at);
    buf.push_back(entry.tombstone ? 1 : 0);
    buf.push_back(entry.ttl ? 1 : 0);
    append_u64(buf, entry.ttl.value_or(0));
    buf.insert(buf.end(), entry.value.begin(), entry.value.end());

    return XXH3_64bits(buf.data(), buf.size());
}

EntryStore::EntryStore(size_t shard_count, ClockFn clock)
    : clock_(std::move(clock))
{
    if (shard_count == 0) shard_count = 1;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

EntryStore::~EntryStore() = default;

EntryStore::Shard& EntryStore::shard_for(const Key& key) const {
    return *shards_[key.hash() % shards_.size()];
}

EntryStore::SharedLocks EntryStore::lock_all_shared() const {
    SharedLocks locks;
    locks.reserve(shards_.size());
    for (const auto& shard : shards_) {
        locks.emplace_back(shard->mutex);
    }
    return locks;
}

std::optional<Entry> EntryStore::get(const Key& key) const {
    auto& shard = shard_for(key);
    std::shared_lock lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }

    const auto& entry = it->second.entry;
    if (entry.tombstone || entry.is_expired(clock_())) {
        return std::nullopt;
    }
    return entry;
}

std::optional<Entry> EntryStore::lookup(const Key& key) const {
    auto& shard = shard_for(key);
    std::shared_lock lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

bool EntryStore::put(const Key& key, Entry entry) {
    auto& shard = shard_for(key);
    std::unique_lock lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it != shard.entries.end() && !supersedes(entry, it->second.entry)) {
        return false;
    }

    Record record;
    record.fingerprint = entry_fingerprint(key, entry);
    record.revision = revision_.fetch_add(1, std::memory_order_acq_rel) + 1;
    record.entry = std::move(entry);

    if (it == shard.entries.end()) {
        shard.version ^= record.fingerprint;
        shard.entries.emplace(key, std::move(record));
    } else {
        shard.version ^= it->second.fingerprint ^ record.fingerprint;
        it->second = std::move(record);
    }
    return true;
}

bool EntryStore::erase(const Key& key) {
    auto& shard = shard_for(key);
    std::unique_lock lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return false;
    }

    shard.version ^= it->second.fingerprint;
    shard.entries.erase(it);
    return true;
}

EntryList EntryStore::snapshot() const {
    auto now = clock_();
    auto locks = lock_all_shared();

    EntryList result;
    for (const auto& shard : shards_) {
        for (const auto& [key, record] : shard->entries) {
            if (!record.entry.is_expired(now)) {
                result.emplace_back(key, record.entry);
            }
        }
    }
    return result;
}

Digest EntryStore::digest() const {
    return versioned_digest().digest;
}

VersionedDigest EntryStore::versioned_digest() const {
    auto now = clock_();
    auto locks = lock_all_shared();

    VersionedDigest result;
    for (const auto& shard : shards_) {
        result.version ^= shard->version;
        for (const auto& [key, record] : shard->entries) {
            if (!record.entry.is_expired(now)) {
                result.digest.emplace(key, record.entry.created_at);
            }
        }
    }
    return result;
}

ChangeSet EntryStore::changes_since(uint64_t revision) const {
    auto now = clock_();
    auto locks = lock_all_shared();

    // No put can be half-way through while every shard is held
    ChangeSet changes;
    changes.revision = revision_.load(std::memory_order_acquire);

    std::vector<std::pair<uint64_t, KeyedEntry>> collected;
    for (const auto& shard : shards_) {
        for (const auto& [key, record] : shard->entries) {
            if (record.revision > revision && !record.entry.is_expired(now)) {
                collected.emplace_back(record.revision, KeyedEntry{key, record.entry});
            }
        }
    }
    std::sort(collected.begin(), collected.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    changes.entries.reserve(collected.size());
    changes.revisions.reserve(collected.size());
    for (auto& [rev, item] : collected) {
        changes.revisions.push_back(rev);
        changes.entries.push_back(std::move(item));
    }
    return changes;
}

size_t EntryStore::purge_expired(Timestamp now) {
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::unique_lock lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end(); ) {
            if (it->second.entry.is_expired(now)) {
                shard->version ^= it->second.fingerprint;
                it = shard->entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

uint64_t EntryStore::version() const {
    auto locks = lock_all_shared();

    uint64_t v = 0;
    for (const auto& shard : shards_) {
        v ^= shard->version;
    }
    return v;
}

size_t EntryStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

}  // namespace c19
