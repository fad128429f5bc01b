#pragma once

#include "types.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <unordered_map>
#include <utility>
#include <vector>

namespace c19 {

using KeyedEntry = std::pair<Key, Entry>;
using EntryList = std::vector<KeyedEntry>;

// Key -> created_at summary of a store
using Digest = std::unordered_map<Key, Timestamp>;

// Entries accepted after a revision, oldest first, plus the revision they
// bring the reader to. revisions[i] is the revision entries[i] was stored at.
struct ChangeSet {
    EntryList entries;
    std::vector<uint64_t> revisions;
    uint64_t revision = 0;
};

// Digest and state version taken from the same cut
struct VersionedDigest {
    Digest digest;
    uint64_t version = 0;
};

// Abstract key/entry store
class IStore {
public:
    virtual ~IStore() = default;

    // Visible value: absent for tombstones and expired entries
    virtual std::optional<Entry> get(const Key& key) const = 0;

    // Stored entry as-is, tombstones included
    virtual std::optional<Entry> lookup(const Key& key) const = 0;

    // Last-write-wins merge; true if the entry was stored
    virtual bool put(const Key& key, Entry entry) = 0;

    // Local hard removal
    virtual bool erase(const Key& key) = 0;

    // Unexpired entries, tombstones included
    virtual EntryList snapshot() const = 0;
    virtual Digest digest() const = 0;
    virtual VersionedDigest versioned_digest() const = 0;
    virtual ChangeSet changes_since(uint64_t revision) const = 0;

    // Removes expired entries and tombstones; returns how many went away
    virtual size_t purge_expired(Timestamp now) = 0;

    // XOR of entry fingerprints; equal contents give equal versions
    virtual uint64_t version() const = 0;

    // Monotonic counter bumped by every accepted put
    virtual uint64_t revision() const = 0;

    virtual size_t size() const = 0;
};

// Fingerprint of a stored entry, order-independent when XOR-combined
uint64_t entry_fingerprint(const Key& key, const Entry& entry);

// Sharded in-memory store. Each shard is a hash map behind its own
// reader/writer lock; merges are compare-and-replace under the shard lock.
class EntryStore : public IStore {
public:
    explicit EntryStore(size_t shard_count = 16, ClockFn clock = now_ms);
    ~EntryStore() override;

    std::optional<Entry> get(const Key& key) const override;
    std::optional<Entry> lookup(const Key& key) const override;
    bool put(const Key& key, Entry entry) override;
    bool erase(const Key& key) override;

    EntryList snapshot() const override;
    Digest digest() const override;
    VersionedDigest versioned_digest() const override;
    ChangeSet changes_since(uint64_t revision) const override;

    size_t purge_expired(Timestamp now) override;

    uint64_t version() const override;
    uint64_t revision() const override { return revision_.load(std::memory_order_acquire); }
    size_t size() const override;

    size_t shard_count() const { return shards_.size(); }

private:
    struct Record {
        Entry entry;
        uint64_t revision = 0;
        uint64_t fingerprint = 0;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Key, Record> entries;
        uint64_t version = 0;
    };

    using SharedLocks = std::vector<std::shared_lock<std::shared_mutex>>;

    std::vector<std::unique_ptr<Shard>> shards_;
    ClockFn clock_;
    std::atomic<uint64_t> revision_{0};

    Shard& shard_for(const Key& key) const;

    // Locks every shard for reading in index order, giving a consistent cut
    SharedLocks lock_all_shared() const;
};

}  // namespace c19
