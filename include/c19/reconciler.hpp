#pragma once

#include "store.hpp"

namespace c19 {

// Total order over entries: created_at, then tombstone over value, then
// value bytes, then ttl (absent sorts first). Returns <0, 0 or >0.
int compare_entries(const Entry& a, const Entry& b) noexcept;

// True if `incoming` must replace `current`. The greater entry under
// compare_entries() wins, so merges commute and repeat safely.
inline bool supersedes(const Entry& incoming, const Entry& current) noexcept {
    return compare_entries(incoming, current) > 0;
}

struct MergeStats {
    size_t applied = 0;   // replaced or introduced a value
    size_t stale = 0;     // lost to the local entry
    size_t expired = 0;   // already expired on arrival

    MergeStats& operator+=(const MergeStats& other) {
        applied += other.applied;
        stale += other.stale;
        expired += other.expired;
        return *this;
    }
};

// Applies remote entries to a store under last-write-wins
class Reconciler {
public:
    explicit Reconciler(IStore& store, ClockFn clock = now_ms);

    // Merges a single entry; expired entries are refused
    bool merge(const Key& key, Entry entry, MergeStats& stats);

    MergeStats apply(const EntryList& entries);

    IStore& store() { return store_; }

private:
    IStore& store_;
    ClockFn clock_;
};

}  // namespace c19
