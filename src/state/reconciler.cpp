#include "c19/reconciler.hpp"
#include <algorithm>

namespace c19 {

int compare_entries(const Entry& a, const Entry& b) noexcept {
    if (a.created_at != b.created_at) {
        return a.created_at < b.created_at ? -1 : 1;
    }

    // A delete beats a write carrying the same timestamp
    if (a.tombstone != b.tombstone) {
        return a.tombstone ? 1 : -1;
    }

    if (a.value != b.value) {
        return std::lexicographical_compare(a.value.begin(), a.value.end(),
                                            b.value.begin(), b.value.end()) ? -1 : 1;
    }

    if (a.ttl != b.ttl) {
        return a.ttl < b.ttl ? -1 : 1;
    }
    return 0;
}

Reconciler::Reconciler(IStore& store, ClockFn clock)
    : store_(store)
    , clock_(std::move(clock))
{}

bool Reconciler::merge(const Key& key, Entry entry, MergeStats& stats) {
    if (entry.is_expired(clock_())) {
        ++stats.expired;
        return false;
    }

    if (store_.put(key, std::move(entry))) {
        ++stats.applied;
        return true;
    }

    ++stats.stale;
    return false;
}

MergeStats Reconciler::apply(const EntryList& entries) {
    MergeStats stats;
    for (const auto& [key, entry] : entries) {
        merge(key, entry, stats);
    }
    return stats;
}

}  // namespace c19
