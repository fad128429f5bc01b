#pragma once

#include "store.hpp"

namespace c19 {

// Builds digests of a store and answers them
class DigestBuilder {
public:
    explicit DigestBuilder(const IStore& store) : store_(store) {}

    Digest build() const { return store_.digest(); }
    VersionedDigest build_versioned() const { return store_.versioned_digest(); }

    // Local entries the digest owner lacks or holds at an older or equal
    // timestamp. Entries strictly older than the digest's are never included.
    // Missing and newer entries come first, equal timestamps last.
    EntryList entries_for(const Digest& remote) const;

    // Keys the digest owner holds newer than ours, or that we lack
    std::vector<Key> wanted_by(const Digest& remote) const;

private:
    const IStore& store_;
};

}  // namespace c19
