#include "c19/digest.hpp"
#include <iterator>

namespace c19 {

EntryList DigestBuilder::entries_for(const Digest& remote) const {
    EntryList result;
    EntryList ties;
    for (auto& [key, entry] : store_.snapshot()) {
        auto it = remote.find(key);
        if (it == remote.end() || entry.created_at > it->second) {
            result.emplace_back(std::move(key), std::move(entry));
        } else if (entry.created_at == it->second) {
            ties.emplace_back(std::move(key), std::move(entry));
        }
    }

    result.insert(result.end(), std::make_move_iterator(ties.begin()),
                  std::make_move_iterator(ties.end()));
    return result;
}

std::vector<Key> DigestBuilder::wanted_by(const Digest& remote) const {
    auto local = store_.digest();

    std::vector<Key> result;
    for (const auto& [key, remote_ts] : remote) {
        auto it = local.find(key);
        if (it == local.end() || remote_ts > it->second) {
            result.push_back(key);
        }
    }
    return result;
}

}  // namespace c19
