#include "c19/peer_selector.hpp"
#include <algorithm>

namespace c19 {

PeerSelector::PeerSelector() : gen_(std::random_device{}()) {}

PeerSelector::PeerSelector(uint64_t seed) : gen_(seed) {}

std::vector<std::string> PeerSelector::select(std::vector<std::string> peers, size_t fanout) {
    std::sort(peers.begin(), peers.end());
    peers.erase(std::unique(peers.begin(), peers.end()), peers.end());

    size_t count = std::min(fanout, peers.size());
    if (count == 0) {
        return {};
    }

    std::lock_guard lock(mutex_);
    // Partial Fisher-Yates: the first `count` slots end up a uniform sample
    for (size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<size_t> dist(i, peers.size() - 1);
        std::swap(peers[i], peers[dist(gen_)]);
    }
    peers.resize(count);
    return peers;
}

}  // namespace c19
