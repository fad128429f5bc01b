#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace c19 {

// Uniform random choice of gossip targets
class PeerSelector {
public:
    PeerSelector();
    explicit PeerSelector(uint64_t seed);

    // Sample without replacement of min(fanout, distinct peers) addresses
    std::vector<std::string> select(std::vector<std::string> peers, size_t fanout);

private:
    std::mutex mutex_;
    std::mt19937_64 gen_;
};

}  // namespace c19
