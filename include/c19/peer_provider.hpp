#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace c19 {

// host[:port] gossip endpoint
struct PeerAddress {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const;

    // Accepts "host" or "host:port"; a missing port becomes default_port
    static std::optional<PeerAddress> parse(std::string_view addr, uint16_t default_port);
};

// Source of the current peer set
class IPeerProvider {
public:
    virtual ~IPeerProvider() = default;

    virtual Status init() = 0;
    virtual std::vector<std::string> current_peers() = 0;
};

// Fixed peer list from configuration
class StaticPeerProvider : public IPeerProvider {
public:
    explicit StaticPeerProvider(std::vector<std::string> peers);

    Status init() override;
    std::vector<std::string> current_peers() override { return peers_; }

private:
    std::vector<std::string> peers_;
};

}  // namespace c19
