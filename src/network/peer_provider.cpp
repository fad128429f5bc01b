#include "c19/peer_provider.hpp"
#include <charconv>

namespace c19 {

std::string PeerAddress::to_string() const {
    return host + ":" + std::to_string(port);
}

std::optional<PeerAddress> PeerAddress::parse(std::string_view addr, uint16_t default_port) {
    if (addr.empty()) {
        return std::nullopt;
    }

    PeerAddress result;
    auto colon = addr.rfind(':');
    if (colon == std::string_view::npos) {
        result.host = std::string(addr);
        result.port = default_port;
        return result;
    }

    auto host = addr.substr(0, colon);
    auto port_str = addr.substr(colon + 1);
    if (host.empty() || port_str.empty()) {
        return std::nullopt;
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc() || ptr != port_str.data() + port_str.size() ||
        port == 0 || port > 65535) {
        return std::nullopt;
    }

    result.host = std::string(host);
    result.port = static_cast<uint16_t>(port);
    return result;
}

StaticPeerProvider::StaticPeerProvider(std::vector<std::string> peers)
    : peers_(std::move(peers))
{}

Status StaticPeerProvider::init() {
    for (const auto& peer : peers_) {
        // Port validity is all that matters here; 1 stands in for the default
        if (!PeerAddress::parse(peer, 1)) {
            return Status::error(ErrorCode::InvalidArgument,
                                "Invalid peer address: " + peer);
        }
    }
    return Status::make_ok();
}

}  // namespace c19
