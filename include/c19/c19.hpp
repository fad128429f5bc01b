#pragma once

// Main c19 header - includes everything needed

#include "types.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "simple_json.hpp"
#include "store.hpp"
#include "reconciler.hpp"
#include "digest.hpp"
#include "data_seeder.hpp"
#include "peer_selector.hpp"
#include "peer_provider.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include "gossip_engine.hpp"
#include "expiry_sweeper.hpp"
#include "metrics.hpp"
#include "node.hpp"

namespace c19 {

// Version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace c19
