#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace c19 {

// Replicated state configuration
struct StateConfig {
    // Default ttl applied to local writes that do not specify one
    std::optional<std::chrono::milliseconds> ttl;
    std::chrono::milliseconds purge_interval{60000};

    // Deletes replicate as tombstones; otherwise they only remove locally
    bool replicate_deletes = true;
    std::chrono::milliseconds tombstone_ttl{3600000};  // 1h

    size_t shards = 16;
    std::string seed_file;  // Optional JSON file loaded at startup
};

// Gossip connection configuration
struct ConnectionConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 4097;
    std::optional<uint16_t> target_port;  // Port for peers listed without one

    std::chrono::milliseconds push_interval{1000};
    std::chrono::milliseconds pull_interval{60000};
    int r0 = 3;  // Fanout per round
    std::chrono::milliseconds timeout{1000};  // Per-peer exchange deadline
    bool force_publish = false;  // Push the whole store instead of deltas

    // Encoded size cap for one gossip message; larger batches are split
    // across cycles
    size_t max_message_size = MAX_MESSAGE_SIZE;

    std::vector<std::string> peers;

    uint16_t peer_port() const { return target_port.value_or(port); }

    Status validate() const;
};

struct LogConfig {
    std::string level = "info";
};

// Main configuration
struct Config {
    std::string node_name;  // Informational, used in logs
    size_t worker_threads = 0;  // 0 = hardware concurrency

    StateConfig state;
    ConnectionConfig connection;
    LogConfig log;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_json(const std::string& json);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;
};

}  // namespace c19
