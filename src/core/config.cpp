#include "c19/config.hpp"
#include "c19/logger.hpp"
#include "c19/simple_json.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace c19 {

namespace {

std::chrono::milliseconds get_ms(const SimpleJson& j, const std::string& key,
                                 std::chrono::milliseconds def) {
    return std::chrono::milliseconds(j.get_int(key, def.count()));
}

uint16_t get_port(const SimpleJson& j, const std::string& key, uint16_t def) {
    auto value = j.get_int(key, def);
    if (value < 0 || value > 65535) {
        throw std::runtime_error("Port out of range for \"" + key + "\"");
    }
    return static_cast<uint16_t>(value);
}

const char* bool_str(bool v) {
    return v ? "true" : "false";
}

}  // namespace

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

Config Config::load_json(const std::string& json) {
    Config config;
    SimpleJson j(json);

    config.node_name = j.get_string("node_name", "");
    auto threads = j.get_int("worker_threads", 0);
    if (threads < 0) {
        throw std::runtime_error("worker_threads must not be negative");
    }
    config.worker_threads = static_cast<size_t>(threads);

    // State config
    auto state = j.get_object("state");
    if (auto ttl = state.get_optional_int("ttl")) {
        config.state.ttl = std::chrono::milliseconds(*ttl);
    }
    config.state.purge_interval = get_ms(state, "purge_interval", config.state.purge_interval);
    config.state.replicate_deletes = state.get_bool("replicate_deletes", config.state.replicate_deletes);
    config.state.tombstone_ttl = get_ms(state, "tombstone_ttl", config.state.tombstone_ttl);
    auto shards = state.get_int("shards", static_cast<int64_t>(config.state.shards));
    if (shards <= 0) {
        throw std::runtime_error("state.shards must be positive");
    }
    config.state.shards = static_cast<size_t>(shards);
    config.state.seed_file = state.get_string("seed_file", "");

    // Connection config
    auto conn = j.get_object("connection");
    config.connection.bind_address = conn.get_string("bind_address", config.connection.bind_address);
    config.connection.port = get_port(conn, "port", config.connection.port);
    if (conn.has("target_port") && !conn.is_null("target_port")) {
        config.connection.target_port = get_port(conn, "target_port", 0);
    }
    config.connection.push_interval = get_ms(conn, "push_interval", config.connection.push_interval);
    config.connection.pull_interval = get_ms(conn, "pull_interval", config.connection.pull_interval);
    config.connection.r0 = static_cast<int>(conn.get_int("r0", config.connection.r0));
    config.connection.timeout = get_ms(conn, "timeout", config.connection.timeout);
    config.connection.force_publish = conn.get_bool("force_publish", config.connection.force_publish);
    auto max_message = conn.get_int("max_message_size",
                                    static_cast<int64_t>(config.connection.max_message_size));
    if (max_message < 0) {
        throw std::runtime_error("max_message_size must not be negative");
    }
    config.connection.max_message_size = static_cast<size_t>(max_message);
    config.connection.peers = conn.get_string_array("peers");

    // Log config
    auto log = j.get_object("log");
    config.log.level = log.get_string("level", config.log.level);

    return config;
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string Config::to_json() const {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"node_name\": " << SimpleJson::quote(node_name) << ",\n";
    oss << "  \"worker_threads\": " << worker_threads << ",\n";

    // State
    oss << "  \"state\": {\n";
    oss << "    \"ttl\": ";
    if (state.ttl) {
        oss << state.ttl->count();
    } else {
        oss << "null";
    }
    oss << ",\n";
    oss << "    \"purge_interval\": " << state.purge_interval.count() << ",\n";
    oss << "    \"replicate_deletes\": " << bool_str(state.replicate_deletes) << ",\n";
    oss << "    \"tombstone_ttl\": " << state.tombstone_ttl.count() << ",\n";
    oss << "    \"shards\": " << state.shards << ",\n";
    oss << "    \"seed_file\": " << SimpleJson::quote(state.seed_file) << "\n";
    oss << "  },\n";

    // Connection
    oss << "  \"connection\": {\n";
    oss << "    \"bind_address\": " << SimpleJson::quote(connection.bind_address) << ",\n";
    oss << "    \"port\": " << connection.port << ",\n";
    oss << "    \"target_port\": ";
    if (connection.target_port) {
        oss << *connection.target_port;
    } else {
        oss << "null";
    }
    oss << ",\n";
    oss << "    \"push_interval\": " << connection.push_interval.count() << ",\n";
    oss << "    \"pull_interval\": " << connection.pull_interval.count() << ",\n";
    oss << "    \"r0\": " << connection.r0 << ",\n";
    oss << "    \"timeout\": " << connection.timeout.count() << ",\n";
    oss << "    \"force_publish\": " << bool_str(connection.force_publish) << ",\n";
    oss << "    \"max_message_size\": " << connection.max_message_size << ",\n";
    oss << "    \"peers\": [";
    for (size_t i = 0; i < connection.peers.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << SimpleJson::quote(connection.peers[i]);
    }
    oss << "]\n";
    oss << "  },\n";

    // Log
    oss << "  \"log\": {\n";
    oss << "    \"level\": " << SimpleJson::quote(log.level) << "\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

Status ConnectionConfig::validate() const {
    if (push_interval.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "push_interval must be positive");
    }

    if (pull_interval.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "pull_interval must be positive");
    }

    if (timeout.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "timeout must be positive");
    }

    if (r0 < 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "r0 must not be negative");
    }

    if (max_message_size < MIN_MESSAGE_SIZE || max_message_size > MAX_MESSAGE_SIZE) {
        return Status::error(ErrorCode::InvalidArgument,
                            "max_message_size must be between " +
                            std::to_string(MIN_MESSAGE_SIZE) + " and " +
                            std::to_string(MAX_MESSAGE_SIZE));
    }

    return Status::make_ok();
}

Status Config::validate() const {
    auto status = connection.validate();
    if (!status) {
        return status;
    }

    if (state.purge_interval.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "purge_interval must be positive");
    }

    if (state.ttl && state.ttl->count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "ttl must be positive when set");
    }

    if (state.replicate_deletes && state.tombstone_ttl.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "tombstone_ttl must be positive");
    }

    if (state.shards == 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "shards must be at least 1");
    }

    if (!parse_log_level(log.level)) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Unknown log level: " + log.level);
    }

    return Status::make_ok();
}

}  // namespace c19
