#include "c19/c19.hpp"
#include <elio/runtime/scheduler.hpp>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>     Configuration file path\n"
              << "  -p, --port <port>       Gossip port (default: 4097)\n"
              << "  -P, --peer <addr>       Peer address (host[:port]), repeatable\n"
              << "  -l, --log-level <level> debug, info, warning, error or off\n"
              << "  -h, --help              Show this help\n"
              << "  -v, --version           Show version\n";
}

void print_version() {
    std::cout << "c19 version " << c19::Version::string() << "\n"
              << "Gossip-replicated key/value state\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::optional<int> port;
    std::vector<std::string> peers;
    std::string log_level;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        }

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
            if (*port <= 0 || *port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        }
        else if ((arg == "-P" || arg == "--peer") && i + 1 < argc) {
            peers.push_back(argv[++i]);
        }
        else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load config file first so command line flags override it
    c19::Config config;
    if (!config_file.empty()) {
        try {
            config = c19::Config::load(config_file);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    if (port) {
        config.connection.port = static_cast<uint16_t>(*port);
    }
    for (auto& peer : peers) {
        config.connection.peers.push_back(std::move(peer));
    }
    if (!log_level.empty()) {
        config.log.level = log_level;
    }

    // Validate config
    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid configuration: " << status.message() << "\n";
        return 1;
    }

    auto& log = c19::Logger::instance();
    log.set_level(c19::parse_log_level(config.log.level).value_or(c19::LogLevel::Info));

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Print startup info
    log.info(std::string("Starting c19 ") + c19::Version::string() +
             (config.node_name.empty() ? "" : " as " + config.node_name));
    log.info("  Gossip: " + config.connection.bind_address + ":" +
             std::to_string(config.connection.port));
    log.info("  Push every " + std::to_string(config.connection.push_interval.count()) +
             " ms, pull every " + std::to_string(config.connection.pull_interval.count()) +
             " ms, fanout " + std::to_string(config.connection.r0));
    if (!config.connection.peers.empty()) {
        std::string list;
        for (const auto& peer : config.connection.peers) {
            list += " " + peer;
        }
        log.info("  Peers:" + list);
    }

    // Create and start the node using Elio's scheduler
    try {
        size_t num_threads = config.worker_threads;
        if (num_threads == 0) {
            num_threads = std::thread::hardware_concurrency();
            if (num_threads == 0) num_threads = 4;
        }

        elio::runtime::scheduler sched(num_threads);
        c19::Node node(config);

        sched.set_io_context(&node.io_context());
        sched.start();

        std::atomic<bool> started{false};
        auto startup_task = [&node, &sched, &started, &log]() -> elio::coro::task<void> {
            auto status = co_await node.start(sched);
            if (!status) {
                log.error("Failed to start node: " + status.to_string());
                g_running = false;
            } else {
                started = true;
                log.info("c19 node started, press Ctrl+C to stop");
            }
        };

        auto task = startup_task();
        sched.spawn(task.release());

        // Main loop - wait for a signal or a failed startup
        while (g_running && sched.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        log.info("Shutting down...");

        std::atomic<bool> stopped{false};
        auto shutdown_task = [&node, &stopped]() -> elio::coro::task<void> {
            co_await node.stop();
            stopped = true;
        };

        if (started && sched.is_running()) {
            auto stop_task = shutdown_task();
            sched.spawn(stop_task.release());

            // The engine and the transport each wait at most one timeout
            auto deadline = std::chrono::steady_clock::now() +
                            2 * config.connection.timeout + std::chrono::milliseconds(500);
            while (!stopped && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }

        sched.shutdown();

        node.metrics().collect();
        log.info("Final metrics:\n" + node.metrics().export_prometheus());
        log.info("c19 node stopped");

    } catch (const std::exception& e) {
        log.error(std::string("Fatal error: ") + e.what());
        return 1;
    }

    return 0;
}
