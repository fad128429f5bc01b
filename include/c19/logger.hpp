#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace c19 {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

const char* log_level_name(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view name);

// Process-wide logger writing level-tagged lines to stderr
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    bool enabled(LogLevel level) const { return level >= this->level(); }

    // Redirect output, e.g. to a string stream in tests. nullptr restores stderr.
    void set_output(std::ostream* out);

    void log(LogLevel level, std::string_view msg);

    void debug(std::string_view msg) { log(LogLevel::Debug, msg); }
    void info(std::string_view msg) { log(LogLevel::Info, msg); }
    void warning(std::string_view msg) { log(LogLevel::Warning, msg); }
    void error(std::string_view msg) { log(LogLevel::Error, msg); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace c19
