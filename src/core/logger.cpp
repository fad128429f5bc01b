#include "c19/logger.hpp"
#include "c19/types.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace c19 {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
        default: return "?";
    }
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return std::nullopt;
}

Logger::Logger() : out_(&std::cerr) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard lock(mutex_);
    out_ = out ? out : &std::cerr;
}

void Logger::log(LogLevel level, std::string_view msg) {
    if (level == LogLevel::Off || !enabled(level)) {
        return;
    }

    auto now = SystemClock::now();
    auto secs = SystemClock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::lock_guard lock(mutex_);
    *out_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
          << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
          << " [" << log_level_name(level) << "] [c19] " << msg << '\n';
    out_->flush();
}

}  // namespace c19
