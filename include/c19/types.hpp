#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>
#include <optional>
#include <functional>

namespace c19 {

// Constants
constexpr size_t MAX_KEY_SIZE = 8 * 1024;                  // 8KB
constexpr size_t MAX_MESSAGE_SIZE = 64 * 1024 * 1024;      // 64MB per frame
constexpr size_t MIN_MESSAGE_SIZE = 64 * 1024;             // Room for a max-size key

// Time types
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using SystemClock = std::chrono::system_clock;

// Wall-clock milliseconds since the Unix epoch
using Timestamp = uint64_t;

// Source of wall-clock time; replaceable in tests
using ClockFn = std::function<Timestamp()>;

Timestamp now_ms();

// Buffer types
using ByteBuffer = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

ByteBuffer to_bytes(std::string_view str);
std::string_view as_string(ByteView data);

// Replicated key with a pre-computed hash
class Key {
public:
    Key() = default;
    explicit Key(std::string_view key);

    std::string_view view() const noexcept { return data_; }
    const std::string& str() const noexcept { return data_; }
    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    uint64_t hash() const noexcept { return hash_; }

    bool operator==(const Key& other) const noexcept {
        return hash_ == other.hash_ && data_ == other.data_;
    }

    bool operator<(const Key& other) const noexcept {
        return data_ < other.data_;
    }

private:
    std::string data_;
    uint64_t hash_ = 0;
};

// A versioned value. Entries are never modified in place: a newer entry
// replaces the old one as a whole.
struct Entry {
    ByteBuffer value;
    Timestamp created_at = 0;
    std::optional<uint64_t> ttl;   // milliseconds, absent = never expires
    bool tombstone = false;        // replicated delete marker

    // An entry is expired once its age reaches the ttl.
    bool is_expired(Timestamp now) const noexcept {
        if (!ttl) return false;
        if (now < created_at) return false;
        return now - created_at >= *ttl;
    }

    std::string_view value_view() const noexcept { return as_string(value); }

    static Entry make(std::string_view value, Timestamp created_at,
                      std::optional<uint64_t> ttl = std::nullopt);
    static Entry make_tombstone(Timestamp created_at,
                                std::optional<uint64_t> ttl = std::nullopt);

    bool operator==(const Entry& other) const = default;
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    KeyTooLarge,
    NotFound,
    InvalidArgument,
    NetworkError,
    PeerUnreachable,
    Timeout,
    MalformedMessage,
    InternalError
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    explicit operator bool() const noexcept { return ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

}  // namespace c19

namespace std {

template<>
struct hash<c19::Key> {
    size_t operator()(const c19::Key& k) const noexcept {
        return k.hash();
    }
};

}  // namespace std
