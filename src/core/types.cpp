#include "c19/types.hpp"
#include <xxhash.h>

namespace c19 {

Timestamp now_ms() {
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            SystemClock::now().time_since_epoch()).count());
}

ByteBuffer to_bytes(std::string_view str) {
    return ByteBuffer(str.begin(), str.end());
}

std::string_view as_string(ByteView data) {
    return std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
}

// Key implementation
Key::Key(std::string_view key) : data_(key) {
    hash_ = data_.empty() ? 0 : XXH3_64bits(data_.data(), data_.size());
}

// Entry helpers
Entry Entry::make(std::string_view value, Timestamp created_at,
                  std::optional<uint64_t> ttl) {
    Entry e;
    e.value = to_bytes(value);
    e.created_at = created_at;
    e.ttl = ttl;
    return e;
}

Entry Entry::make_tombstone(Timestamp created_at, std::optional<uint64_t> ttl) {
    Entry e;
    e.created_at = created_at;
    e.ttl = ttl;
    e.tombstone = true;
    return e;
}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::KeyTooLarge: return "Key too large";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::PeerUnreachable: return "Peer unreachable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::MalformedMessage: return "Malformed message";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

std::string Status::to_string() const {
    if (message_.empty()) {
        return error_code_string(code_);
    }
    return std::string(error_code_string(code_)) + ": " + message_;
}

}  // namespace c19
