#pragma once

#include "c19/types.hpp"
#include "c19/store.hpp"
#include <variant>
#include <vector>

namespace c19::protocol {

// Protocol version
constexpr uint16_t VERSION = 1;

constexpr uint32_t MAGIC = 0x43313947;  // "C19G"

// Message types
enum class MessageType : uint16_t {
    // Push gossip
    Push = 0x0010,
    FullPush = 0x0011,

    // Pull gossip
    PullRequest = 0x0020,
    PullResponse = 0x0021,

    // Error
    Error = 0xFFFF,
};

// Message header (fixed size for easy parsing)
struct MessageHeader {
    uint32_t magic = MAGIC;
    uint16_t version = VERSION;
    uint16_t type = 0;
    uint32_t length = 0;  // Payload length (not including header)
    uint32_t request_id = 0;
    uint64_t timestamp = 0;  // Sender wall clock, ms

    static constexpr size_t SIZE = 24;
};

// Entries changed since the sender's previous push
struct PushMessage {
    EntryList entries;
};

// The sender's whole store
struct FullPushMessage {
    EntryList entries;
};

struct PullRequestMessage {
    Digest digest;
    uint64_t version = 0;  // Requester's state version
};

struct PullResponseMessage {
    EntryList entries;             // Entries the requester lacks or may lack
    std::vector<Key> requested;    // Keys the responder wants pushed back
};

// Error message
struct ErrorMessage {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    uint32_t original_request_id = 0;
};

// Unified message type
using Message = std::variant<
    PushMessage,
    FullPushMessage,
    PullRequestMessage,
    PullResponseMessage,
    ErrorMessage
>;

const char* message_name(const Message& msg);

// Codec for serialization/deserialization. Decoding throws
// std::runtime_error on any truncated, oversized or trailing input.
class Codec {
public:
    // Serialize message to buffer
    static ByteBuffer encode(const Message& msg, uint32_t request_id = 0);

    // Deserialize message from buffer
    static std::pair<Message, MessageHeader> decode(ByteView data);

    // Parse header only (for length-prefixed reading)
    static MessageHeader parse_header(ByteView data);

    // Encoding helpers
    static void encode_header(ByteBuffer& buf, MessageType type,
                              uint32_t payload_len, uint32_t request_id);
    static void encode_string(ByteBuffer& buf, std::string_view str);
    static void encode_bytes(ByteBuffer& buf, ByteView data);
    static void encode_u8(ByteBuffer& buf, uint8_t v);
    static void encode_u16(ByteBuffer& buf, uint16_t v);
    static void encode_u32(ByteBuffer& buf, uint32_t v);
    static void encode_u64(ByteBuffer& buf, uint64_t v);
    static void encode_entry(ByteBuffer& buf, const Key& key, const Entry& entry);

    // Bytes encode_entry() appends for this entry
    static size_t entry_size(const Key& key, const Entry& entry);

    // Decoding helpers
    static std::string decode_string(ByteView& data);
    static ByteBuffer decode_bytes(ByteView& data);
    static uint8_t decode_u8(ByteView& data);
    static uint16_t decode_u16(ByteView& data);
    static uint32_t decode_u32(ByteView& data);
    static uint64_t decode_u64(ByteView& data);
    static KeyedEntry decode_entry(ByteView& data);
    static Key decode_key(ByteView& data);
};

}  // namespace c19::protocol
