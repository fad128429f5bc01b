#include "c19/protocol.hpp"
#include <stdexcept>

namespace c19::protocol {

namespace {

constexpr uint8_t FLAG_TOMBSTONE = 0x01;
constexpr uint8_t FLAG_HAS_TTL = 0x02;

// Smallest encodings, used to reject counts the payload cannot hold
constexpr size_t MIN_ENTRY_SIZE = 4 + 8 + 1 + 4;
constexpr size_t MIN_DIGEST_ITEM_SIZE = 4 + 8;
constexpr size_t MIN_KEY_SIZE = 4;

uint32_t decode_count(ByteView& data, size_t min_item_size) {
    uint32_t count = Codec::decode_u32(data);
    if (count > data.size() / min_item_size) {
        throw std::runtime_error("Item count exceeds payload");
    }
    return count;
}

void encode_entries(ByteBuffer& buf, const EntryList& entries) {
    Codec::encode_u32(buf, static_cast<uint32_t>(entries.size()));
    for (const auto& [key, entry] : entries) {
        Codec::encode_entry(buf, key, entry);
    }
}

EntryList decode_entries(ByteView& data) {
    uint32_t count = decode_count(data, MIN_ENTRY_SIZE);
    EntryList entries;
    entries.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        entries.push_back(Codec::decode_entry(data));
    }
    return entries;
}

}  // namespace

const char* message_name(const Message& msg) {
    return std::visit([](const auto& m) -> const char* {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PushMessage>) return "Push";
        else if constexpr (std::is_same_v<T, FullPushMessage>) return "FullPush";
        else if constexpr (std::is_same_v<T, PullRequestMessage>) return "PullRequest";
        else if constexpr (std::is_same_v<T, PullResponseMessage>) return "PullResponse";
        else return "Error";
    }, msg);
}

// Encoding helpers
void Codec::encode_header(ByteBuffer& buf, MessageType type,
                          uint32_t payload_len, uint32_t request_id) {
    MessageHeader hdr;
    hdr.type = static_cast<uint16_t>(type);
    hdr.length = payload_len;
    hdr.request_id = request_id;
    hdr.timestamp = now_ms();

    encode_u32(buf, hdr.magic);
    encode_u16(buf, hdr.version);
    encode_u16(buf, hdr.type);
    encode_u32(buf, hdr.length);
    encode_u32(buf, hdr.request_id);
    encode_u64(buf, hdr.timestamp);
}

void Codec::encode_string(ByteBuffer& buf, std::string_view str) {
    encode_u32(buf, static_cast<uint32_t>(str.size()));
    buf.insert(buf.end(), str.begin(), str.end());
}

void Codec::encode_bytes(ByteBuffer& buf, ByteView data) {
    encode_u32(buf, static_cast<uint32_t>(data.size()));
    buf.insert(buf.end(), data.begin(), data.end());
}

void Codec::encode_u8(ByteBuffer& buf, uint8_t v) {
    buf.push_back(v);
}

void Codec::encode_u16(ByteBuffer& buf, uint16_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
}

void Codec::encode_u32(ByteBuffer& buf, uint32_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
    buf.push_back((v >> 16) & 0xFF);
    buf.push_back((v >> 24) & 0xFF);
}

void Codec::encode_u64(ByteBuffer& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back((v >> (i * 8)) & 0xFF);
    }
}

void Codec::encode_entry(ByteBuffer& buf, const Key& key, const Entry& entry) {
    encode_string(buf, key.view());
    encode_u64(buf, entry.created_at);

    uint8_t flags = 0;
    if (entry.tombstone) flags |= FLAG_TOMBSTONE;
    if (entry.ttl) flags |= FLAG_HAS_TTL;
    encode_u8(buf, flags);
    if (entry.ttl) {
        encode_u64(buf, *entry.ttl);
    }

    encode_bytes(buf, entry.value);
}

size_t Codec::entry_size(const Key& key, const Entry& entry) {
    return 4 + key.size() + 8 + 1 + (entry.ttl ? 8 : 0) + 4 + entry.value.size();
}

// Decoding helpers
std::string Codec::decode_string(ByteView& data) {
    uint32_t len = decode_u32(data);
    if (data.size() < len) {
        throw std::runtime_error("Truncated string");
    }
    std::string result(reinterpret_cast<const char*>(data.data()), len);
    data = data.subspan(len);
    return result;
}

ByteBuffer Codec::decode_bytes(ByteView& data) {
    uint32_t len = decode_u32(data);
    if (data.size() < len) {
        throw std::runtime_error("Truncated bytes");
    }
    ByteBuffer result(data.begin(), data.begin() + len);
    data = data.subspan(len);
    return result;
}

uint8_t Codec::decode_u8(ByteView& data) {
    if (data.empty()) throw std::runtime_error("Truncated u8");
    uint8_t v = data[0];
    data = data.subspan(1);
    return v;
}

uint16_t Codec::decode_u16(ByteView& data) {
    if (data.size() < 2) throw std::runtime_error("Truncated u16");
    uint16_t v = data[0] | (static_cast<uint16_t>(data[1]) << 8);
    data = data.subspan(2);
    return v;
}

uint32_t Codec::decode_u32(ByteView& data) {
    if (data.size() < 4) throw std::runtime_error("Truncated u32");
    uint32_t v = data[0] |
                 (static_cast<uint32_t>(data[1]) << 8) |
                 (static_cast<uint32_t>(data[2]) << 16) |
                 (static_cast<uint32_t>(data[3]) << 24);
    data = data.subspan(4);
    return v;
}

uint64_t Codec::decode_u64(ByteView& data) {
    if (data.size() < 8) throw std::runtime_error("Truncated u64");
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    data = data.subspan(8);
    return v;
}

Key Codec::decode_key(ByteView& data) {
    auto key = decode_string(data);
    if (key.empty() || key.size() > MAX_KEY_SIZE) {
        throw std::runtime_error("Invalid key length");
    }
    return Key(key);
}

KeyedEntry Codec::decode_entry(ByteView& data) {
    Key key = decode_key(data);

    Entry entry;
    entry.created_at = decode_u64(data);

    uint8_t flags = decode_u8(data);
    if (flags & ~(FLAG_TOMBSTONE | FLAG_HAS_TTL)) {
        throw std::runtime_error("Unknown entry flags");
    }
    entry.tombstone = (flags & FLAG_TOMBSTONE) != 0;
    if (flags & FLAG_HAS_TTL) {
        entry.ttl = decode_u64(data);
    }

    entry.value = decode_bytes(data);
    return {std::move(key), std::move(entry)};
}

MessageHeader Codec::parse_header(ByteView data) {
    if (data.size() < MessageHeader::SIZE) {
        throw std::runtime_error("Truncated header");
    }

    MessageHeader hdr;
    hdr.magic = decode_u32(data);
    hdr.version = decode_u16(data);
    hdr.type = decode_u16(data);
    hdr.length = decode_u32(data);
    hdr.request_id = decode_u32(data);
    hdr.timestamp = decode_u64(data);

    if (hdr.magic != MAGIC) {
        throw std::runtime_error("Invalid magic number");
    }

    if (hdr.version != VERSION) {
        throw std::runtime_error("Unsupported protocol version " + std::to_string(hdr.version));
    }

    if (hdr.length > MAX_MESSAGE_SIZE) {
        throw std::runtime_error("Message too large");
    }

    return hdr;
}

ByteBuffer Codec::encode(const Message& msg, uint32_t request_id) {
    ByteBuffer payload;
    MessageType type = MessageType::Error;

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, PushMessage>) {
            type = MessageType::Push;
            encode_entries(payload, m.entries);
        }
        else if constexpr (std::is_same_v<T, FullPushMessage>) {
            type = MessageType::FullPush;
            encode_entries(payload, m.entries);
        }
        else if constexpr (std::is_same_v<T, PullRequestMessage>) {
            type = MessageType::PullRequest;
            encode_u64(payload, m.version);
            encode_u32(payload, static_cast<uint32_t>(m.digest.size()));
            for (const auto& [key, ts] : m.digest) {
                encode_string(payload, key.view());
                encode_u64(payload, ts);
            }
        }
        else if constexpr (std::is_same_v<T, PullResponseMessage>) {
            type = MessageType::PullResponse;
            encode_entries(payload, m.entries);
            encode_u32(payload, static_cast<uint32_t>(m.requested.size()));
            for (const auto& key : m.requested) {
                encode_string(payload, key.view());
            }
        }
        else if constexpr (std::is_same_v<T, ErrorMessage>) {
            type = MessageType::Error;
            encode_u32(payload, static_cast<uint32_t>(m.code));
            encode_string(payload, m.message);
            encode_u32(payload, m.original_request_id);
        }
    }, msg);

    if (payload.size() > MAX_MESSAGE_SIZE) {
        throw std::runtime_error("Message too large");
    }

    ByteBuffer result;
    result.reserve(MessageHeader::SIZE + payload.size());
    encode_header(result, type, static_cast<uint32_t>(payload.size()), request_id);
    result.insert(result.end(), payload.begin(), payload.end());

    return result;
}

std::pair<Message, MessageHeader> Codec::decode(ByteView data) {
    auto header = parse_header(data);
    data = data.subspan(MessageHeader::SIZE);

    if (data.size() != header.length) {
        throw std::runtime_error("Payload length mismatch");
    }

    auto type = static_cast<MessageType>(header.type);
    Message msg;

    switch (type) {
        case MessageType::Push: {
            PushMessage m;
            m.entries = decode_entries(data);
            msg = std::move(m);
            break;
        }

        case MessageType::FullPush: {
            FullPushMessage m;
            m.entries = decode_entries(data);
            msg = std::move(m);
            break;
        }

        case MessageType::PullRequest: {
            PullRequestMessage m;
            m.version = decode_u64(data);
            uint32_t count = decode_count(data, MIN_DIGEST_ITEM_SIZE);
            m.digest.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                Key key = decode_key(data);
                Timestamp ts = decode_u64(data);
                m.digest[std::move(key)] = ts;
            }
            msg = std::move(m);
            break;
        }

        case MessageType::PullResponse: {
            PullResponseMessage m;
            m.entries = decode_entries(data);
            uint32_t count = decode_count(data, MIN_KEY_SIZE);
            m.requested.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                m.requested.push_back(decode_key(data));
            }
            msg = std::move(m);
            break;
        }

        case MessageType::Error: {
            ErrorMessage m;
            m.code = static_cast<ErrorCode>(decode_u32(data));
            m.message = decode_string(data);
            m.original_request_id = decode_u32(data);
            msg = std::move(m);
            break;
        }

        default:
            throw std::runtime_error("Unknown message type");
    }

    if (!data.empty()) {
        throw std::runtime_error("Trailing bytes after message");
    }

    return {std::move(msg), header};
}

}  // namespace c19::protocol
