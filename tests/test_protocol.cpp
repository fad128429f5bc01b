#include <catch2/catch_test_macros.hpp>
#include "c19/protocol.hpp"

using namespace c19;
using namespace c19::protocol;

namespace {

template<typename T>
T roundtrip(const Message& msg, uint32_t request_id = 0) {
    auto buf = Codec::encode(msg, request_id);
    auto [decoded, header] = Codec::decode(buf);
    REQUIRE(header.request_id == request_id);
    REQUIRE(std::holds_alternative<T>(decoded));
    return std::get<T>(decoded);
}

}  // namespace

TEST_CASE("Message header parsing", "[protocol]") {
    SECTION("Valid header") {
        ByteBuffer buf(MessageHeader::SIZE);

        // Magic "C19G" in little-endian = 0x43313947
        buf[0] = 0x47; buf[1] = 0x39; buf[2] = 0x31; buf[3] = 0x43;
        // Version = 1 (little-endian)
        buf[4] = 0x01; buf[5] = 0x00;
        // Type = PullRequest = 0x20 (little-endian)
        buf[6] = 0x20; buf[7] = 0x00;
        // Length = 16 (little-endian)
        buf[8] = 0x10; buf[9] = 0x00; buf[10] = 0x00; buf[11] = 0x00;
        // Request ID = 7 (little-endian)
        buf[12] = 0x07; buf[13] = 0x00; buf[14] = 0x00; buf[15] = 0x00;
        // Timestamp (8 bytes)
        for (int i = 16; i < 24; ++i) buf[i] = 0;

        auto header = Codec::parse_header(buf);

        REQUIRE(header.magic == MAGIC);
        REQUIRE(header.version == VERSION);
        REQUIRE(header.type == static_cast<uint16_t>(MessageType::PullRequest));
        REQUIRE(header.length == 16);
        REQUIRE(header.request_id == 7);
    }

    SECTION("Invalid magic throws") {
        auto buf = Codec::encode(PushMessage{});
        buf[0] = 0xFF;

        REQUIRE_THROWS(Codec::parse_header(buf));
    }

    SECTION("Unsupported version throws") {
        auto buf = Codec::encode(PushMessage{});
        buf[4] = 0x09;

        REQUIRE_THROWS(Codec::parse_header(buf));
    }

    SECTION("Oversized length throws") {
        auto buf = Codec::encode(PushMessage{});
        buf[11] = 0x7F;

        REQUIRE_THROWS(Codec::parse_header(buf));
    }

    SECTION("Truncated header throws") {
        ByteBuffer buf(10, 0);

        REQUIRE_THROWS(Codec::parse_header(buf));
    }
}

TEST_CASE("Push message encoding/decoding", "[protocol]") {
    PushMessage original;
    original.entries.emplace_back(Key("plain"), Entry::make("value", 1700000000000ULL));
    original.entries.emplace_back(Key("with-ttl"), Entry::make("v", 5, 60000));
    original.entries.emplace_back(Key("deleted"), Entry::make_tombstone(9, 3600000));
    original.entries.emplace_back(Key("binary"), Entry{ByteBuffer{0, 1, 0xFF, 0}, 3, std::nullopt, false});

    auto decoded = roundtrip<PushMessage>(original, 42);

    REQUIRE(decoded.entries.size() == original.entries.size());
    for (size_t i = 0; i < original.entries.size(); ++i) {
        REQUIRE(decoded.entries[i].first == original.entries[i].first);
        REQUIRE(decoded.entries[i].second == original.entries[i].second);
    }
}

TEST_CASE("FullPush keeps its type", "[protocol]") {
    FullPushMessage original;
    original.entries.emplace_back(Key("k"), Entry::make("v", 1));

    auto decoded = roundtrip<FullPushMessage>(original);
    REQUIRE(decoded.entries.size() == 1);
    REQUIRE(decoded.entries[0].second.value_view() == "v");
}

TEST_CASE("Pull request encoding/decoding", "[protocol]") {
    PullRequestMessage original;
    original.version = 0xDEADBEEFCAFEULL;
    original.digest[Key("a")] = 10;
    original.digest[Key("b")] = 20;

    auto decoded = roundtrip<PullRequestMessage>(original);

    REQUIRE(decoded.version == original.version);
    REQUIRE(decoded.digest == original.digest);
}

TEST_CASE("Pull response encoding/decoding", "[protocol]") {
    PullResponseMessage original;
    original.entries.emplace_back(Key("x"), Entry::make("1", 100));
    original.requested = {Key("y"), Key("z")};

    auto decoded = roundtrip<PullResponseMessage>(original);

    REQUIRE(decoded.entries.size() == 1);
    REQUIRE(decoded.entries[0].second == original.entries[0].second);
    REQUIRE(decoded.requested == original.requested);
}

TEST_CASE("Error message encoding/decoding", "[protocol]") {
    ErrorMessage original;
    original.code = ErrorCode::MalformedMessage;
    original.message = "bad frame";
    original.original_request_id = 12;

    auto decoded = roundtrip<ErrorMessage>(original);

    REQUIRE(decoded.code == ErrorCode::MalformedMessage);
    REQUIRE(decoded.message == "bad frame");
    REQUIRE(decoded.original_request_id == 12);
}

TEST_CASE("Malformed frames are rejected", "[protocol]") {
    PushMessage msg;
    msg.entries.emplace_back(Key("key"), Entry::make("value", 1, 10));
    auto good = Codec::encode(msg);

    SECTION("Truncated payload") {
        ByteBuffer cut(good.begin(), good.end() - 3);
        REQUIRE_THROWS(Codec::decode(cut));
    }

    SECTION("Trailing bytes") {
        auto longer = good;
        longer.push_back(0);
        REQUIRE_THROWS(Codec::decode(longer));
    }

    SECTION("Length field disagrees with payload") {
        auto bad = good;
        bad.push_back(0);
        bad[8] += 1;  // payload length now matches, but the payload has junk after the entries
        REQUIRE_THROWS(Codec::decode(bad));
    }

    SECTION("Unknown message type") {
        auto bad = good;
        bad[6] = 0x77;
        REQUIRE_THROWS(Codec::decode(bad));
    }

    SECTION("Entry count larger than the payload") {
        auto bad = good;
        bad[MessageHeader::SIZE + 3] = 0x7F;
        REQUIRE_THROWS(Codec::decode(bad));
    }

    SECTION("Unknown entry flags") {
        // header, count, key length + "key", created_at, then flags
        auto bad = good;
        bad[MessageHeader::SIZE + 4 + 4 + 3 + 8] = 0x80;
        REQUIRE_THROWS(Codec::decode(bad));
    }

    SECTION("Empty key") {
        PushMessage empty_key;
        empty_key.entries.emplace_back(Key(""), Entry::make("v", 1));
        auto buf = Codec::encode(empty_key);
        REQUIRE_THROWS(Codec::decode(buf));
    }

    SECTION("Empty input") {
        REQUIRE_THROWS(Codec::decode(ByteView{}));
    }
}

TEST_CASE("Message names", "[protocol]") {
    REQUIRE(std::string(message_name(Message{PushMessage{}})) == "Push");
    REQUIRE(std::string(message_name(Message{FullPushMessage{}})) == "FullPush");
    REQUIRE(std::string(message_name(Message{PullRequestMessage{}})) == "PullRequest");
    REQUIRE(std::string(message_name(Message{PullResponseMessage{}})) == "PullResponse");
    REQUIRE(std::string(message_name(Message{ErrorMessage{}})) == "Error");
}

TEST_CASE("Entry size matches its encoding", "[protocol]") {
    Key key("some-key");
    for (const auto& entry : {Entry::make("value", 10), Entry::make("", 10, 500),
                              Entry::make_tombstone(10, 3600000)}) {
        ByteBuffer buf;
        Codec::encode_entry(buf, key, entry);
        REQUIRE(Codec::entry_size(key, entry) == buf.size());
    }
}
