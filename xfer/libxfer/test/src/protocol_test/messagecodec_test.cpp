#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "messagecodecimpl.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::xfer::protocol;
using namespace ::xfer::transfer;
using namespace ::xfer::transit;
using nlohmann::json;

namespace
{
class MessageCodecTest : public Test
{
protected:
    PeerMessage decode_ok(const std::string &text)
    {
        PeerMessage   message;
        TransferError error;
        EXPECT_TRUE(codec_.decode(testutils::to_bytes(text), message, error)) << text;
        EXPECT_FALSE(error);
        return message;
    }

    TransferError decode_error(const std::string &text)
    {
        PeerMessage   message;
        TransferError error;
        EXPECT_FALSE(codec_.decode(testutils::to_bytes(text), message, error)) << text;
        return error;
    }

    json encode_json(const PeerMessage &message)
    {
        auto bytes = codec_.encode(message);
        return json::parse(bytes.cbegin(), bytes.cend());
    }

    MessageCodecImpl codec_;
};
}  // namespace

TEST_F(MessageCodecTest, EncodeFileOffer)
{
    EXPECT_EQ(encode_json(OfferMessage {FileOffer {"a.txt", 5}}),
        json::parse(R"({"offer": {"file": {"filename": "a.txt", "filesize": 5}}})"));
}

TEST_F(MessageCodecTest, EncodeDirectoryOffer)
{
    EXPECT_EQ(encode_json(OfferMessage {DirectoryOffer {"d", "zipped", 300, 120, 3}}),
        json::parse(R"({"offer": {"directory": {"dirname": "d", "mode": "zipped",
            "zipsize": 300, "numbytes": 120, "numfiles": 3}}})"));
}

TEST_F(MessageCodecTest, EncodeAnswerAndError)
{
    EXPECT_EQ(encode_json(AnswerMessage::file_ack("ok")),
        json::parse(R"({"answer": {"file_ack": "ok"}})"));
    EXPECT_EQ(encode_json(ErrorMessage {"transfer rejected"}),
        json::parse(R"({"error": "transfer rejected"})"));
}

TEST_F(MessageCodecTest, EncodeTransit)
{
    TransitMessage transit {Abilities::all(), {}};
    transit.hints.direct_tcp.push_back({"192.168.1.2", 4001, 0.5});
    RelayHint relay;
    relay.name = "main";
    relay.tcp.push_back({"relay.example.org", 4001, 0.0});
    relay.ws.push_back("wss://relay.example.org:443/");
    transit.hints.relay.push_back(relay);

    EXPECT_EQ(encode_json(transit), json::parse(R"({"transit": {
        "abilities-v1": [{"type": "direct-tcp-v1"}, {"type": "relay-v1"}],
        "hints-v1": [
            {"type": "direct-tcp-v1", "hostname": "192.168.1.2", "port": 4001, "priority": 0.5},
            {"type": "relay-v1", "name": "main", "hints": [
                {"type": "direct-tcp-v1", "hostname": "relay.example.org", "port": 4001,
                 "priority": 0.0}]}]}})"));
}

TEST_F(MessageCodecTest, RoundTripKnownMessages)
{
    TransitMessage transit {Abilities::force_relay(), {}};
    RelayHint      relay;
    relay.tcp.push_back({"relay.example.org", 4001, 0.0});
    transit.hints.relay.push_back(relay);
    transit.hints.direct_tcp.push_back({"::1", 1, 1.5});

    std::vector<PeerMessage> messages {OfferMessage {FileOffer {"a.txt", 5}},
        OfferMessage {DirectoryOffer {"photos", "zipped", 1000, 900, 12}},
        OfferMessage {TextOffer {"hello"}}, AnswerMessage::file_ack("ok"),
        AnswerMessage {AnswerMessage::Kind::MESSAGE_ACK, "ok"}, transit,
        ErrorMessage {"boom"}, OfferMessage {UnknownOffer {"hologram"}},
        AnswerMessage {AnswerMessage::Kind::UNKNOWN, "hologram_ack"},
        UnknownMessage {"transit-v2"}};

    for (const auto &message : messages)
    {
        PeerMessage   decoded;
        TransferError error;
        ASSERT_TRUE(codec_.decode(codec_.encode(message), decoded, error)) << to_string(message);
        EXPECT_EQ(decoded, message) << to_string(message);
    }
}

TEST_F(MessageCodecTest, UnknownTopLevelKey)
{
    auto message = decode_ok(R"({"frobnicate": {"x": 1}})");
    ASSERT_TRUE(std::holds_alternative<UnknownMessage>(message));
    EXPECT_EQ(std::get<UnknownMessage>(message).tag, "frobnicate");

    message = decode_ok("{}");
    ASSERT_TRUE(std::holds_alternative<UnknownMessage>(message));
    EXPECT_EQ(std::get<UnknownMessage>(message).tag, "");
}

TEST_F(MessageCodecTest, UnknownOfferKind)
{
    auto message = decode_ok(R"({"offer": {"tarball": {"name": "x"}}})");
    ASSERT_TRUE(std::holds_alternative<OfferMessage>(message));
    const auto &offer = std::get<OfferMessage>(message).offer;
    ASSERT_TRUE(std::holds_alternative<UnknownOffer>(offer));
    EXPECT_EQ(std::get<UnknownOffer>(offer).tag, "tarball");
}

TEST_F(MessageCodecTest, UnknownAnswerKind)
{
    auto message = decode_ok(R"({"answer": {"folder_ack": "ok"}})");
    ASSERT_TRUE(std::holds_alternative<AnswerMessage>(message));
    EXPECT_EQ(std::get<AnswerMessage>(message).kind, AnswerMessage::Kind::UNKNOWN);
    EXPECT_EQ(std::get<AnswerMessage>(message).value, "folder_ack");
}

TEST_F(MessageCodecTest, TransitToleratesUnknownAbilitiesAndHints)
{
    auto message = decode_ok(R"({"transit": {
        "abilities-v1": [{"type": "direct-tcp-v1"}, {"type": "tor-tcp-v1"}],
        "hints-v1": [
            {"type": "tor-tcp-v1", "hostname": "abc.onion", "port": 80},
            {"type": "direct-tcp-v1", "hostname": "10.0.0.1", "port": 1234},
            {"type": "relay-v1", "hints": [
                {"type": "websocket-v1", "url": "wss://relay.example.org"},
                {"type": "direct-tcp-v1", "hostname": "relay.example.org", "port": 4001,
                 "priority": 2}]}]}})");

    ASSERT_TRUE(std::holds_alternative<TransitMessage>(message));
    const auto &transit = std::get<TransitMessage>(message);
    EXPECT_EQ(transit.abilities, Abilities::force_direct());
    ASSERT_EQ(transit.hints.direct_tcp.size(), 1);
    EXPECT_EQ(transit.hints.direct_tcp[0], (DirectHint {"10.0.0.1", 1234, 0.0}));
    ASSERT_EQ(transit.hints.relay.size(), 1);
    ASSERT_EQ(transit.hints.relay[0].tcp.size(), 1);
    EXPECT_EQ(transit.hints.relay[0].tcp[0], (DirectHint {"relay.example.org", 4001, 2.0}));
}

TEST_F(MessageCodecTest, InvalidTextIsDecodeTextError)
{
    const std::vector<std::string> invalid {"", "not json", "{\"offer\":", "[1, 2, 3]", "42",
        R"({"offer": {"file": {"filename": "a"}}})",
        R"({"offer": {"file": {"filename": 5, "filesize": 5}}})",
        R"({"offer": {"file": {"filename": "a", "filesize": -5}}})",
        R"({"offer": {"directory": {"dirname": "d", "mode": "zipped"}}})",
        R"({"offer": {"message": 12}})", R"({"offer": {}})", R"({"answer": {"file_ack": 1}})",
        R"({"error": {"text": "x"}})", R"({"transit": {"abilities-v1": []}})",
        R"({"transit": {"abilities-v1": [], "hints-v1": [
            {"type": "direct-tcp-v1", "hostname": "h", "port": 70000}]}})",
        R"({"transit": {"abilities-v1": [7], "hints-v1": []}})"};

    for (const auto &text : invalid)
    {
        EXPECT_EQ(decode_error(text).kind(), TransferError::Kind::PROTOCOL_DECODE_TEXT) << text;
    }
}

TEST_F(MessageCodecTest, TransitAckIsMsgpack)
{
    TransitAck ack {"ok", "deadbeaf"};
    auto       bytes = codec_.encode(ack);

    EXPECT_EQ(json::from_msgpack(bytes), json::parse(R"({"ack": "ok", "sha256": "deadbeaf"})"));

    TransitAck    decoded;
    TransferError error;
    ASSERT_TRUE(codec_.decode(bytes, decoded, error));
    EXPECT_EQ(decoded, ack);
}

TEST_F(MessageCodecTest, InvalidTransitAckIsDecodeBinaryError)
{
    const std::vector<std::vector<uint8_t>> invalid {{}, {0xc1}, {0x81, 0xa3, 'a', 'c'},
        json::to_msgpack(json {{"ack", "ok"}}), json::to_msgpack(json::array({1, 2})),
        json::to_msgpack(json {{"ack", 1}, {"sha256", "x"}})};

    for (const auto &bytes : invalid)
    {
        TransitAck    ack;
        TransferError error;
        EXPECT_FALSE(codec_.decode(bytes, ack, error));
        EXPECT_EQ(error.kind(), TransferError::Kind::PROTOCOL_DECODE_BINARY);
    }
}

TEST_F(MessageCodecTest, MessageNames)
{
    EXPECT_STREQ(message_name(OfferMessage {FileOffer {}}), "offer");
    EXPECT_STREQ(message_name(AnswerMessage {}), "answer");
    EXPECT_STREQ(message_name(TransitMessage {}), "transit");
    EXPECT_STREQ(message_name(ErrorMessage {}), "error");
    EXPECT_STREQ(message_name(UnknownMessage {"x"}), "unknown");
}
