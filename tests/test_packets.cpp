#include <gtest/gtest.h>
#include "packets.hpp"
#include "test_support.hpp"

using namespace erebus;
using namespace erebus::testing;

namespace {

std::string parse_error(const std::string& text) {
    try {
        PacketCodec::parse(text);
    } catch (const PacketError& e) {
        return e.what();
    }
    return "";
}

}

TEST(PacketCodecTest, ParsesConnect) {
    auto p = PacketCodec::parse(connect_packet("a.b.c"));
    ASSERT_TRUE(std::holds_alternative<ConnectPacket>(p));
    EXPECT_EQ(std::get<ConnectPacket>(p).grant_jwt, "a.b.c");
}

TEST(PacketCodecTest, ParsesSubscribeAndUnsubscribe) {
    auto s = PacketCodec::parse(subscribe_packet("room", "r1"));
    ASSERT_TRUE(std::holds_alternative<SubscribePacket>(s));
    EXPECT_EQ(std::get<SubscribePacket>(s).topic, "room");
    EXPECT_EQ(std::get<SubscribePacket>(s).request_id.value_or(""), "r1");

    auto u = PacketCodec::parse(R"({"packetType":"unsubscribe","topic":"room"})");
    ASSERT_TRUE(std::holds_alternative<UnsubscribePacket>(u));
    EXPECT_FALSE(std::get<UnsubscribePacket>(u).request_id.has_value());
}

TEST(PacketCodecTest, ParsesPublish) {
    auto p = PacketCodec::parse(R"({"packetType":"publish","topic":"room","requestId":"r9","clientMsgId":"c9",
        "ack":true,"payload":{"topic":"room","payload":"hello","clientPublishTs":1700000000000,
        "seq":"999","senderId":"spoofed"}})");
    ASSERT_TRUE(std::holds_alternative<PublishPacket>(p));
    const auto& pub = std::get<PublishPacket>(p);
    EXPECT_EQ(pub.topic, "room");
    EXPECT_TRUE(pub.ack);
    EXPECT_EQ(pub.request_id.value_or(""), "r9");
    EXPECT_EQ(pub.client_msg_id.value_or(""), "c9");
    EXPECT_EQ(pub.payload.payload, "hello");
    EXPECT_EQ(pub.payload.client_msg_id.value_or(""), "c9");
    ASSERT_TRUE(pub.payload.client_publish_ts.has_value());
    EXPECT_DOUBLE_EQ(*pub.payload.client_publish_ts, 1700000000000.0);
}

TEST(PacketCodecTest, PublishTopicFallsBackToPayload) {
    auto p = PacketCodec::parse(R"({"packetType":"publish","payload":{"topic":"room","payload":"x"}})");
    const auto& pub = std::get<PublishPacket>(p);
    EXPECT_EQ(pub.topic, "room");
    EXPECT_FALSE(pub.ack);
}

TEST(PacketCodecTest, ErrorReasons) {
    EXPECT_EQ(parse_error("{not json"), "Invalid JSON");
    EXPECT_EQ(parse_error("[1,2,3]"), "Invalid packet format");
    EXPECT_EQ(parse_error(R"({"topic":"room"})"), "Invalid packet format");
    EXPECT_EQ(parse_error(R"({"packetType":"teleport"})"), "Unknown packet type");
    EXPECT_EQ(parse_error(R"({"packetType":"connect"})"), "Invalid packet format");
    EXPECT_EQ(parse_error(R"({"packetType":"connect","grantJWT":""})"), "Invalid packet format");
    EXPECT_EQ(parse_error(R"({"packetType":"subscribe","topic":42})"), "Invalid packet format");
    EXPECT_EQ(parse_error(R"({"packetType":"publish","topic":"room","payload":"flat"})"), "Invalid packet format");
    EXPECT_EQ(parse_error(R"({"packetType":"publish","topic":"room","payload":{"topic":"room"}})"),
              "Invalid packet format");
}

TEST(PacketCodecTest, RejectsUnsafeTopics) {
    EXPECT_EQ(parse_error(subscribe_packet("a:b")), "Invalid packet format");
    EXPECT_EQ(parse_error(subscribe_packet("")), "Invalid packet format");
    EXPECT_EQ(parse_error(subscribe_packet(std::string(PacketCodec::MAX_TOPIC_LENGTH + 1, 't'))),
              "Invalid packet format");
    EXPECT_EQ(parse_error(publish_packet("a:b", "x")), "Invalid packet format");
}

TEST(PacketCodecTest, AcceptsUtf8Topics) {
    const std::string topic = "caf\xc3\xa9-\xe8\x81\x8a\xe5\xa4\xa9";
    auto s = PacketCodec::parse(subscribe_packet(topic));
    ASSERT_TRUE(std::holds_alternative<SubscribePacket>(s));
    EXPECT_EQ(std::get<SubscribePacket>(s).topic, topic);
}

TEST(PacketCodecTest, DeepNestingIsInvalidJson) {
    std::string deep = R"({"packetType":"connect","grantJWT":"t","x":)";
    for (int i = 0; i < 40; i++) deep += "[";
    for (int i = 0; i < 40; i++) deep += "]";
    deep += "}";
    EXPECT_EQ(parse_error(deep), "Invalid JSON");
}

TEST(PacketCodecTest, SubscriptionAckShape) {
    auto ack = PacketCodec::subscription_ack(std::string("r1"), "room", true);
    EXPECT_EQ(ack.at("packetType").as_string(), "ack");
    EXPECT_EQ(ack.at("requestId").as_string(), "r1");
    const auto& type = ack.at("type").as_object();
    EXPECT_EQ(type.at("path").as_string(), "subscribe");
    EXPECT_EQ(type.at("topic").as_string(), "room");
    EXPECT_EQ(type.at("clientMsgId").as_string(), "r1");
    EXPECT_EQ(type.at("result").as_object().at("status").as_string(), "subscribed");

    auto un = PacketCodec::subscription_ack(std::nullopt, "room", false);
    EXPECT_FALSE(un.contains("requestId"));
    EXPECT_EQ(un.at("type").as_object().at("path").as_string(), "unsubscribe");
    EXPECT_FALSE(un.at("type").as_object().at("clientMsgId").as_string().empty());
}

TEST(PacketCodecTest, PublishAckShapes) {
    auto ok = PacketCodec::publish_ok_ack(std::string("r1"), "room", "srv-1", std::string("c1"), "01SEQ", 12.5);
    const auto& t = ok.at("type").as_object();
    EXPECT_EQ(t.at("seq").as_string(), "01SEQ");
    EXPECT_EQ(t.at("serverAssignedId").as_string(), "srv-1");
    EXPECT_EQ(ok.at("clientMsgId").as_string(), "c1");
    EXPECT_TRUE(t.at("result").as_object().at("ok").as_bool());
    EXPECT_DOUBLE_EQ(t.at("result").as_object().at("t_ingress").as_double(), 12.5);

    auto err = PacketCodec::publish_error_ack(std::nullopt, "room", std::nullopt, "FORBIDDEN", "no write");
    const auto& et = err.at("type").as_object();
    EXPECT_EQ(et.at("seq").as_string(), NO_SEQUENCE);
    EXPECT_FALSE(et.at("result").as_object().at("ok").as_bool());
    EXPECT_EQ(et.at("result").as_object().at("code").as_string(), "FORBIDDEN");
    EXPECT_EQ(et.at("result").as_object().at("message").as_string(), "no write");
}

TEST(PacketCodecTest, PresenceShape) {
    auto p = PacketCodec::presence("alice", "room", false, 1234);
    EXPECT_EQ(p.at("packetType").as_string(), "presence");
    EXPECT_EQ(p.at("clientId").as_string(), "alice");
    EXPECT_EQ(p.at("status").as_string(), "offline");
    EXPECT_EQ(p.at("timestamp").as_int64(), 1234);
}
