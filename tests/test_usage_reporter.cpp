#include <gtest/gtest.h>
#include "usage_reporter.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>

using namespace erebus;

TEST(UsageEndpointTest, HttpsDefaults) {
    auto ep = UsageReporter::parse_endpoint("https://api.erebus.sh");
    ASSERT_TRUE(ep.has_value());
    EXPECT_TRUE(ep->tls);
    EXPECT_EQ(ep->host, "api.erebus.sh");
    EXPECT_EQ(ep->port, "443");
    EXPECT_EQ(ep->target, "/api/v1/webhooks/usage");
}

TEST(UsageEndpointTest, HttpWithPortAndBasePath) {
    auto ep = UsageReporter::parse_endpoint("http://localhost:3000/hooks/");
    ASSERT_TRUE(ep.has_value());
    EXPECT_FALSE(ep->tls);
    EXPECT_EQ(ep->host, "localhost");
    EXPECT_EQ(ep->port, "3000");
    EXPECT_EQ(ep->target, "/hooks/api/v1/webhooks/usage");

    auto plain = UsageReporter::parse_endpoint("http://example.com");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->port, "80");
}

TEST(UsageEndpointTest, RejectsBadUrls) {
    EXPECT_FALSE(UsageReporter::parse_endpoint("").has_value());
    EXPECT_FALSE(UsageReporter::parse_endpoint("ftp://example.com").has_value());
    EXPECT_FALSE(UsageReporter::parse_endpoint("https://").has_value());
    EXPECT_FALSE(UsageReporter::parse_endpoint("https://:443").has_value());
    EXPECT_FALSE(UsageReporter::parse_endpoint("http://host:abc").has_value());
    EXPECT_FALSE(UsageReporter::parse_endpoint("http://host:").has_value());
}

TEST(UsageEventTest, EnvelopeShape) {
    UsageEvent ev{"websocket.message", "proj", std::string("key_1"), 42};
    auto env = ev.to_envelope();
    EXPECT_EQ(env.at("packetType").as_string(), "usage");
    const auto& payload = env.at("payload").as_object();
    EXPECT_EQ(payload.at("event").as_string(), "websocket.message");
    const auto& data = payload.at("data").as_object();
    EXPECT_EQ(data.at("projectId").as_string(), "proj");
    EXPECT_EQ(data.at("keyId").as_string(), "key_1");
    EXPECT_EQ(data.at("payloadLength").to_number<int64_t>(), 42);

    UsageEvent anon{"websocket.connect", "proj", std::nullopt, 0};
    EXPECT_FALSE(anon.to_envelope().at("payload").as_object().at("data").as_object().contains("keyId"));
}

TEST(UsageReporterTest, DisabledWithoutWebhook) {
    ServerConfig config;
    UsageReporter reporter(config);
    EXPECT_FALSE(reporter.enabled());

    reporter.start();
    reporter.enqueue({"websocket.connect", "proj", std::nullopt, 0});
    EXPECT_EQ(reporter.pending(), 0u);
    reporter.stop();
}

TEST(UsageReporterTest, QueuesUntilStarted) {
    ServerConfig config;
    config.webhook_base_url = "http://127.0.0.1:9";
    UsageReporter reporter(config);
    ASSERT_TRUE(reporter.enabled());

    reporter.enqueue({"websocket.subscribe", "proj", std::nullopt, 0});
    reporter.enqueue({"websocket.message", "proj", std::nullopt, 5});
    EXPECT_EQ(reporter.pending(), 2u);
}

TEST(UsageReporterTest, PostGivesUpOnSilentPeer) {
    // A listening socket that never accepts: the TCP handshake completes in the kernel backlog
    // but no response ever comes back.
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
    auto port = acceptor.local_endpoint().port();

    ServerConfig config;
    config.webhook_base_url = "http://127.0.0.1:" + std::to_string(port);
    config.usage_request_timeout_ms = 200;
    UsageReporter reporter(config);
    ASSERT_TRUE(reporter.enabled());

    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(reporter.post("{}"));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(UsageReporterTest, PostWithoutEndpointFails) {
    ServerConfig config;
    UsageReporter reporter(config);
    EXPECT_FALSE(reporter.post("{}"));
}
