#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include "actor_registry.hpp"
#include "memory_storage.hpp"
#include "metrics.hpp"
#include "test_support.hpp"

using namespace erebus;
using namespace erebus::testing;

class ActorRegistryTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc;
    GrantIssuer issuer;
    GrantVerifier verifier{issuer.jwk()};
    ServerConfig config;
    RecordingUsage usage;
    ActorRegistry registry{ioc.get_executor(), config, verifier, usage,
                           [](const std::string&) { return std::make_shared<MemoryStorage>(); }};

    void SetUp() override { MetricsRegistry::instance().reset(); }

    void drain() {
        ioc.restart();
        ioc.run();
    }
};

TEST_F(ActorRegistryTest, CreatesOneActorPerShardKey) {
    auto a = registry.get_or_create("proj:chat:channel:v1:eu");
    auto b = registry.get_or_create("proj:chat:channel:v1:eu");
    auto c = registry.get_or_create("proj:chat:channel:v1:us");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(registry.actor_count(), 2u);
    EXPECT_EQ(registry.find("proj:chat:channel:v1:eu"), a);
    EXPECT_EQ(registry.find("proj:other:channel:v1:eu"), nullptr);
    EXPECT_EQ(a->project_id(), "proj");
    EXPECT_EQ(a->channel(), "chat");
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("erebus_active_shards"), 2.0);
}

TEST_F(ActorRegistryTest, RejectsKeysWithoutRegion) {
    EXPECT_THROW(registry.get_or_create("proj:chat:channel:v1"), std::invalid_argument);
    EXPECT_EQ(registry.actor_count(), 0u);
}

TEST_F(ActorRegistryTest, ProjectPauseReachesEveryShard) {
    auto eu = registry.get_or_create("proj:chat:channel:v1:eu");
    auto us = registry.get_or_create("proj:chat:channel:v1:us");
    auto lobby = registry.get_or_create("proj:lobby:channel:v1:eu");
    auto other = registry.get_or_create("other:chat:channel:v1:eu");

    EXPECT_EQ(registry.set_project_paused("proj", true), 3u);
    EXPECT_TRUE(eu->paused());
    EXPECT_TRUE(us->paused());
    EXPECT_TRUE(lobby->paused());
    EXPECT_FALSE(other->paused());

    EXPECT_EQ(registry.set_project_paused("proj", false), 3u);
    EXPECT_FALSE(eu->paused());
    EXPECT_EQ(registry.set_project_paused("nobody", true), 0u);
    drain();
}

TEST_F(ActorRegistryTest, DispatchesRpcOps) {
    const std::string key = "proj:chat:channel:v1:eu";

    registry.dispatch_rpc(key, R"({"op":"pause","paused":true})");
    auto actor = registry.find(key);
    ASSERT_NE(actor, nullptr);
    EXPECT_TRUE(actor->paused());

    registry.dispatch_rpc(key, R"({"op":"set_shards","shards":["proj:chat:channel:v1:us"]})");
    drain();
    EXPECT_EQ(actor->shard_status().shards, std::vector<std::string>{"proj:chat:channel:v1:us"});
}

TEST_F(ActorRegistryTest, RemotePublishDeliversToLocalSubscribers) {
    const std::string key = "proj:chat:channel:v1:eu";
    auto actor = registry.get_or_create(key);

    auto bob = std::make_shared<FakeSocket>();
    actor->attach(bob, "eu");
    actor->on_message(bob, connect_packet(issuer.token(make_grant("bob", {{"room", TopicScope::Read}}))));
    actor->on_message(bob, subscribe_packet("room"));
    drain();

    RemotePublish publish;
    publish.message.id = "m1";
    publish.message.topic = "room";
    publish.message.sender_id = "alice";
    publish.message.seq = "01HZZZZZZZZZZZZZZZZZZZZZZZ";
    publish.message.payload = "from afar";
    publish.sender_id = "alice";
    publish.subscriber_ids = {"alice"};
    publish.project_id = "proj";
    publish.channel = "chat";
    publish.topic = "room";
    publish.seq = publish.message.seq;

    boost::json::object rpc{{"op", "publish"}, {"publish", publish.to_json()}};
    registry.dispatch_rpc(key, boost::json::serialize(rpc));
    drain();

    auto msgs = bob->messages();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].at("payload").as_string(), "from afar");
}

TEST_F(ActorRegistryTest, MalformedRpcIsIgnored) {
    registry.dispatch_rpc("proj:chat:channel:v1:eu", "{not json");
    registry.dispatch_rpc("proj:chat:channel:v1:eu", R"({"op":"explode"})");
    registry.dispatch_rpc("proj:chat:channel:v1:eu", R"({"op":"publish","publish":{}})");
    registry.dispatch_rpc("proj:chat:channel:v1:eu", R"({"nop":1})");
    EXPECT_EQ(registry.actor_count(), 0u);
}

TEST(RemotePublishTest, JsonRoundTripUsesWireNames) {
    RemotePublish p;
    p.message.id = "m";
    p.message.topic = "t";
    p.message.sender_id = "s";
    p.message.seq = "q";
    p.message.payload = "x";
    p.sender_id = "s";
    p.subscriber_ids = {"a", "b"};
    p.project_id = "proj";
    p.key_id = "k";
    p.channel = "chat";
    p.topic = "t";
    p.seq = "q";

    auto obj = p.to_json();
    EXPECT_TRUE(obj.contains("channelName"));
    EXPECT_TRUE(obj.contains("subscriberIds"));

    auto back = RemotePublish::from_json(obj);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->subscriber_ids.size(), 2u);
    EXPECT_EQ(back->key_id, std::optional<std::string>("k"));
    EXPECT_FALSE(RemotePublish::from_json(boost::json::object{{"senderId", "s"}}).has_value());
}
