#include <gtest/gtest.h>
#include "redis_manager.hpp"
#include "redis_storage.hpp"
#include "server_config.hpp"
#include "subscription_manager.hpp"
#include "sequence_manager.hpp"
#include <algorithm>

using namespace erebus;

class RedisStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.redis_url = "tcp://127.0.0.1:6379";
        redis = std::make_unique<RedisManager>(config);
        if (redis->is_connected()) {
            storage = std::make_unique<RedisStorage>(redis->client(), "test:chat:channel:v1:eu");
            storage->clear();
        }
    }

    void TearDown() override {
        if (storage) storage->clear();
    }

    ServerConfig config;
    std::unique_ptr<RedisManager> redis;
    std::unique_ptr<RedisStorage> storage;
};

TEST_F(RedisStorageTest, ConnectionStatus) {
    if (!redis->is_connected()) {
        GTEST_SKIP() << "Redis not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(redis->is_connected());
}

TEST_F(RedisStorageTest, GetPutDelete) {
    if (!redis->is_connected()) GTEST_SKIP();

    EXPECT_FALSE(storage->get("k").has_value());
    storage->put("k", "v");
    EXPECT_EQ(storage->get("k"), std::optional<std::string>("v"));
    EXPECT_TRUE(storage->del("k"));
    EXPECT_FALSE(storage->del("k"));
}

TEST_F(RedisStorageTest, PrefixListingIsOrderedAndBounded) {
    if (!redis->is_connected()) GTEST_SKIP();

    storage->put("msg:b", "2");
    storage->put("msg:a", "1");
    storage->put("msg:c", "3");
    storage->put("other", "x");

    auto all = storage->list("msg:", 0);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].first, "msg:a");
    EXPECT_EQ(all[2].second, "3");

    EXPECT_EQ(storage->list("msg:", 2).size(), 2u);
}

TEST_F(RedisStorageTest, TransactionCommitsOrNothing) {
    if (!redis->is_connected()) GTEST_SKIP();

    storage->transaction([](StorageTransaction& txn) {
        txn.put("a", "1");
        EXPECT_EQ(txn.get("a"), std::optional<std::string>("1"));
        txn.put("b", "2");
    });
    EXPECT_EQ(storage->get("b"), std::optional<std::string>("2"));

    EXPECT_THROW(storage->transaction([](StorageTransaction& txn) {
        txn.del("a");
        throw std::runtime_error("abort");
    }), std::runtime_error);
    EXPECT_TRUE(storage->get("a").has_value());
}

TEST_F(RedisStorageTest, ServicesRunOverRedis) {
    if (!redis->is_connected()) GTEST_SKIP();

    SubscriptionManager subs(*storage);
    subs.subscribe("room", "test", "chat", "alice");
    EXPECT_TRUE(subs.is_subscribed("room", "test", "chat", "alice"));

    SequenceManager seq(*storage);
    auto a = seq.generate_sequence("test", "chat", "room");
    auto b = seq.generate_sequence("test", "chat", "room");
    EXPECT_GT(b, a);
}

TEST_F(RedisStorageTest, ShardDirectory) {
    if (!redis->is_connected()) GTEST_SKIP();

    auto& client = redis->client();
    client.del("erebus:project:test");
    client.del("erebus:shards:test:chat:channel:v1");

    EXPECT_TRUE(redis->register_channel_and_shard("test", "test:chat:channel:v1", "test:chat:channel:v1:eu"));
    EXPECT_TRUE(redis->register_channel_and_shard("test", "test:chat:channel:v1", "test:chat:channel:v1:us"));

    auto shards = redis->get_shards("test:chat:channel:v1");
    std::sort(shards.begin(), shards.end());
    ASSERT_EQ(shards.size(), 2u);
    EXPECT_EQ(shards[0], "test:chat:channel:v1:eu");

    auto channels = redis->get_channels_for_project("test");
    ASSERT_EQ(channels.size(), 1u);
    EXPECT_EQ(channels[0], "test:chat:channel:v1");
}
