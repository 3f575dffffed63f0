#include <gtest/gtest.h>
#include "distributed_key.hpp"

using namespace erebus;

TEST(DistributedKeyTest, StringifyAndParse) {
    auto key = DistributedKey::stringify("proj", "chat", "channel", "v1");
    EXPECT_EQ(key, "proj:chat:channel:v1");

    auto parts = DistributedKey::parse(key);
    EXPECT_EQ(parts.project_id, "proj");
    EXPECT_EQ(parts.resource, "chat");
    EXPECT_EQ(parts.resource_type, "channel");
    EXPECT_EQ(parts.version, "v1");
    EXPECT_FALSE(parts.location_hint.has_value());
}

TEST(DistributedKeyTest, LocationHintRoundTrip) {
    auto shard = DistributedKey::append_location_hint("proj:chat:channel:v1", "eu-west");
    EXPECT_EQ(shard, "proj:chat:channel:v1:eu-west");
    EXPECT_EQ(DistributedKey::get_region(shard), "eu-west");
    EXPECT_EQ(DistributedKey::remove_location_hint(shard), "proj:chat:channel:v1");

    // Appending to a 5-segment key replaces the region.
    EXPECT_EQ(DistributedKey::append_location_hint(shard, "us-east"), "proj:chat:channel:v1:us-east");
}

TEST(DistributedKeyTest, ChannelShard) {
    EXPECT_EQ(DistributedKey::channel_shard("p", "c", "ap"), "p:c:channel:v1:ap");
}

TEST(DistributedKeyTest, RejectsMalformedKeys) {
    EXPECT_THROW(DistributedKey::parse("a:b:c"), std::invalid_argument);
    EXPECT_THROW(DistributedKey::parse("a:b:c:d:e:f"), std::invalid_argument);
    EXPECT_THROW(DistributedKey::get_region("proj:chat:channel:v1"), std::invalid_argument);
    EXPECT_FALSE(DistributedKey::is_valid("nope"));
    EXPECT_TRUE(DistributedKey::is_valid("a:b:c:d"));
    EXPECT_TRUE(DistributedKey::is_valid("a:b:c:d:e"));
}
