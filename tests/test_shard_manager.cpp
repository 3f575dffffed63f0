#include <gtest/gtest.h>
#include "shard_manager.hpp"
#include "memory_storage.hpp"
#include "pubsub_types.hpp"

using namespace erebus;

class ShardManagerTest : public ::testing::Test {
protected:
    MemoryStorage storage;
    ShardManager shards{storage};
};

TEST_F(ShardManagerTest, EmptyByDefault) {
    auto status = shards.get_shard_status();
    EXPECT_FALSE(status.location_hint.has_value());
    EXPECT_TRUE(status.shards.empty());
    EXPECT_FALSE(shards.should_broadcast_to_shards());
}

TEST_F(ShardManagerTest, DropsSelfAndDuplicates) {
    shards.set_location_hint("eu");
    shards.set_shards_in_local_storage({"p:c:channel:v1:eu", "p:c:channel:v1:us", "p:c:channel:v1:us",
                                        "p:c:channel:v1:ap"});

    auto list = shards.get_available_shards();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], "p:c:channel:v1:us");
    EXPECT_EQ(list[1], "p:c:channel:v1:ap");
    EXPECT_TRUE(shards.should_broadcast_to_shards());
}

TEST_F(ShardManagerTest, UnchangedSetIsNotRewritten) {
    shards.set_location_hint("eu");
    shards.set_shards_in_local_storage({"p:c:channel:v1:us", "p:c:channel:v1:ap"});
    auto before = storage.get(storage_keys::SHARDS);

    shards.set_shards_in_local_storage({"p:c:channel:v1:ap", "p:c:channel:v1:us"});
    EXPECT_EQ(storage.get(storage_keys::SHARDS), before);
}

TEST_F(ShardManagerTest, AddRemoveAndClear) {
    shards.set_location_hint("eu");
    shards.add_shard("p:c:channel:v1:us");
    shards.add_shard("p:c:channel:v1:us");
    EXPECT_EQ(shards.get_available_shards().size(), 1u);

    shards.remove_shard("p:c:channel:v1:us");
    EXPECT_TRUE(shards.get_remote_shards().empty());

    shards.add_shard("p:c:channel:v1:ap");
    shards.clear_shards();
    EXPECT_TRUE(shards.get_available_shards().empty());
    EXPECT_FALSE(shards.get_location_hint().has_value());
}

TEST_F(ShardManagerTest, WithoutHintEverySiblingIsRemote) {
    shards.set_shards_in_local_storage({"p:c:channel:v1:us", "p:c:channel:v1:eu"});
    EXPECT_EQ(shards.get_remote_shards().size(), 2u);
}
