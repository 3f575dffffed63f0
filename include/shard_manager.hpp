#pragma once

#include "channel_storage.hpp"
#include <optional>
#include <string>
#include <vector>

namespace erebus {

struct ShardStatus {
    std::optional<std::string> location_hint;
    std::vector<std::string> shards;
    std::vector<std::string> remote_shards;
};

// Known sibling replicas of this channel shard plus the region it serves.
// A shard key refers to this instance when it equals the stored hint or its
// location segment does.
class ShardManager {
public:
    explicit ShardManager(ChannelStorage& storage);

    std::vector<std::string> get_available_shards();

    // Deduplicates, drops self and skips the write if the stored set is unchanged.
    void set_shards_in_local_storage(const std::vector<std::string>& shards);

    std::optional<std::string> get_location_hint();
    void set_location_hint(const std::string& hint);

    void add_shard(const std::string& shard);
    void remove_shard(const std::string& shard);
    void clear_shards();

    std::vector<std::string> get_remote_shards();
    bool should_broadcast_to_shards() { return !get_remote_shards().empty(); }
    ShardStatus get_shard_status();

private:
    ChannelStorage& storage_;

    static bool is_self(const std::string& shard, const std::optional<std::string>& hint);
    static bool same_set(const std::vector<std::string>& a, const std::vector<std::string>& b);
};

}
