#pragma once

#include "channel_storage.hpp"
#include <mutex>
#include <sw/redis++/redis++.h>

namespace erebus {

// Redis-backed ChannelStorage for one shard.
// Values live under "erebus:do:{shard}:k:{key}"; a sorted set of logical keys
// (all scored 0) gives lexicographic prefix listing through ZRANGEBYLEX.
class RedisStorage : public ChannelStorage {
public:
    RedisStorage(sw::redis::Redis& redis, const std::string& shard_key);

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    bool del(const std::string& key) override;
    std::vector<Entry> list(const std::string& prefix, size_t limit) override;
    void transaction(const TransactionFn& fn) override;

    // Removes every key of this shard. Used by maintenance and tests.
    void clear();

private:
    sw::redis::Redis& redis_;
    std::string namespace_;
    std::string index_key_;
    std::recursive_mutex txn_mutex_;

    std::string data_key(const std::string& key) const { return namespace_ + "k:" + key; }
};

}
