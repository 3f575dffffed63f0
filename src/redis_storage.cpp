#include "redis_storage.hpp"
#include <iterator>

namespace erebus {

RedisStorage::RedisStorage(sw::redis::Redis& redis, const std::string& shard_key)
    : redis_(redis)
    , namespace_("erebus:do:" + shard_key + ":")
    , index_key_("erebus:do:" + shard_key + ":__index") {}

std::optional<std::string> RedisStorage::get(const std::string& key) {
    try {
        auto val = redis_.get(data_key(key));
        if (val) return *val;
        return std::nullopt;
    } catch (const std::exception& e) {
        throw StorageError("Redis get failed: " + std::string(e.what()));
    }
}

void RedisStorage::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::recursive_mutex> lock(txn_mutex_);
    try {
        auto tx = redis_.transaction();
        tx.set(data_key(key), value);
        tx.zadd(index_key_, key, 0);
        tx.exec();
    } catch (const std::exception& e) {
        throw StorageError("Redis put failed: " + std::string(e.what()));
    }
}

bool RedisStorage::del(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(txn_mutex_);
    try {
        auto removed = redis_.del(data_key(key));
        redis_.zrem(index_key_, key);
        return removed > 0;
    } catch (const std::exception& e) {
        throw StorageError("Redis del failed: " + std::string(e.what()));
    }
}

std::vector<ChannelStorage::Entry> RedisStorage::list(const std::string& prefix, size_t limit) {
    std::vector<Entry> out;
    try {
        std::vector<std::string> keys;
        sw::redis::LimitOptions opts;
        opts.offset = 0;
        opts.count = limit > 0 ? static_cast<long long>(limit) : -1;

        redis_.zrangebylex(index_key_,
                           sw::redis::BoundedInterval<std::string>(prefix, prefix + "\xff",
                                                                   sw::redis::BoundType::RIGHT_OPEN),
                           opts,
                           std::back_inserter(keys));
        if (keys.empty()) return out;

        std::vector<std::string> data_keys;
        data_keys.reserve(keys.size());
        for (const auto& k : keys) data_keys.push_back(data_key(k));

        std::vector<sw::redis::OptionalString> values;
        redis_.mget(data_keys.begin(), data_keys.end(), std::back_inserter(values));

        for (size_t i = 0; i < keys.size() && i < values.size(); ++i) {
            // Index entries can briefly outlive their value if a delete was interrupted.
            if (values[i]) out.emplace_back(keys[i], *values[i]);
        }
    } catch (const std::exception& e) {
        throw StorageError("Redis list failed: " + std::string(e.what()));
    }
    return out;
}

void RedisStorage::transaction(const TransactionFn& fn) {
    std::lock_guard<std::recursive_mutex> lock(txn_mutex_);
    BufferedTransaction txn([this](const std::string& key) { return get(key); });
    fn(txn);
    if (txn.pending().empty()) return;

    try {
        auto tx = redis_.transaction();
        for (const auto& [key, value] : txn.pending()) {
            if (value) {
                tx.set(data_key(key), *value);
                tx.zadd(index_key_, key, 0);
            } else {
                tx.del(data_key(key));
                tx.zrem(index_key_, key);
            }
        }
        tx.exec();
    } catch (const std::exception& e) {
        throw StorageError("Redis transaction failed: " + std::string(e.what()));
    }
}

void RedisStorage::clear() {
    std::lock_guard<std::recursive_mutex> lock(txn_mutex_);
    try {
        std::vector<std::string> keys;
        redis_.zrange(index_key_, 0, -1, std::back_inserter(keys));
        for (const auto& k : keys) redis_.del(data_key(k));
        redis_.del(index_key_);
    } catch (const std::exception& e) {
        throw StorageError("Redis clear failed: " + std::string(e.what()));
    }
}

}
