#include "shard_manager.hpp"
#include "distributed_key.hpp"
#include "pubsub_types.hpp"
#include "security_logger.hpp"
#include <boost/json.hpp>
#include <algorithm>
#include <set>

namespace erebus {

namespace {

std::vector<std::string> decode_shards(const std::optional<std::string>& raw) {
    std::vector<std::string> shards;
    if (!raw) return shards;
    try {
        auto v = boost::json::parse(*raw);
        if (!v.is_array()) return shards;
        for (const auto& s : v.as_array()) {
            if (s.is_string()) shards.emplace_back(s.as_string());
        }
    } catch (const std::exception& e) {
        SecurityLogger::error(SecurityLogger::EventType::STORAGE_FAILURE,
                              "Corrupt shard list: " + std::string(e.what()));
    }
    return shards;
}

}

ShardManager::ShardManager(ChannelStorage& storage) : storage_(storage) {}

bool ShardManager::is_self(const std::string& shard, const std::optional<std::string>& hint) {
    if (!hint || hint->empty()) return false;
    if (shard == *hint) return true;
    try {
        auto parts = DistributedKey::parse(shard);
        return parts.location_hint && *parts.location_hint == *hint;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

bool ShardManager::same_set(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::set<std::string>(a.begin(), a.end()) == std::set<std::string>(b.begin(), b.end());
}

std::vector<std::string> ShardManager::get_available_shards() {
    return decode_shards(storage_.get(storage_keys::SHARDS));
}

void ShardManager::set_shards_in_local_storage(const std::vector<std::string>& shards) {
    auto hint = get_location_hint();

    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& s : shards) {
        if (is_self(s, hint)) continue;
        if (seen.insert(s).second) unique.push_back(s);
    }

    if (same_set(get_available_shards(), unique)) return;

    boost::json::array arr;
    for (const auto& s : unique) arr.emplace_back(s);
    storage_.put(storage_keys::SHARDS, boost::json::serialize(arr));

    SecurityLogger::debug(SecurityLogger::EventType::LIFECYCLE,
                          "Shard list updated, " + std::to_string(unique.size()) + " siblings");
}

std::optional<std::string> ShardManager::get_location_hint() {
    auto v = storage_.get(storage_keys::LOCATION_HINT);
    if (!v || v->empty()) return std::nullopt;
    return v;
}

void ShardManager::set_location_hint(const std::string& hint) {
    storage_.put(storage_keys::LOCATION_HINT, hint);
}

void ShardManager::add_shard(const std::string& shard) {
    auto current = get_available_shards();
    if (std::find(current.begin(), current.end(), shard) != current.end()) return;
    current.push_back(shard);
    set_shards_in_local_storage(current);
}

void ShardManager::remove_shard(const std::string& shard) {
    auto current = get_available_shards();
    auto it = std::remove(current.begin(), current.end(), shard);
    if (it == current.end()) return;
    current.erase(it, current.end());
    set_shards_in_local_storage(current);
}

void ShardManager::clear_shards() {
    storage_.del(storage_keys::SHARDS);
    storage_.del(storage_keys::LOCATION_HINT);
}

std::vector<std::string> ShardManager::get_remote_shards() {
    auto hint = get_location_hint();
    auto all = get_available_shards();
    std::vector<std::string> remote;
    for (const auto& s : all) {
        if (!is_self(s, hint)) remote.push_back(s);
    }
    return remote;
}

ShardStatus ShardManager::get_shard_status() {
    ShardStatus status;
    status.location_hint = get_location_hint();
    status.shards = get_available_shards();
    status.remote_shards = get_remote_shards();
    return status;
}

}
