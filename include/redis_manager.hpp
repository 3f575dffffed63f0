#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <sw/redis++/redis++.h>

namespace erebus {

struct ServerConfig;

// Redis-backed shard directory and cross-process RPC bus.
// Also owns the client that RedisStorage instances share.
class RedisManager {
public:
    using RpcHandler = std::function<void(const std::string& shard_key, const std::string& payload)>;

    static constexpr const char* RPC_CHANNEL_PREFIX = "erebus:shard:";

    explicit RedisManager(const ServerConfig& config);
    ~RedisManager();

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    bool is_connected() const { return connected_; }

    // Shared client for per-shard storage. Only valid while is_connected().
    sw::redis::Redis& client() { return *redis_; }

    // --- Shard Directory ---
    // Records the shard under its channel and the channel under its project.
    // Skips the write when both memberships already exist.
    bool register_channel_and_shard(const std::string& project_id, const std::string& channel_key,
                                    const std::string& shard_key);

    std::vector<std::string> get_shards(const std::string& channel_key);
    std::vector<std::string> get_channels_for_project(const std::string& project_id);

    // --- Shard RPC (Pub/Sub) ---
    // Delivers RPCs addressed to any shard of region to handler. Call once, before traffic.
    void start_rpc_listener(const std::string& region, RpcHandler handler);

    // Throws std::runtime_error if the RPC could not be published.
    void publish_rpc(const std::string& shard_key, const std::string& payload);

    static std::string rpc_channel(const std::string& shard_key) { return RPC_CHANNEL_PREFIX + shard_key; }

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::unique_ptr<sw::redis::Redis> subscriber_redis_;
    std::unique_ptr<sw::redis::Subscriber> subscriber_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread subscriber_thread_;
    mutable std::mutex subscriber_mutex_;

    std::string rpc_pattern_;
    RpcHandler rpc_handler_;

    void subscriber_loop();
};

}
