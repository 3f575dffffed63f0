#pragma once

#include "channel_actor.hpp"
#include "channel_storage.hpp"
#include "grant.hpp"
#include "server_config.hpp"
#include "shard_transport.hpp"
#include "usage_reporter.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace erebus {

class RedisManager;

// Process-local directory of channel actors, keyed by 5-segment shard key.
//
// Actors are created lazily and live for the life of the process. The
// registry is also the ShardTransport: shards hosted here are called
// directly, shards of other regions are reached through Redis RPC. Without
// Redis every shard is hosted in-process.
class ActorRegistry : public ShardTransport {
public:
    using StorageFactory = std::function<std::shared_ptr<ChannelStorage>(const std::string& shard_key)>;

    ActorRegistry(boost::asio::any_io_executor executor, const ServerConfig& config, const GrantVerifier& verifier,
                  UsageSink& usage, StorageFactory storage_factory, RedisManager* redis = nullptr);
    ~ActorRegistry() = default;

    ActorRegistry(const ActorRegistry&) = delete;
    ActorRegistry& operator=(const ActorRegistry&) = delete;

    // Throws std::invalid_argument unless shard_key has a location segment.
    std::shared_ptr<ChannelActor> get_or_create(const std::string& shard_key);
    std::shared_ptr<ChannelActor> find(const std::string& shard_key) const;
    std::vector<std::shared_ptr<ChannelActor>> actors() const;
    size_t actor_count() const;

    // ShardTransport
    void publish_message(const std::string& shard_key, const RemotePublish& publish) override;
    void set_shards(const std::string& shard_key, const std::vector<std::string>& shards) override;

    void set_paused(const std::string& shard_key, bool paused);

    /**
     * Records the shard in the directory and pushes the channel's full shard
     * list to every shard of the channel. Runs in the background.
     */
    void register_shard(const std::string& project_id, const std::string& channel_key,
                        const std::string& shard_key);

    // Pauses or resumes every known shard of the project. @return shards addressed.
    size_t set_project_paused(const std::string& project_id, bool paused);

    // Entry point for RPCs received from other processes.
    void dispatch_rpc(const std::string& shard_key, const std::string& payload);

private:
    boost::asio::any_io_executor executor_;
    const ServerConfig& config_;
    const GrantVerifier& verifier_;
    UsageSink& usage_;
    StorageFactory storage_factory_;
    RedisManager* redis_;

    std::unordered_map<std::string, std::shared_ptr<ChannelActor>> actors_;
    mutable std::shared_mutex actors_mutex_;

    bool is_local(const std::string& shard_key) const;
    void send_rpc(const std::string& shard_key, const boost::json::object& rpc);
    std::vector<std::string> shards_of_channel(const std::string& channel_key) const;
};

}
