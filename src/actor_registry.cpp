#include "actor_registry.hpp"
#include "distributed_key.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "redis_manager.hpp"
#include "security_logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/json.hpp>
#include <iostream>
#include <mutex>
#include <set>

namespace net = boost::asio;
namespace json = boost::json;

namespace erebus {

using Log = SecurityLogger;

ActorRegistry::ActorRegistry(net::any_io_executor executor, const ServerConfig& config,
                             const GrantVerifier& verifier, UsageSink& usage, StorageFactory storage_factory,
                             RedisManager* redis)
    : executor_(std::move(executor))
    , config_(config)
    , verifier_(verifier)
    , usage_(usage)
    , storage_factory_(std::move(storage_factory))
    , redis_(redis) {}

std::shared_ptr<ChannelActor> ActorRegistry::get_or_create(const std::string& shard_key) {
    {
        std::shared_lock lock(actors_mutex_);
        auto it = actors_.find(shard_key);
        if (it != actors_.end()) return it->second;
    }

    // Validates before anything is allocated for the key.
    DistributedKey::get_region(shard_key);

    std::unique_lock lock(actors_mutex_);
    auto it = actors_.find(shard_key);
    if (it != actors_.end()) return it->second;

    auto actor = std::make_shared<ChannelActor>(executor_, shard_key, storage_factory_(shard_key), config_,
                                                verifier_, usage_, *this);
    actors_.emplace(shard_key, actor);
    MetricsRegistry::instance().set_gauge("erebus_active_shards", static_cast<double>(actors_.size()));
    std::cout << "[+] Shard actor started: " << shard_key << "\n";
    return actor;
}

std::shared_ptr<ChannelActor> ActorRegistry::find(const std::string& shard_key) const {
    std::shared_lock lock(actors_mutex_);
    auto it = actors_.find(shard_key);
    if (it != actors_.end()) return it->second;
    return nullptr;
}

std::vector<std::shared_ptr<ChannelActor>> ActorRegistry::actors() const {
    std::shared_lock lock(actors_mutex_);
    std::vector<std::shared_ptr<ChannelActor>> out;
    out.reserve(actors_.size());
    for (const auto& [key, actor] : actors_) out.push_back(actor);
    return out;
}

size_t ActorRegistry::actor_count() const {
    std::shared_lock lock(actors_mutex_);
    return actors_.size();
}

bool ActorRegistry::is_local(const std::string& shard_key) const {
    if (!redis_ || !redis_->is_connected()) return true;
    if (find(shard_key)) return true;
    try {
        return DistributedKey::get_region(shard_key) == config_.location_hint;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

void ActorRegistry::send_rpc(const std::string& shard_key, const json::object& rpc) {
    redis_->publish_rpc(shard_key, json::serialize(rpc));
}

void ActorRegistry::publish_message(const std::string& shard_key, const RemotePublish& publish) {
    if (is_local(shard_key)) {
        get_or_create(shard_key)->publish_message(publish);
        return;
    }
    send_rpc(shard_key, json::object{{"op", "publish"}, {"publish", publish.to_json()}});
}

void ActorRegistry::set_shards(const std::string& shard_key, const std::vector<std::string>& shards) {
    if (is_local(shard_key)) {
        get_or_create(shard_key)->set_shards(shards);
        return;
    }
    json::array arr;
    for (const auto& s : shards) arr.emplace_back(s);
    send_rpc(shard_key, json::object{{"op", "set_shards"}, {"shards", std::move(arr)}});
}

void ActorRegistry::set_paused(const std::string& shard_key, bool paused) {
    if (is_local(shard_key)) {
        get_or_create(shard_key)->set_paused(paused);
        return;
    }
    send_rpc(shard_key, json::object{{"op", "pause"}, {"paused", paused}});
}

std::vector<std::string> ActorRegistry::shards_of_channel(const std::string& channel_key) const {
    std::set<std::string> shards;
    if (redis_ && redis_->is_connected()) {
        for (auto& s : redis_->get_shards(channel_key)) shards.insert(std::move(s));
    }
    for (const auto& actor : actors()) {
        if (DistributedKey::remove_location_hint(actor->shard_key()) == channel_key) {
            shards.insert(actor->shard_key());
        }
    }
    return std::vector<std::string>(shards.begin(), shards.end());
}

void ActorRegistry::register_shard(const std::string& project_id, const std::string& channel_key,
                                   const std::string& shard_key) {
    net::post(executor_, [this, project_id, channel_key, shard_key]() {
        if (redis_ && redis_->is_connected()) {
            redis_->register_channel_and_shard(project_id, channel_key, shard_key);
        }

        auto shards = shards_of_channel(channel_key);
        for (const auto& shard : shards) {
            try {
                set_shards(shard, shards);
            } catch (const std::exception& e) {
                Log::error(Log::EventType::SHARD_FAILURE, "Shard list push to " + shard + " failed: " + e.what());
            }
        }
    });
}

size_t ActorRegistry::set_project_paused(const std::string& project_id, bool paused) {
    std::set<std::string> channels;
    if (redis_ && redis_->is_connected()) {
        for (auto& c : redis_->get_channels_for_project(project_id)) channels.insert(std::move(c));
    }
    for (const auto& actor : actors()) {
        if (actor->project_id() == project_id) {
            channels.insert(DistributedKey::remove_location_hint(actor->shard_key()));
        }
    }

    size_t addressed = 0;
    for (const auto& channel_key : channels) {
        for (const auto& shard : shards_of_channel(channel_key)) {
            try {
                set_paused(shard, paused);
                addressed++;
            } catch (const std::exception& e) {
                Log::error(Log::EventType::SHARD_FAILURE, "Pause of " + shard + " failed: " + e.what());
            }
        }
    }
    return addressed;
}

void ActorRegistry::dispatch_rpc(const std::string& shard_key, const std::string& payload) {
    json::value rpc;
    try {
        rpc = InputValidator::safe_parse_json(payload, config_.max_json_depth);
    } catch (const std::exception& e) {
        Log::error(Log::EventType::INVALID_INPUT, std::string("Malformed shard RPC: ") + e.what());
        return;
    }
    if (!rpc.is_object()) return;
    const auto& obj = rpc.as_object();

    auto* op = obj.if_contains("op");
    if (!op || !op->is_string()) {
        Log::error(Log::EventType::INVALID_INPUT, "Shard RPC without op");
        return;
    }

    if (op->as_string() == "publish") {
        auto* body = obj.if_contains("publish");
        auto publish = body ? RemotePublish::from_json(*body) : std::nullopt;
        if (!publish) {
            Log::error(Log::EventType::INVALID_INPUT, "Shard RPC publish without a valid message");
            return;
        }
        get_or_create(shard_key)->publish_message(std::move(*publish));
    } else if (op->as_string() == "set_shards") {
        std::vector<std::string> shards;
        if (auto* arr = obj.if_contains("shards"); arr && arr->is_array()) {
            for (const auto& s : arr->as_array()) {
                if (s.is_string()) shards.emplace_back(s.as_string());
            }
        }
        get_or_create(shard_key)->set_shards(std::move(shards));
    } else if (op->as_string() == "pause") {
        auto* paused = obj.if_contains("paused");
        get_or_create(shard_key)->set_paused(paused && paused->is_bool() && paused->as_bool());
    } else {
        Log::error(Log::EventType::INVALID_INPUT, "Unknown shard RPC op");
    }
}

}
