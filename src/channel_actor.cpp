#include "channel_actor.hpp"
#include "distributed_key.hpp"
#include "metrics.hpp"
#include "packets.hpp"
#include "random_id.hpp"
#include "security_logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace net = boost::asio;

namespace erebus {

using Log = SecurityLogger;

ChannelActor::ChannelActor(net::any_io_executor executor, std::string shard_key,
                           std::shared_ptr<ChannelStorage> storage, const ServerConfig& config,
                           const GrantVerifier& verifier, UsageSink& usage, ShardTransport& transport)
    : strand_(net::make_strand(executor))
    , shard_key_(std::move(shard_key))
    , project_id_(DistributedKey::parse(shard_key_).project_id)
    , channel_(DistributedKey::parse(shard_key_).resource)
    , storage_(std::move(storage))
    , transport_(transport)
    , sequences_(*storage_)
    , subscriptions_(*storage_)
    , buffer_(*storage_, config.message_ttl_ms)
    , shards_(*storage_)
    , broadcaster_(strand_, buffer_, usage, config.broadcast)
    , handler_(subscriptions_, buffer_, *this, verifier, usage, config, project_id_, channel_) {
    load_paused_flag();
}

void ChannelActor::load_paused_flag() {
    try {
        auto v = storage_->get(PAUSED_KEY);
        handler_.set_paused(v && *v == "1");
    } catch (const std::exception& e) {
        Log::error(Log::EventType::STORAGE_FAILURE,
                   "Could not read pause flag of " + shard_key_ + ": " + e.what());
    }
}

void ChannelActor::attach(std::shared_ptr<ClientSocket> socket, const std::string& location_hint) {
    net::post(strand_, [self = shared_from_this(), socket = std::move(socket), location_hint]() {
        if (!location_hint.empty()) {
            try {
                auto stored = self->shards_.get_location_hint();
                if (!stored || *stored != location_hint) {
                    self->shards_.set_location_hint(location_hint);
                }
            } catch (const std::exception& e) {
                Log::error(Log::EventType::STORAGE_FAILURE, std::string("Location hint update failed: ") + e.what());
            }
        }

        self->sockets_.push_back(socket);
        self->connection_count_++;
        MetricsRegistry::instance().increment_gauge("erebus_active_connections");
        Log::log(Log::Level::INFO, Log::EventType::LIFECYCLE, socket->remote_address(),
                 "Attached to " + self->shard_key_);
    });
}

void ChannelActor::on_message(std::shared_ptr<ClientSocket> socket, std::string message) {
    net::post(strand_, [self = shared_from_this(), socket = std::move(socket), message = std::move(message)]() {
        self->handler_.handle_message(socket, message);
    });
}

void ChannelActor::on_close(std::shared_ptr<ClientSocket> socket) {
    net::post(strand_, [self = shared_from_this(), socket = std::move(socket)]() {
        auto& sockets = self->sockets_;
        auto it = std::find(sockets.begin(), sockets.end(), socket);
        if (it == sockets.end()) return;
        sockets.erase(it);
        self->connection_count_--;
        MetricsRegistry::instance().decrement_gauge("erebus_active_connections");

        self->handler_.handle_close(socket);
    });
}

void ChannelActor::publish_message(RemotePublish publish) {
    net::post(strand_, [self = shared_from_this(), publish = std::move(publish)]() mutable {
        // The accepting shard only knows its own subscribers; merge in ours.
        std::vector<std::string> subscribers = std::move(publish.subscriber_ids);
        try {
            auto local = self->subscriptions_.get_subscribers(publish.topic, publish.project_id, publish.channel);
            std::unordered_set<std::string> seen(subscribers.begin(), subscribers.end());
            for (auto& id : local) {
                if (seen.insert(id).second) subscribers.push_back(std::move(id));
            }
        } catch (const std::exception& e) {
            Log::error(Log::EventType::STORAGE_FAILURE, std::string("Local subscriber lookup failed: ") + e.what());
        }

        PublishParams params;
        params.message = std::move(publish.message);
        params.sender_id = std::move(publish.sender_id);
        params.subscriber_ids = std::move(subscribers);
        params.project_id = std::move(publish.project_id);
        params.key_id = std::move(publish.key_id);
        params.channel = std::move(publish.channel);
        params.topic = std::move(publish.topic);
        params.seq = std::move(publish.seq);
        self->broadcaster_.publish_message(std::move(params), self->sockets_);
    });
}

void ChannelActor::set_shards(std::vector<std::string> shards) {
    net::post(strand_, [self = shared_from_this(), shards = std::move(shards)]() {
        try {
            self->shards_.set_shards_in_local_storage(shards);
        } catch (const std::exception& e) {
            Log::error(Log::EventType::STORAGE_FAILURE,
                       "Shard list update for " + self->shard_key_ + " failed: " + e.what());
        }
    });
}

void ChannelActor::set_paused(bool paused) {
    handler_.set_paused(paused);
    net::post(strand_, [self = shared_from_this(), paused]() {
        try {
            if (paused) {
                self->storage_->put(PAUSED_KEY, "1");
            } else {
                self->storage_->del(PAUSED_KEY);
            }
        } catch (const std::exception& e) {
            Log::error(Log::EventType::STORAGE_FAILURE, std::string("Pause flag write failed: ") + e.what());
        }
        std::cout << "[*] Shard " << self->shard_key_ << (paused ? " paused" : " resumed") << "\n";
    });
}

void ChannelActor::close_all(WsCloseCode code, const std::string& reason) {
    net::post(strand_, [self = shared_from_this(), code, reason]() {
        for (auto& socket : self->sockets_) {
            socket->close(code, reason);
        }
    });
}

ShardStatus ChannelActor::shard_status() {
    try {
        return shards_.get_shard_status();
    } catch (const std::exception& e) {
        Log::error(Log::EventType::STORAGE_FAILURE, std::string("Shard status read failed: ") + e.what());
        return ShardStatus{};
    }
}

void ChannelActor::broadcast_to_all_shards(MessageBody payload, const std::string& sender_id,
                                           const std::string& topic, const Grant& grant, double t_ingress,
                                           double t_enqueued, ResultHandler done) {
    // A publish without a sequence must not go anywhere; let the handler report it.
    std::string seq = sequences_.generate_sequence(grant.project_id, grant.channel, topic);

    std::vector<std::string> remote_shards;
    try {
        remote_shards = shards_.get_remote_shards();
    } catch (const std::exception& e) {
        Log::error(Log::EventType::STORAGE_FAILURE, std::string("Shard list read failed: ") + e.what());
    }

    std::vector<std::string> subscribers;
    try {
        subscribers = subscriptions_.get_subscribers(topic, grant.project_id, grant.channel);
    } catch (const std::exception& e) {
        Log::error(Log::EventType::STORAGE_FAILURE, std::string("Subscriber read failed: ") + e.what());
    }

    MessageBody message = std::move(payload);
    message.id = RandomId::uuid();
    message.topic = topic;
    message.sender_id = sender_id;
    message.seq = seq;
    message.sent_at = iso8601_utc(wall_from_mono_ms(t_ingress));
    message.t_ingress = t_ingress;
    message.t_enqueued = t_enqueued;
    message.t_broadcast_begin = mono_now_ms();

    BroadcastResult result{seq, message.id};

    RemotePublish remote;
    if (!remote_shards.empty()) {
        remote.message = message;
        remote.sender_id = sender_id;
        remote.subscriber_ids = subscribers;
        remote.project_id = grant.project_id;
        remote.key_id = grant.key_id;
        remote.channel = grant.channel;
        remote.topic = topic;
        remote.seq = seq;
    }

    PublishParams params;
    params.message = std::move(message);
    params.sender_id = sender_id;
    params.subscriber_ids = std::move(subscribers);
    params.project_id = grant.project_id;
    params.key_id = grant.key_id;
    params.channel = grant.channel;
    params.topic = topic;
    params.seq = seq;

    broadcaster_.publish_message(std::move(params), sockets_,
                                 [done = std::move(done), result](const BroadcastMetrics&) {
                                     if (done) done(result);
                                 });

    for (const auto& shard : remote_shards) {
        try {
            transport_.publish_message(shard, remote);
        } catch (const std::exception& e) {
            Log::error(Log::EventType::SHARD_FAILURE, "Replication to " + shard + " failed: " + e.what());
            MetricsRegistry::instance().increment_counter("erebus_shard_replication_failed_total", 1.0,
                                                          {{"region", shard.substr(shard.rfind(':') + 1)}});
        }
    }
}

void ChannelActor::send_presence_update(const std::string& client_id, const std::string& topic,
                                        const std::string& project_id, const std::string& channel, bool online) {
    std::vector<std::string> subscribers;
    try {
        subscribers = subscriptions_.get_subscribers(topic, project_id, channel);
    } catch (const std::exception& e) {
        Log::error(Log::EventType::STORAGE_FAILURE, std::string("Presence subscriber read failed: ") + e.what());
        return;
    }
    if (subscribers.empty()) return;

    auto packet = PacketCodec::presence(client_id, topic, online, wall_now_ms());
    std::optional<std::string> self_id;
    if (online) self_id = client_id;
    broadcaster_.broadcast_presence(packet, self_id, subscribers, sockets_);
}

}
