#pragma once

#include "pubsub_types.hpp"
#include <boost/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace erebus {

// A message accepted by one shard and replicated to a sibling shard of the same channel.
struct RemotePublish {
    MessageBody message;
    std::string sender_id;
    std::vector<std::string> subscriber_ids;
    std::string project_id;
    std::optional<std::string> key_id;
    std::string channel;
    std::string topic;
    std::string seq;

    boost::json::object to_json() const {
        boost::json::object obj;
        obj["message"] = message.to_json();
        obj["senderId"] = sender_id;
        boost::json::array subs;
        for (const auto& s : subscriber_ids) subs.emplace_back(s);
        obj["subscriberIds"] = std::move(subs);
        obj["projectId"] = project_id;
        if (key_id) obj["keyId"] = *key_id;
        obj["channelName"] = channel;
        obj["topic"] = topic;
        obj["seq"] = seq;
        return obj;
    }

    static std::optional<RemotePublish> from_json(const boost::json::value& v) {
        if (!v.is_object()) return std::nullopt;
        const auto& obj = v.as_object();

        auto* msg = obj.if_contains("message");
        if (!msg) return std::nullopt;
        auto body = MessageBody::from_json(*msg);
        if (!body) return std::nullopt;

        auto str = [&](const char* key) -> std::optional<std::string> {
            auto* f = obj.if_contains(key);
            if (!f || !f->is_string()) return std::nullopt;
            return std::string(f->as_string());
        };

        RemotePublish p;
        p.message = std::move(*body);
        auto sender = str("senderId");
        auto project = str("projectId");
        auto channel = str("channelName");
        auto topic = str("topic");
        auto seq = str("seq");
        if (!sender || !project || !channel || !topic || !seq) return std::nullopt;
        p.sender_id = *sender;
        p.project_id = *project;
        p.channel = *channel;
        p.topic = *topic;
        p.seq = *seq;
        p.key_id = str("keyId");

        if (auto* subs = obj.if_contains("subscriberIds"); subs && subs->is_array()) {
            for (const auto& s : subs->as_array()) {
                if (s.is_string()) p.subscriber_ids.emplace_back(s.as_string());
            }
        }
        return p;
    }
};

// Addresses a channel shard by its 5-segment key, local or not.
// Calls are fire-and-forget; implementations throw when the request cannot be handed off.
class ShardTransport {
public:
    virtual ~ShardTransport() = default;

    virtual void publish_message(const std::string& shard_key, const RemotePublish& publish) = 0;
    virtual void set_shards(const std::string& shard_key, const std::vector<std::string>& shards) = 0;
};

}
