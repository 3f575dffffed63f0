#include "message_handler.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <algorithm>
#include <type_traits>

namespace erebus {

using Log = SecurityLogger;

MessageHandler::MessageHandler(SubscriptionManager& subscriptions, MessageBuffer& buffer,
                               BroadcastCoordinator& coordinator, const GrantVerifier& verifier, UsageSink& usage,
                               const ServerConfig& config, std::string project_id, std::string channel)
    : subscriptions_(subscriptions)
    , buffer_(buffer)
    , coordinator_(coordinator)
    , verifier_(verifier)
    , usage_(usage)
    , config_(config)
    , project_id_(std::move(project_id))
    , channel_(std::move(channel)) {}

void MessageHandler::handle_message(const std::shared_ptr<ClientSocket>& ws, const std::string& message) {
    const double t_ingress = mono_now_ms();

    if (message == "ping") {
        ws->send_text("pong");
        return;
    }

    if (!InputValidator::is_within_size_limit(message.size(), config_.max_message_size)) {
        Log::log(Log::Level::WARNING, Log::EventType::INVALID_INPUT, ws->remote_address(), "Packet too large");
        close_with_error(ws, WsCloseCode::BadRequest, "Packet too large");
        return;
    }

    InboundPacket packet;
    try {
        packet = PacketCodec::parse(message, config_.max_json_depth);
    } catch (const PacketError& e) {
        Log::log(Log::Level::WARNING, Log::EventType::INVALID_INPUT, ws->remote_address(), e.what());
        close_with_error(ws, WsCloseCode::BadRequest, e.what());
        return;
    }

    try {
        std::visit([&](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, ConnectPacket>) {
                handle_connect(ws, p);
            } else if constexpr (std::is_same_v<T, SubscribePacket>) {
                handle_subscribe(ws, p);
            } else if constexpr (std::is_same_v<T, UnsubscribePacket>) {
                handle_unsubscribe(ws, p);
            } else {
                handle_publish(ws, p, t_ingress);
            }
        }, packet);
    } catch (const std::exception& e) {
        Log::log(Log::Level::ERROR, Log::EventType::LIFECYCLE, ws->remote_address(),
                 std::string("Packet processing failed: ") + e.what());
        close_with_error(ws, WsCloseCode::InternalServerError, "Processing failed");
    }
}

void MessageHandler::handle_connect(const std::shared_ptr<ClientSocket>& ws, const ConnectPacket& packet) {
    auto grant = verifier_.verify(packet.grant_jwt);
    if (!grant) {
        Log::log(Log::Level::WARNING, Log::EventType::AUTH_FAILURE, ws->remote_address(), "Invalid JWT");
        close_with_error(ws, WsCloseCode::BadRequest, "Invalid JWT");
        return;
    }

    // A grant for another project or channel must not touch this shard's keyspace.
    if (grant->project_id != project_id_ || grant->channel != channel_) {
        Log::log(Log::Level::WARNING, Log::EventType::ACCESS_DENIED, ws->remote_address(),
                 "Grant does not match channel");
        close_with_error(ws, WsCloseCode::Forbidden, "Grant does not match channel");
        return;
    }

    ws->set_attachment(grant->serialize());
    Log::log(Log::Level::INFO, Log::EventType::AUTH_SUCCESS, ws->remote_address(),
             "Grant attached for client " + grant->user_id);

    usage_.enqueue(UsageEvent{"websocket.connect", grant->project_id, grant->key_id, 0});
}

void MessageHandler::handle_subscribe(const std::shared_ptr<ClientSocket>& ws, const SubscribePacket& packet) {
    auto grant = valid_grant(ws, "subscribe");
    if (!grant) return;

    const std::string& client_id = grant->user_id;
    const std::string& topic = packet.topic;

    if (subscriptions_.is_subscribed(topic, grant->project_id, grant->channel, client_id)) {
        return;
    }

    if (!grant->has_topic_access(topic)) {
        Log::log(Log::Level::WARNING, Log::EventType::ACCESS_DENIED, ws->remote_address(),
                 "Subscribe denied for topic " + topic);
        return;
    }

    try {
        subscriptions_.subscribe(topic, grant->project_id, grant->channel, client_id);
        send_ack(ws, PacketCodec::subscription_ack(packet.request_id, topic, true));
        usage_.enqueue(UsageEvent{"websocket.subscribe", grant->project_id, grant->key_id, 0});
    } catch (const CapacityError& e) {
        Log::log(Log::Level::WARNING, Log::EventType::CAPACITY_EXCEEDED, ws->remote_address(), e.what());
        MetricsRegistry::instance().increment_counter("erebus_subscribe_capacity_rejected_total");
        close_with_error(ws, WsCloseCode::InternalServerError, "Subscription failed");
        return;
    } catch (const std::exception& e) {
        Log::log(Log::Level::ERROR, Log::EventType::STORAGE_FAILURE, ws->remote_address(),
                 std::string("Subscribe failed: ") + e.what());
        close_with_error(ws, WsCloseCode::InternalServerError, "Subscription failed");
        return;
    }

    try {
        coordinator_.send_presence_update(client_id, topic, grant->project_id, grant->channel, true);
    } catch (const std::exception& e) {
        Log::error(Log::EventType::LIFECYCLE, std::string("Presence update failed: ") + e.what());
    }

    deliver_missed_messages(ws, *grant, topic);
}

void MessageHandler::handle_unsubscribe(const std::shared_ptr<ClientSocket>& ws, const UnsubscribePacket& packet) {
    auto grant = valid_grant(ws, "unsubscribe");
    if (!grant) return;

    try {
        subscriptions_.unsubscribe(packet.topic, grant->project_id, grant->channel, grant->user_id);
        send_ack(ws, PacketCodec::subscription_ack(packet.request_id, packet.topic, false));
        coordinator_.send_presence_update(grant->user_id, packet.topic, grant->project_id, grant->channel, false);
    } catch (const std::exception& e) {
        Log::log(Log::Level::WARNING, Log::EventType::STORAGE_FAILURE, ws->remote_address(),
                 std::string("Unsubscribe failed: ") + e.what());
    }
}

void MessageHandler::handle_publish(const std::shared_ptr<ClientSocket>& ws, const PublishPacket& packet,
                                    double t_ingress) {
    auto grant = valid_grant(ws, "publish");
    if (!grant) return;

    const std::string& client_id = grant->user_id;
    const std::string& topic = packet.topic;

    auto reject = [&](const std::string& code, const std::string& message) {
        MetricsRegistry::instance().increment_counter("erebus_publish_rejected_total", 1.0, {{"code", code}});
        if (packet.ack) {
            send_ack(ws, PacketCodec::publish_error_ack(packet.request_id, topic, packet.client_msg_id, code, message));
        }
    };

    if (!grant->can_write(topic)) {
        Log::log(Log::Level::WARNING, Log::EventType::ACCESS_DENIED, ws->remote_address(),
                 "Publish denied for topic " + topic);
        reject("FORBIDDEN", "Insufficient permissions for topic");
        return;
    }

    if (!subscriptions_.is_subscribed(topic, grant->project_id, grant->channel, client_id)) {
        Log::log(Log::Level::WARNING, Log::EventType::ACCESS_DENIED, ws->remote_address(),
                 "Publish without subscription to " + topic);
        reject("FORBIDDEN", "Must be subscribed to topic before publishing");
        return;
    }

    if (paused_) {
        Log::log(Log::Level::INFO, Log::EventType::ACCESS_DENIED, ws->remote_address(),
                 "Publish dropped, project paused");
        reject("FORBIDDEN", "Project paused");
        return;
    }

    const double t_enqueued = mono_now_ms();
    try {
        coordinator_.broadcast_to_all_shards(
            packet.payload, client_id, topic, *grant, t_ingress, t_enqueued,
            [this, ws, packet, t_ingress](const BroadcastResult& result) {
                if (packet.ack) {
                    send_ack(ws, PacketCodec::publish_ok_ack(packet.request_id, packet.topic, result.server_msg_id,
                                                             packet.client_msg_id, result.seq, t_ingress));
                }
                Log::debug(Log::EventType::LIFECYCLE,
                           "Publish done topic=" + packet.topic + " elapsed=" +
                           std::to_string(mono_now_ms() - t_ingress) + "ms");
            });
    } catch (const std::exception& e) {
        Log::log(Log::Level::ERROR, Log::EventType::STORAGE_FAILURE, ws->remote_address(),
                 std::string("Publish failed: ") + e.what());
        reject("INTERNAL", "Message publishing failed");
    }
}

void MessageHandler::deliver_missed_messages(const std::shared_ptr<ClientSocket>& ws, const Grant& grant,
                                             const std::string& topic) {
    try {
        auto last_seen = buffer_.get_last_seen(grant.project_id, grant.channel, topic, grant.user_id);
        auto messages = buffer_.get_messages_after(grant.project_id, grant.channel, topic, last_seen);
        if (messages.empty()) return;

        // Replay follows the fan-out scope rules: curious sockets get the info payload once,
        // sockets without read scope get nothing.
        if (grant.is_curious(topic)) {
            if (ws->is_open()) ws->send_text(CURIOSITY_PAYLOAD);
            return;
        }
        if (!grant.can_read(topic)) return;

        std::optional<std::string> last_delivered;
        for (const auto& m : messages) {
            if (!ws->is_open()) break;
            ws->send_text(m.serialize());
            last_delivered = m.seq;
        }

        if (last_delivered) {
            buffer_.update_last_seen_single(grant.project_id, grant.channel, topic, grant.user_id, *last_delivered);
            Log::debug(Log::EventType::LIFECYCLE,
                       "Catch-up delivered up to " + *last_delivered + " for " + grant.user_id);
        }
    } catch (const std::exception& e) {
        Log::log(Log::Level::ERROR, Log::EventType::STORAGE_FAILURE, ws->remote_address(),
                 std::string("Catch-up failed: ") + e.what());
    }
}

std::optional<Grant> MessageHandler::valid_grant(const std::shared_ptr<ClientSocket>& ws, const char* operation) {
    auto grant = attached_grant(*ws);
    if (!grant) {
        Log::log(Log::Level::WARNING, Log::EventType::AUTH_FAILURE, ws->remote_address(),
                 std::string(operation) + " without a valid grant");
        close_with_error(ws, WsCloseCode::BadRequest, "Invalid grant");
    }
    return grant;
}

void MessageHandler::close_with_error(const std::shared_ptr<ClientSocket>& ws, WsCloseCode code,
                                      const std::string& reason) {
    try {
        if (ws->is_open()) ws->close(code, reason);
    } catch (const std::exception& e) {
        Log::error(Log::EventType::LIFECYCLE, std::string("Close failed: ") + e.what());
    }
}

void MessageHandler::send_ack(const std::shared_ptr<ClientSocket>& ws, const boost::json::object& ack) {
    try {
        if (ws->is_open()) ws->send_text(boost::json::serialize(ack));
    } catch (const std::exception& e) {
        Log::error(Log::EventType::LIFECYCLE, std::string("Ack send failed: ") + e.what());
    }
}

void MessageHandler::handle_close(const std::shared_ptr<ClientSocket>& ws) {
    auto grant = attached_grant(*ws);
    if (!grant) return;

    std::vector<std::string> topics;
    std::vector<std::string> was_subscribed;
    for (const auto& t : grant->topics) {
        topics.push_back(t.topic);
        try {
            auto subs = subscriptions_.get_subscribers(t.topic, grant->project_id, grant->channel);
            if (std::find(subs.begin(), subs.end(), grant->user_id) != subs.end()) {
                was_subscribed.push_back(t.topic);
            }
        } catch (const std::exception& e) {
            Log::error(Log::EventType::STORAGE_FAILURE, std::string("Subscriber lookup failed: ") + e.what());
        }
    }

    subscriptions_.bulk_unsubscribe(grant->user_id, grant->project_id, grant->channel, topics);

    for (const auto& topic : was_subscribed) {
        try {
            coordinator_.send_presence_update(grant->user_id, topic, grant->project_id, grant->channel, false);
        } catch (const std::exception& e) {
            Log::error(Log::EventType::LIFECYCLE, std::string("Presence update failed: ") + e.what());
        }
    }
}

}
