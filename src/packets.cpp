#include "packets.hpp"
#include "input_validator.hpp"
#include "random_id.hpp"

namespace erebus {

namespace {

std::optional<std::string> optional_string(const boost::json::object& obj, const char* key) {
    auto* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_string()) throw PacketError("Invalid packet format");
    return std::string(v->as_string());
}

std::string required_topic(const std::optional<std::string>& topic) {
    if (!topic || !InputValidator::is_valid_key_segment(*topic, PacketCodec::MAX_TOPIC_LENGTH)) {
        throw PacketError("Invalid packet format");
    }
    return *topic;
}

boost::json::object ack_envelope(const std::optional<std::string>& request_id,
                                 const std::optional<std::string>& client_msg_id, boost::json::object type) {
    boost::json::object ack;
    ack["packetType"] = "ack";
    if (request_id) ack["requestId"] = *request_id;
    if (client_msg_id) ack["clientMsgId"] = *client_msg_id;
    ack["type"] = std::move(type);
    return ack;
}

}

InboundPacket PacketCodec::parse(const std::string& text, size_t max_depth) {
    boost::json::value root;
    try {
        root = InputValidator::safe_parse_json(text, max_depth);
    } catch (const std::exception&) {
        throw PacketError("Invalid JSON");
    }
    if (!root.is_object()) throw PacketError("Invalid packet format");

    const auto& obj = root.as_object();
    auto* type = obj.if_contains("packetType");
    if (!type || !type->is_string()) throw PacketError("Invalid packet format");
    const std::string packet_type(type->as_string());

    if (packet_type == "connect") {
        auto jwt = optional_string(obj, "grantJWT");
        if (!jwt || jwt->empty()) throw PacketError("Invalid packet format");
        return ConnectPacket{*jwt};
    }

    if (packet_type == "subscribe") {
        return SubscribePacket{optional_string(obj, "requestId"), required_topic(optional_string(obj, "topic"))};
    }

    if (packet_type == "unsubscribe") {
        return UnsubscribePacket{optional_string(obj, "requestId"), required_topic(optional_string(obj, "topic"))};
    }

    if (packet_type == "publish") {
        auto* payload = obj.if_contains("payload");
        if (!payload || !payload->is_object()) throw PacketError("Invalid packet format");
        const auto& body = payload->as_object();

        PublishPacket p;
        p.request_id = optional_string(obj, "requestId");
        p.client_msg_id = optional_string(obj, "clientMsgId");

        auto topic = optional_string(obj, "topic");
        if (!topic) topic = optional_string(body, "topic");
        p.topic = required_topic(topic);

        auto text_payload = optional_string(body, "payload");
        if (!text_payload) throw PacketError("Invalid packet format");
        p.payload.payload = *text_payload;
        p.payload.topic = p.topic;
        p.payload.client_msg_id = optional_string(body, "clientMsgId");
        if (!p.payload.client_msg_id) p.payload.client_msg_id = p.client_msg_id;
        if (auto* ts = body.if_contains("clientPublishTs"); ts && ts->is_number()) {
            p.payload.client_publish_ts = ts->to_number<double>();
        }

        if (auto* ack = obj.if_contains("ack"); ack && ack->is_bool()) {
            p.ack = ack->as_bool();
        }
        return p;
    }

    throw PacketError("Unknown packet type");
}

boost::json::object PacketCodec::subscription_ack(const std::optional<std::string>& request_id,
                                                  const std::string& topic, bool subscribed) {
    boost::json::object type;
    type["type"] = "ack";
    type["path"] = subscribed ? "subscribe" : "unsubscribe";
    type["seq"] = RandomId::uuid();
    type["serverAssignedId"] = RandomId::uuid();
    type["clientMsgId"] = request_id ? *request_id : RandomId::uuid();
    type["topic"] = topic;
    type["result"] = boost::json::object{{"ok", true}, {"status", subscribed ? "subscribed" : "unsubscribed"}};
    return ack_envelope(request_id, request_id, std::move(type));
}

boost::json::object PacketCodec::publish_ok_ack(const std::optional<std::string>& request_id,
                                                const std::string& topic, const std::string& server_msg_id,
                                                const std::optional<std::string>& client_msg_id,
                                                const std::string& seq, double t_ingress) {
    boost::json::object type;
    type["type"] = "ack";
    type["path"] = "publish";
    type["seq"] = seq;
    type["serverAssignedId"] = server_msg_id;
    if (client_msg_id) type["clientMsgId"] = *client_msg_id;
    type["topic"] = topic;
    type["result"] = boost::json::object{{"ok", true}, {"t_ingress", t_ingress}};
    return ack_envelope(request_id, client_msg_id, std::move(type));
}

boost::json::object PacketCodec::publish_error_ack(const std::optional<std::string>& request_id,
                                                   const std::string& topic,
                                                   const std::optional<std::string>& client_msg_id,
                                                   const std::string& code, const std::string& message) {
    boost::json::object type;
    type["type"] = "ack";
    type["path"] = "publish";
    type["seq"] = NO_SEQUENCE;
    type["serverAssignedId"] = RandomId::uuid();
    if (client_msg_id) type["clientMsgId"] = *client_msg_id;
    type["topic"] = topic;
    type["result"] = boost::json::object{{"ok", false}, {"code", code}, {"message", message}};
    return ack_envelope(request_id, client_msg_id, std::move(type));
}

boost::json::object PacketCodec::presence(const std::string& client_id, const std::string& topic, bool online,
                                          int64_t timestamp_ms) {
    boost::json::object p;
    p["packetType"] = "presence";
    p["clientId"] = client_id;
    p["topic"] = topic;
    p["status"] = online ? "online" : "offline";
    p["timestamp"] = timestamp_ms;
    return p;
}

}
