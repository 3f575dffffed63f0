#pragma once

#include "pubsub_types.hpp"
#include <boost/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace erebus {

// Malformed or unknown inbound packet. what() is the close reason sent to the peer.
class PacketError : public std::runtime_error {
public:
    explicit PacketError(const std::string& what) : std::runtime_error(what) {}
};

struct ConnectPacket {
    std::string grant_jwt;
};

struct SubscribePacket {
    std::optional<std::string> request_id;
    std::string topic;
};

struct UnsubscribePacket {
    std::optional<std::string> request_id;
    std::string topic;
};

struct PublishPacket {
    std::optional<std::string> request_id;
    std::string topic;
    MessageBody payload;  // only payload and client correlation fields are trusted
    std::optional<std::string> client_msg_id;
    bool ack = false;
};

using InboundPacket = std::variant<ConnectPacket, SubscribePacket, UnsubscribePacket, PublishPacket>;

class PacketCodec {
public:
    static constexpr size_t MAX_TOPIC_LENGTH = 256;

    // Throws PacketError ("Invalid JSON", "Invalid packet format", "Unknown packet type").
    static InboundPacket parse(const std::string& text, size_t max_depth = 16);

    static boost::json::object subscription_ack(const std::optional<std::string>& request_id,
                                                const std::string& topic, bool subscribed);

    static boost::json::object publish_ok_ack(const std::optional<std::string>& request_id,
                                              const std::string& topic, const std::string& server_msg_id,
                                              const std::optional<std::string>& client_msg_id,
                                              const std::string& seq, double t_ingress);

    static boost::json::object publish_error_ack(const std::optional<std::string>& request_id,
                                                 const std::string& topic,
                                                 const std::optional<std::string>& client_msg_id,
                                                 const std::string& code, const std::string& message);

    static boost::json::object presence(const std::string& client_id, const std::string& topic, bool online,
                                        int64_t timestamp_ms);
};

}
