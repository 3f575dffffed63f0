#pragma once

#include "pubsub_types.hpp"
#include "grant.hpp"
#include <string>
#include <optional>

namespace erebus {

// The view of a WebSocket connection the channel services work against.
// WebSocketSession implements it for real peers.
class ClientSocket {
public:
    virtual ~ClientSocket() = default;

    virtual void send_text(const std::string& message) = 0;
    virtual void close(WsCloseCode code, const std::string& reason) = 0;
    virtual bool is_open() const = 0;

    // Bytes queued for writing but not yet flushed to the peer.
    virtual size_t buffered_amount() const = 0;

    // Serialized per-connection state (the grant). Survives for the life of the socket.
    virtual void set_attachment(const std::string& data) = 0;
    virtual std::optional<std::string> attachment() const = 0;

    virtual std::string remote_address() const = 0;
};

// Grant attached at connect time, or nullopt if none or unparseable.
inline std::optional<Grant> attached_grant(const ClientSocket& socket) {
    auto raw = socket.attachment();
    if (!raw) return std::nullopt;
    return Grant::parse(*raw);
}

}
