#pragma once

#include "client_socket.hpp"
#include "grant.hpp"
#include "message_buffer.hpp"
#include "packets.hpp"
#include "server_config.hpp"
#include "subscription_manager.hpp"
#include "usage_reporter.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace erebus {

struct BroadcastResult {
    std::string seq;
    std::string server_msg_id;
};

// Implemented by the channel actor: sequencing, local fan-out and replication to sibling shards.
class BroadcastCoordinator {
public:
    using ResultHandler = std::function<void(const BroadcastResult&)>;

    virtual ~BroadcastCoordinator() = default;

    /**
     * Sequences and publishes an authorized message.
     * Throws if the sequence cursor cannot be advanced; nothing was published then.
     * done fires once the local fan-out and its persistence have finished.
     */
    virtual void broadcast_to_all_shards(MessageBody payload, const std::string& sender_id, const std::string& topic,
                                         const Grant& grant, double t_ingress, double t_enqueued,
                                         ResultHandler done) = 0;

    // online=true after a new subscription, false after unsubscribe or disconnect.
    virtual void send_presence_update(const std::string& client_id, const std::string& topic,
                                      const std::string& project_id, const std::string& channel, bool online) = 0;
};

// Per-connection protocol state machine. The only state is the grant attached
// to the socket: without one, every packet but "connect" closes the connection.
class MessageHandler {
public:
    MessageHandler(SubscriptionManager& subscriptions, MessageBuffer& buffer, BroadcastCoordinator& coordinator,
                   const GrantVerifier& verifier, UsageSink& usage, const ServerConfig& config,
                   std::string project_id, std::string channel);

    void handle_message(const std::shared_ptr<ClientSocket>& ws, const std::string& message);

    // Disconnect cleanup: unsubscribes the client from every topic listed in its grant.
    void handle_close(const std::shared_ptr<ClientSocket>& ws);

    void set_paused(bool paused) { paused_ = paused; }
    bool paused() const { return paused_; }

private:
    SubscriptionManager& subscriptions_;
    MessageBuffer& buffer_;
    BroadcastCoordinator& coordinator_;
    const GrantVerifier& verifier_;
    UsageSink& usage_;
    const ServerConfig& config_;
    std::string project_id_;
    std::string channel_;
    std::atomic<bool> paused_{false};

    void handle_connect(const std::shared_ptr<ClientSocket>& ws, const ConnectPacket& packet);
    void handle_subscribe(const std::shared_ptr<ClientSocket>& ws, const SubscribePacket& packet);
    void handle_unsubscribe(const std::shared_ptr<ClientSocket>& ws, const UnsubscribePacket& packet);
    void handle_publish(const std::shared_ptr<ClientSocket>& ws, const PublishPacket& packet, double t_ingress);

    void deliver_missed_messages(const std::shared_ptr<ClientSocket>& ws, const Grant& grant,
                                 const std::string& topic);

    std::optional<Grant> valid_grant(const std::shared_ptr<ClientSocket>& ws, const char* operation);
    void close_with_error(const std::shared_ptr<ClientSocket>& ws, WsCloseCode code, const std::string& reason);
    void send_ack(const std::shared_ptr<ClientSocket>& ws, const boost::json::object& ack);
};

}
