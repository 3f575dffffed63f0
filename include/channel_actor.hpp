#pragma once

#include "channel_storage.hpp"
#include "client_socket.hpp"
#include "grant.hpp"
#include "message_broadcaster.hpp"
#include "message_buffer.hpp"
#include "message_handler.hpp"
#include "sequence_manager.hpp"
#include "server_config.hpp"
#include "shard_manager.hpp"
#include "shard_transport.hpp"
#include "subscription_manager.hpp"
#include "usage_reporter.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace erebus {

// One channel shard: the single-threaded owner of a (project, channel, region)
// keyspace and of the sockets connected to it.
//
// Every public entry point posts onto the actor's strand, so storage
// read-modify-write sequences and the socket list are never touched
// concurrently. All durable state lives in ChannelStorage; a new actor over
// the same storage resumes where the previous one stopped.
class ChannelActor : public BroadcastCoordinator, public std::enable_shared_from_this<ChannelActor> {
public:
    ChannelActor(boost::asio::any_io_executor executor, std::string shard_key,
                 std::shared_ptr<ChannelStorage> storage, const ServerConfig& config,
                 const GrantVerifier& verifier, UsageSink& usage, ShardTransport& transport);

    ChannelActor(const ChannelActor&) = delete;
    ChannelActor& operator=(const ChannelActor&) = delete;

    // Accepts an upgraded socket. The location hint is persisted on first sight.
    void attach(std::shared_ptr<ClientSocket> socket, const std::string& location_hint);
    void on_message(std::shared_ptr<ClientSocket> socket, std::string message);
    void on_close(std::shared_ptr<ClientSocket> socket);

    // Sibling-shard RPCs.
    void publish_message(RemotePublish publish);
    void set_shards(std::vector<std::string> shards);

    void set_paused(bool paused);
    bool paused() const { return handler_.paused(); }

    // Shutdown. Sockets detach through their own close handlers.
    void close_all(WsCloseCode code, const std::string& reason);

    // Read straight from storage; safe from any thread.
    ShardStatus shard_status();

    size_t connection_count() const { return connection_count_.load(); }
    const std::string& shard_key() const { return shard_key_; }
    const std::string& project_id() const { return project_id_; }
    const std::string& channel() const { return channel_; }

    // BroadcastCoordinator. Called by the handler on the strand.
    void broadcast_to_all_shards(MessageBody payload, const std::string& sender_id, const std::string& topic,
                                 const Grant& grant, double t_ingress, double t_enqueued,
                                 ResultHandler done) override;
    void send_presence_update(const std::string& client_id, const std::string& topic,
                              const std::string& project_id, const std::string& channel, bool online) override;

    static constexpr const char* PAUSED_KEY = "paused";

private:
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    std::string shard_key_;
    std::string project_id_;
    std::string channel_;
    std::shared_ptr<ChannelStorage> storage_;
    ShardTransport& transport_;

    SequenceManager sequences_;
    SubscriptionManager subscriptions_;
    MessageBuffer buffer_;
    ShardManager shards_;
    MessageBroadcaster broadcaster_;
    MessageHandler handler_;

    std::vector<std::shared_ptr<ClientSocket>> sockets_;
    std::atomic<size_t> connection_count_{0};

    void load_paused_flag();
};

}
