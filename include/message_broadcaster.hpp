#pragma once

#include "client_socket.hpp"
#include "message_buffer.hpp"
#include "server_config.hpp"
#include "usage_reporter.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace erebus {

struct PublishParams {
    MessageBody message;
    std::string sender_id;
    std::vector<std::string> subscriber_ids;
    std::string project_id;
    std::optional<std::string> key_id;
    std::string channel;
    std::string topic;
    std::string seq;
};

// Local fan-out of one message to the sockets of a channel shard.
//
// Runs on the shard's strand. Sockets are processed in batches and the job
// re-posts itself between batches (and before a send to a moderately
// backed-up socket) so other work queued on the strand can run in between.
// After the fan-out the message is buffered, last-seen cursors of every
// subscriber are advanced and a usage event is emitted.
class MessageBroadcaster {
public:
    using Sockets = std::vector<std::shared_ptr<ClientSocket>>;
    using Completion = std::function<void(const BroadcastMetrics&)>;

    MessageBroadcaster(boost::asio::any_io_executor executor, MessageBuffer& buffer, UsageSink& usage,
                       ServerConfig::Broadcast config);

    // done fires after the background persistence tasks have run.
    void publish_message(PublishParams params, Sockets sockets, Completion done = nullptr);

    /**
     * Sends a presence packet to open sockets whose client is in subscribers.
     * Sockets of self_client_id receive the packet enriched with the subscriber list.
     */
    void broadcast_presence(const boost::json::object& packet, const std::optional<std::string>& self_client_id,
                            const std::vector<std::string>& subscribers, Sockets sockets);

private:
    enum class Outcome { Sent, Skipped, HighBackpressure, Duplicate, Error, Yield };

    struct FanoutJob {
        PublishParams params;
        Sockets sockets;
        std::string serialized;
        std::unordered_set<std::string> subscribers;
        std::set<std::string> sent_to;
        BroadcastMetrics metrics;
        size_t index = 0;
        size_t batch_end = 0;
        bool resume_send = false;
        double started = 0;
        Completion done;
    };

    struct PresenceJob {
        Sockets sockets;
        std::string generic;
        std::string self_variant;
        std::unordered_set<std::string> members;
        std::optional<std::string> self_client_id;
        size_t index = 0;
        bool resume_send = false;
    };

    boost::asio::any_io_executor executor_;
    MessageBuffer& buffer_;
    UsageSink& usage_;
    ServerConfig::Broadcast config_;

    void run_batch(std::shared_ptr<FanoutJob> job);
    Outcome deliver(FanoutJob& job, ClientSocket& socket);
    void finish(std::shared_ptr<FanoutJob> job);
    void run_background_tasks(std::shared_ptr<FanoutJob> job);
    void run_presence_batch(std::shared_ptr<PresenceJob> job);
};

}
