#pragma once

#include "server_config.hpp"
#include <boost/json.hpp>
#include <boost/asio/ssl/context.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace erebus {

struct UsageEvent {
    std::string event;  // websocket.connect | websocket.subscribe | websocket.message
    std::string project_id;
    std::optional<std::string> key_id;
    size_t payload_length = 0;

    // {"packetType":"usage","payload":{"event":...,"data":{...}}}
    boost::json::object to_envelope() const;
};

// Fire-and-forget usage accounting. Channel services only enqueue.
class UsageSink {
public:
    virtual ~UsageSink() = default;
    virtual void enqueue(UsageEvent event) = 0;
};

// Queues usage events and forwards them to {webhook_base_url}/api/v1/webhooks/usage
// from a background worker. Delivery failures are logged and dropped.
class UsageReporter : public UsageSink {
public:
    explicit UsageReporter(const ServerConfig& config);
    ~UsageReporter();

    UsageReporter(const UsageReporter&) = delete;
    UsageReporter& operator=(const UsageReporter&) = delete;

    void start();
    void stop();

    void enqueue(UsageEvent event) override;

    bool enabled() const { return endpoint_.has_value(); }
    size_t pending() const;

    struct Endpoint {
        bool tls = false;
        std::string host;
        std::string port;
        std::string target;
    };

    // Parses "http(s)://host[:port][/base]" and appends the usage webhook path.
    static std::optional<Endpoint> parse_endpoint(const std::string& base_url);

    // One POST to the webhook. False on any failure, non-2xx status or timeout.
    bool post(const std::string& body);

private:
    const ServerConfig& config_;
    std::optional<Endpoint> endpoint_;
    boost::asio::ssl::context ssl_ctx_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<UsageEvent> queue_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    void worker_loop();

    static constexpr size_t MAX_QUEUE = 100000;
};

}
