#pragma once

#include "channel_storage.hpp"
#include <map>
#include <string>
#include <vector>

namespace erebus {

// Per-topic subscriber lists, stored as JSON arrays in insertion order.
// A subscription to "*" is kept under the literal "*" key and is never expanded.
class SubscriptionManager {
public:
    explicit SubscriptionManager(ChannelStorage& storage);

    // Idempotent. Throws CapacityError when the topic already holds the maximum number of clients.
    void subscribe(const std::string& topic, const std::string& project_id, const std::string& channel,
                   const std::string& client_id);

    void unsubscribe(const std::string& topic, const std::string& project_id, const std::string& channel,
                     const std::string& client_id);

    // True if the client is on the topic's list or on the wildcard list.
    bool is_subscribed(const std::string& topic, const std::string& project_id, const std::string& channel,
                       const std::string& client_id);

    std::vector<std::string> get_subscribers(const std::string& topic, const std::string& project_id,
                                             const std::string& channel);

    // Disconnect cleanup. Each topic is removed independently; failures are logged and skipped.
    void bulk_unsubscribe(const std::string& client_id, const std::string& project_id,
                          const std::string& channel, const std::vector<std::string>& topics);

    std::map<std::string, size_t> get_subscriber_counts(const std::string& project_id, const std::string& channel,
                                                        const std::vector<std::string>& topics);
    std::vector<std::string> get_active_topics(const std::string& project_id, const std::string& channel);
    size_t get_total_subscription_count(const std::string& project_id, const std::string& channel);

    static std::vector<std::string> decode_list(const std::optional<std::string>& raw);
    static std::string encode_list(const std::vector<std::string>& ids);

private:
    ChannelStorage& storage_;
};

}
