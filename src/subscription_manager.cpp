#include "subscription_manager.hpp"
#include "pubsub_types.hpp"
#include "security_logger.hpp"
#include <boost/json.hpp>
#include <algorithm>

namespace erebus {

SubscriptionManager::SubscriptionManager(ChannelStorage& storage) : storage_(storage) {}

std::vector<std::string> SubscriptionManager::decode_list(const std::optional<std::string>& raw) {
    std::vector<std::string> ids;
    if (!raw || raw->empty()) return ids;
    try {
        auto v = boost::json::parse(*raw);
        if (!v.is_array()) return ids;
        for (const auto& item : v.as_array()) {
            if (item.is_string()) ids.emplace_back(item.as_string());
        }
    } catch (const std::exception& e) {
        SecurityLogger::error(SecurityLogger::EventType::STORAGE_FAILURE,
                              "Corrupt subscriber list: " + std::string(e.what()));
    }
    return ids;
}

std::string SubscriptionManager::encode_list(const std::vector<std::string>& ids) {
    boost::json::array arr;
    for (const auto& id : ids) arr.emplace_back(id);
    return boost::json::serialize(arr);
}

void SubscriptionManager::subscribe(const std::string& topic, const std::string& project_id,
                                    const std::string& channel, const std::string& client_id) {
    const std::string key = storage_keys::subscribers(project_id, channel, topic);

    storage_.transaction([&](StorageTransaction& txn) {
        auto ids = decode_list(txn.get(key));
        if (ids.size() >= MAX_SUBSCRIBERS_PER_TOPIC) {
            throw CapacityError("Subscriber capacity exceeded for topic " + topic);
        }
        if (std::find(ids.begin(), ids.end(), client_id) != ids.end()) return;
        ids.push_back(client_id);
        txn.put(key, encode_list(ids));
    });
}

void SubscriptionManager::unsubscribe(const std::string& topic, const std::string& project_id,
                                      const std::string& channel, const std::string& client_id) {
    const std::string key = storage_keys::subscribers(project_id, channel, topic);

    storage_.transaction([&](StorageTransaction& txn) {
        auto ids = decode_list(txn.get(key));
        auto it = std::remove(ids.begin(), ids.end(), client_id);
        if (it == ids.end()) return;
        ids.erase(it, ids.end());
        if (ids.empty()) {
            txn.del(key);
        } else {
            txn.put(key, encode_list(ids));
        }
    });
}

bool SubscriptionManager::is_subscribed(const std::string& topic, const std::string& project_id,
                                        const std::string& channel, const std::string& client_id) {
    auto contains = [&](const std::string& t) {
        auto ids = decode_list(storage_.get(storage_keys::subscribers(project_id, channel, t)));
        return std::find(ids.begin(), ids.end(), client_id) != ids.end();
    };
    if (contains(topic)) return true;
    return topic != WILDCARD_TOPIC && contains(WILDCARD_TOPIC);
}

std::vector<std::string> SubscriptionManager::get_subscribers(const std::string& topic, const std::string& project_id,
                                                              const std::string& channel) {
    return decode_list(storage_.get(storage_keys::subscribers(project_id, channel, topic)));
}

void SubscriptionManager::bulk_unsubscribe(const std::string& client_id, const std::string& project_id,
                                           const std::string& channel, const std::vector<std::string>& topics) {
    for (const auto& topic : topics) {
        try {
            unsubscribe(topic, project_id, channel, client_id);
        } catch (const std::exception& e) {
            SecurityLogger::error(SecurityLogger::EventType::STORAGE_FAILURE,
                                  "Bulk unsubscribe failed for topic " + topic + ": " + e.what());
        }
    }
}

std::map<std::string, size_t> SubscriptionManager::get_subscriber_counts(const std::string& project_id,
                                                                         const std::string& channel,
                                                                         const std::vector<std::string>& topics) {
    std::map<std::string, size_t> counts;
    for (const auto& topic : topics) {
        counts[topic] = get_subscribers(topic, project_id, channel).size();
    }
    return counts;
}

std::vector<std::string> SubscriptionManager::get_active_topics(const std::string& project_id,
                                                                const std::string& channel) {
    const std::string prefix = storage_keys::subscribers_prefix(project_id, channel);
    std::vector<std::string> topics;
    for (const auto& [key, value] : storage_.list(prefix, 0)) {
        if (!decode_list(value).empty()) {
            topics.push_back(key.substr(prefix.size()));
        }
    }
    return topics;
}

size_t SubscriptionManager::get_total_subscription_count(const std::string& project_id, const std::string& channel) {
    size_t total = 0;
    for (const auto& [key, value] : storage_.list(storage_keys::subscribers_prefix(project_id, channel), 0)) {
        total += decode_list(value).size();
    }
    return total;
}

}
