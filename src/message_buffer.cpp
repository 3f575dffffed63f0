#include "message_buffer.hpp"
#include "security_logger.hpp"
#include <boost/json.hpp>

namespace erebus {

MessageBuffer::MessageBuffer(ChannelStorage& storage, int64_t ttl_ms, Clock clock)
    : storage_(storage), ttl_ms_(ttl_ms), clock_(std::move(clock)) {}

std::optional<MessageRecord> MessageBuffer::parse_record(const std::string& raw) const {
    boost::json::value v;
    try {
        v = boost::json::parse(raw);
    } catch (const std::exception& e) {
        SecurityLogger::error(SecurityLogger::EventType::STORAGE_FAILURE,
                              "Unparseable message record: " + std::string(e.what()));
        return std::nullopt;
    }
    if (!v.is_object()) return std::nullopt;

    const auto& obj = v.as_object();
    auto* body = obj.if_contains("body");
    auto* exp = obj.if_contains("exp");
    if (body && exp && exp->is_number()) {
        auto msg = MessageBody::from_json(*body);
        if (!msg) return std::nullopt;
        return MessageRecord{std::move(*msg), static_cast<int64_t>(exp->to_number<double>())};
    }

    // Legacy record: a bare message without expiry metadata.
    auto msg = MessageBody::from_json(v);
    if (!msg) return std::nullopt;
    return MessageRecord{std::move(*msg), clock_() + ttl_ms_};
}

void MessageBuffer::buffer_message(const MessageBody& message, const std::string& project_id,
                                   const std::string& channel, const std::string& topic, const std::string& seq) {
    boost::json::object record;
    record["body"] = message.to_json();
    record["exp"] = clock_() + ttl_ms_;

    storage_.put(storage_keys::message(project_id, channel, topic, seq), boost::json::serialize(record));
    prune_expired_messages(project_id, channel, topic);
}

std::vector<MessageBody> MessageBuffer::get_messages_after(const std::string& project_id, const std::string& channel,
                                                           const std::string& topic, const std::string& after_seq,
                                                           size_t limit) {
    const std::string prefix = storage_keys::message_prefix(project_id, channel, topic);
    const int64_t now = clock_();
    const bool has_cursor = !after_seq.empty() && after_seq != NO_SEQUENCE;

    std::vector<MessageBody> out;
    for (const auto& [key, value] : storage_.list(prefix, STORAGE_LIST_LIMIT)) {
        std::string seq = key.substr(prefix.size());
        if (has_cursor && seq <= after_seq) continue;

        auto record = parse_record(value);
        if (!record) continue;

        if (record->exp < now) {
            storage_.del(key);
            continue;
        }

        out.push_back(std::move(record->body));
        if (out.size() >= limit) break;
    }
    return out;
}

void MessageBuffer::update_last_seen_bulk(const std::vector<std::string>& client_ids, const std::string& project_id,
                                          const std::string& channel, const std::string& topic,
                                          const std::string& seq) {
    if (client_ids.empty()) return;

    storage_.transaction([&](StorageTransaction& txn) {
        for (const auto& client_id : client_ids) {
            const std::string key = storage_keys::last_seen(project_id, channel, topic, client_id);
            std::string current = txn.get(key).value_or(NO_SEQUENCE);
            if (current < seq) {
                txn.put(key, seq);
            }
        }
    });
}

void MessageBuffer::update_last_seen_single(const std::string& project_id, const std::string& channel,
                                            const std::string& topic, const std::string& client_id,
                                            const std::string& seq) {
    update_last_seen_bulk({client_id}, project_id, channel, topic, seq);
}

std::string MessageBuffer::get_last_seen(const std::string& project_id, const std::string& channel,
                                         const std::string& topic, const std::string& client_id) {
    auto v = storage_.get(storage_keys::last_seen(project_id, channel, topic, client_id));
    if (!v || v->empty()) return NO_SEQUENCE;
    return *v;
}

size_t MessageBuffer::prune_expired_messages(const std::string& project_id, const std::string& channel,
                                             const std::string& topic) {
    const int64_t now = clock_();
    size_t deleted = 0;

    for (const auto& [key, value] : storage_.list(storage_keys::message_prefix(project_id, channel, topic),
                                                  PRUNE_PAGE_SIZE)) {
        auto record = parse_record(value);
        if (record && record->exp < now) {
            storage_.del(key);
            ++deleted;
        }
    }

    if (deleted > 0) {
        SecurityLogger::debug(SecurityLogger::EventType::LIFECYCLE,
                              "Pruned " + std::to_string(deleted) + " expired messages on " + topic);
    }
    return deleted;
}

size_t MessageBuffer::get_message_count(const std::string& project_id, const std::string& channel,
                                        const std::string& topic) {
    const int64_t now = clock_();
    size_t count = 0;
    for (const auto& [key, value] : storage_.list(storage_keys::message_prefix(project_id, channel, topic), 0)) {
        auto record = parse_record(value);
        if (record && record->exp >= now) ++count;
    }
    return count;
}

}
