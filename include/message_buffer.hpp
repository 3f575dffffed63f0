#pragma once

#include "channel_storage.hpp"
#include "pubsub_types.hpp"
#include <string>
#include <vector>

namespace erebus {

// Stored form of a buffered message.
struct MessageRecord {
    MessageBody body;
    int64_t exp = 0;  // absolute expiry, epoch milliseconds
};

// TTL-bounded replay buffer and per-client last-seen cursors.
// Expired records are removed lazily: a bounded prune after each write and on read.
class MessageBuffer {
public:
    MessageBuffer(ChannelStorage& storage, int64_t ttl_ms, Clock clock = wall_now_ms);

    void buffer_message(const MessageBody& message, const std::string& project_id, const std::string& channel,
                        const std::string& topic, const std::string& seq);

    // Live messages with seq > after_seq, oldest first.
    std::vector<MessageBody> get_messages_after(const std::string& project_id, const std::string& channel,
                                                const std::string& topic, const std::string& after_seq,
                                                size_t limit = DEFAULT_MESSAGE_LIMIT);

    // Advances each client's cursor to seq in one transaction. Cursors never move backwards.
    void update_last_seen_bulk(const std::vector<std::string>& client_ids, const std::string& project_id,
                               const std::string& channel, const std::string& topic, const std::string& seq);

    void update_last_seen_single(const std::string& project_id, const std::string& channel, const std::string& topic,
                                 const std::string& client_id, const std::string& seq);

    // "0" when the client has no cursor.
    std::string get_last_seen(const std::string& project_id, const std::string& channel, const std::string& topic,
                              const std::string& client_id);

    // @return number of records deleted.
    size_t prune_expired_messages(const std::string& project_id, const std::string& channel,
                                  const std::string& topic);

    size_t get_message_count(const std::string& project_id, const std::string& channel, const std::string& topic);

    int64_t ttl_ms() const { return ttl_ms_; }

private:
    ChannelStorage& storage_;
    int64_t ttl_ms_;
    Clock clock_;

    std::optional<MessageRecord> parse_record(const std::string& raw) const;
};

}
