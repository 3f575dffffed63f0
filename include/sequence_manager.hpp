#pragma once

#include "channel_storage.hpp"
#include "pubsub_types.hpp"
#include "ulid.hpp"
#include <map>
#include <string>

namespace erebus {

// Issues strictly increasing, time-sortable ULID sequences per topic.
// Only the shard that accepts a publish calls generate_sequence; replicas reuse the seq.
class SequenceManager {
public:
    explicit SequenceManager(ChannelStorage& storage, Clock clock = wall_now_ms);

    /**
     * Advances the topic cursor and returns the new sequence.
     * The cursor is persisted before returning; a storage failure propagates as StorageError.
     */
    std::string generate_sequence(const std::string& project_id, const std::string& channel,
                                  const std::string& topic);

    // Last issued sequence, or "0" if the topic has none.
    std::string get_current_sequence(const std::string& project_id, const std::string& channel,
                                     const std::string& topic);

    static uint64_t decode_sequence_time(const std::string& seq);

    // "0" orders before every real sequence.
    static int compare_sequences(const std::string& a, const std::string& b);
    static bool is_sequence_after(const std::string& a, const std::string& b) {
        return compare_sequences(a, b) > 0;
    }

private:
    ChannelStorage& storage_;
    Clock clock_;
    std::map<std::string, SeededRandom> prngs_;

    SeededRandom& prng_for(const std::string& topic);
};

}
