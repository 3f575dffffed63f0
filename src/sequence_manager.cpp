#include "sequence_manager.hpp"
#include "security_logger.hpp"
#include <algorithm>

namespace erebus {

SequenceManager::SequenceManager(ChannelStorage& storage, Clock clock)
    : storage_(storage), clock_(std::move(clock)) {}

SeededRandom& SequenceManager::prng_for(const std::string& topic) {
    auto it = prngs_.find(topic);
    if (it == prngs_.end()) {
        it = prngs_.emplace(topic, SeededRandom(hash_string_to_seed(topic))).first;
    }
    return it->second;
}

std::string SequenceManager::generate_sequence(const std::string& project_id, const std::string& channel,
                                               const std::string& topic) {
    const std::string key = storage_keys::sequence(project_id, channel, topic);
    auto& prng = prng_for(topic);
    auto rand = [&prng]() { return prng.next(); };

    std::string next;
    storage_.transaction([&](StorageTransaction& txn) {
        auto last = txn.get(key);
        auto now = static_cast<uint64_t>(clock_());

        if (!last || *last == NO_SEQUENCE || !Ulid::is_valid(*last)) {
            next = Ulid::generate(now, rand);
        } else {
            uint64_t last_time = Ulid::decode_time(*last);
            uint64_t basis = std::max(last_time, now);
            // Same millisecond (or clock went backwards): stay strictly above the stored cursor.
            next = basis == last_time ? Ulid::increment(*last) : Ulid::generate(basis, rand);
        }
        txn.put(key, next);
    });

    SecurityLogger::debug(SecurityLogger::EventType::LIFECYCLE, "seq " + topic + " -> " + next);
    return next;
}

std::string SequenceManager::get_current_sequence(const std::string& project_id, const std::string& channel,
                                                  const std::string& topic) {
    auto v = storage_.get(storage_keys::sequence(project_id, channel, topic));
    return v ? *v : NO_SEQUENCE;
}

uint64_t SequenceManager::decode_sequence_time(const std::string& seq) {
    return Ulid::decode_time(seq);
}

int SequenceManager::compare_sequences(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    if (a == NO_SEQUENCE) return -1;
    if (b == NO_SEQUENCE) return 1;
    return a < b ? -1 : 1;
}

}
