#pragma once

#include "channel_storage.hpp"
#include <map>
#include <mutex>

namespace erebus {

// In-process ChannelStorage. Used for single-node deployments and tests;
// sharing one instance between two actor lifetimes models rehydration.
class MemoryStorage : public ChannelStorage {
public:
    MemoryStorage() = default;

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value) override;
    bool del(const std::string& key) override;
    std::vector<Entry> list(const std::string& prefix, size_t limit) override;
    void transaction(const TransactionFn& fn) override;

    size_t size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::recursive_mutex mutex_;
};

}
