#include "memory_storage.hpp"

namespace erebus {

std::optional<std::string> MemoryStorage::get(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void MemoryStorage::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    data_[key] = value;
}

bool MemoryStorage::del(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return data_.erase(key) > 0;
}

std::vector<ChannelStorage::Entry> MemoryStorage::list(const std::string& prefix, size_t limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Entry> out;
    for (auto it = data_.lower_bound(prefix); it != data_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.emplace_back(it->first, it->second);
        if (limit > 0 && out.size() >= limit) break;
    }
    return out;
}

void MemoryStorage::transaction(const TransactionFn& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    BufferedTransaction txn([this](const std::string& key) { return get(key); });
    fn(txn);
    for (const auto& [key, value] : txn.pending()) {
        if (value) data_[key] = *value;
        else data_.erase(key);
    }
}

size_t MemoryStorage::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return data_.size();
}

}
