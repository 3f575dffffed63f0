#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>
#include <utility>

namespace erebus {

// Raised when the backing store cannot complete an operation.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Read-modify-write view handed to ChannelStorage::transaction.
// Reads observe the transaction's own pending writes.
class StorageTransaction {
public:
    virtual ~StorageTransaction() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual void del(const std::string& key) = 0;
};

// Write-buffering transaction shared by the storage backends. Pending
// writes are kept in order of last mutation per key; nullopt marks a delete.
class BufferedTransaction : public StorageTransaction {
public:
    using Reader = std::function<std::optional<std::string>(const std::string&)>;
    using PendingWrites = std::vector<std::pair<std::string, std::optional<std::string>>>;

    explicit BufferedTransaction(Reader reader) : reader_(std::move(reader)) {}

    std::optional<std::string> get(const std::string& key) override {
        for (auto it = pending_.rbegin(); it != pending_.rend(); ++it) {
            if (it->first == key) return it->second;
        }
        return reader_(key);
    }

    void put(const std::string& key, const std::string& value) override {
        pending_.emplace_back(key, value);
    }

    void del(const std::string& key) override {
        pending_.emplace_back(key, std::nullopt);
    }

    const PendingWrites& pending() const { return pending_; }

private:
    Reader reader_;
    PendingWrites pending_;
};


// Abstract per-shard key/value store. Every shard owns exactly one keyspace;
// all durable actor state (subscribers, cursors, buffered messages, shard
// topology) lives here so an actor can be recreated without losing it.
class ChannelStorage {
public:
    using Entry = std::pair<std::string, std::string>;
    using TransactionFn = std::function<void(StorageTransaction&)>;

    virtual ~ChannelStorage() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;

    // @return true if the key existed.
    virtual bool del(const std::string& key) = 0;

    /**
     * Lists entries whose key starts with prefix, in ascending lexicographic key order.
     * @param limit Maximum number of entries returned (0 means unbounded).
     */
    virtual std::vector<Entry> list(const std::string& prefix, size_t limit) = 0;

    /**
     * Runs fn atomically. Writes become visible together once fn returns;
     * if fn throws nothing is committed and the exception propagates.
     */
    virtual void transaction(const TransactionFn& fn) = 0;
};

}
