#include "redis_manager.hpp"
#include "server_config.hpp"
#include "security_logger.hpp"
#include <iostream>
#include <chrono>
#include <iterator>
#include <stdexcept>

namespace erebus {

namespace {

std::string directory_project_key(const std::string& project_id) {
    return "erebus:project:" + project_id;
}

std::string directory_channel_key(const std::string& channel_key) {
    return "erebus:shards:" + channel_key;
}

}

RedisManager::RedisManager(const ServerConfig& config) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config.redis_url);
        redis_->ping();
        connected_ = true;

        // The subscriber connection gets a read timeout so consume() returns
        // periodically and the loop can observe shutdown.
        sw::redis::ConnectionOptions sub_opts(config.redis_url);
        sub_opts.socket_timeout = std::chrono::milliseconds(1000);
        subscriber_redis_ = std::make_unique<sw::redis::Redis>(sub_opts);

        std::cout << "[*] Redis connected: " << config.redis_url << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis connection failed: " << e.what() << "\n";
        connected_ = false;
    }
}

RedisManager::~RedisManager() {
    running_ = false;
    if (subscriber_thread_.joinable()) {
        subscriber_thread_.join();
    }
}

bool RedisManager::register_channel_and_shard(const std::string& project_id, const std::string& channel_key,
                                              const std::string& shard_key) {
    if (!connected_) return false;
    try {
        const auto project_key = directory_project_key(project_id);
        const auto shards_key = directory_channel_key(channel_key);

        if (redis_->sismember(project_key, channel_key) && redis_->sismember(shards_key, shard_key)) {
            return true;
        }

        auto tx = redis_->transaction();
        tx.sadd(project_key, channel_key).sadd(shards_key, shard_key).exec();
        std::cout << "[+] Registered shard " << shard_key << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis shard registration failed: " << e.what() << "\n";
        return false;
    }
}

std::vector<std::string> RedisManager::get_shards(const std::string& channel_key) {
    std::vector<std::string> shards;
    if (!connected_) return shards;
    try {
        redis_->smembers(directory_channel_key(channel_key), std::back_inserter(shards));
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis get_shards failed: " << e.what() << "\n";
    }
    return shards;
}

std::vector<std::string> RedisManager::get_channels_for_project(const std::string& project_id) {
    std::vector<std::string> channels;
    if (!connected_) return channels;
    try {
        redis_->smembers(directory_project_key(project_id), std::back_inserter(channels));
    } catch (const std::exception& e) {
        std::cerr << "[!] Redis get_channels failed: " << e.what() << "\n";
    }
    return channels;
}

void RedisManager::publish_rpc(const std::string& shard_key, const std::string& payload) {
    if (!connected_) {
        throw std::runtime_error("Redis unavailable");
    }
    try {
        redis_->publish(rpc_channel(shard_key), payload);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Redis publish failed: ") + e.what());
    }
}

void RedisManager::start_rpc_listener(const std::string& region, RpcHandler handler) {
    if (!connected_ || running_) return;
    rpc_pattern_ = std::string(RPC_CHANNEL_PREFIX) + "*:" + region;
    rpc_handler_ = std::move(handler);
    running_ = true;
    subscriber_thread_ = std::thread(&RedisManager::subscriber_loop, this);
}

// Subscriber loop delivering shard RPCs from other broker processes.
void RedisManager::subscriber_loop() {
    const std::string prefix = RPC_CHANNEL_PREFIX;

    while (running_) {
        try {
            {
                std::lock_guard<std::mutex> lock(subscriber_mutex_);
                subscriber_ = std::make_unique<sw::redis::Subscriber>(subscriber_redis_->subscriber());

                subscriber_->on_pmessage([this, prefix](std::string, std::string channel, std::string msg) {
                    if (channel.rfind(prefix, 0) != 0) return;
                    try {
                        rpc_handler_(channel.substr(prefix.size()), msg);
                    } catch (const std::exception& e) {
                        SecurityLogger::error(SecurityLogger::EventType::SHARD_FAILURE,
                                              std::string("Shard RPC dispatch failed: ") + e.what());
                    }
                });
                subscriber_->psubscribe(rpc_pattern_);
            }

            while (running_) {
                try {
                    subscriber_->consume();
                } catch (const sw::redis::TimeoutError&) {
                    continue;
                }
            }
        } catch (const std::exception& e) {
            if (running_) {
                std::cerr << "[!] Redis subscriber error (reconnecting...): " << e.what() << "\n";
                std::this_thread::sleep_for(std::chrono::seconds(2));
            }
        }
    }

    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    subscriber_.reset();
}

}
