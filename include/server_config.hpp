#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <vector>

namespace erebus {


// Core server configuration for a single regional broker process.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    std::string redis_url = "tcp://127.0.0.1:6379";
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // "redis" keeps shard state in Redis, "memory" keeps it in-process (single node / development)
    std::string storage_backend = "redis";

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection & Resource Management ---
    size_t max_message_size = 1024 * 1024;  // 1MB
    size_t max_global_connections = 100000;
    int websocket_handshake_timeout_sec = 15;
    int websocket_idle_timeout_sec = 300;

    // --- Sharding ---
    // Region served by this process. Appended to channel keys to address the local shard.
    std::string location_hint = "";

    // --- Identity & Secrets ---
    std::string public_key_jwk = "";  // Ed25519 JWK used to verify grant tokens
    std::string root_api_key = "";    // Guards /v1/root/command
    std::string admin_token = "";     // Used for privileged stats/metrics access

    // --- Usage Webhooks ---
    std::string webhook_base_url = "";
    size_t usage_batch_size = 50;
    int usage_flush_interval_ms = 1000;
    int usage_request_timeout_ms = 10000;  // whole exchange: resolve, connect, TLS, write, read

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};

    // --- Protocol Constraints ---
    size_t max_json_depth = 16;
    bool debug_verbose = false;

    // --- Broadcast Tuning ---
    struct Broadcast {
        size_t batch_size = 10;
        size_t presence_batch_size = 50;
        size_t backpressure_low = 10 * 1024;    // 10KB: yield once before sending
        size_t backpressure_high = 100 * 1024;  // 100KB: skip the send
    } broadcast;

    int64_t message_ttl_ms = 3LL * 24 * 60 * 60 * 1000;  // 3 days
};

// Returns the value of an environment variable, or nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// Overlays EREBUS_* variables onto config, then validates it.
// Throws std::invalid_argument on unparsable numbers or inconsistent tuning.
void apply_env_overrides(ServerConfig& config, const EnvLookup& env);

void validate_config(const ServerConfig& config);

}
