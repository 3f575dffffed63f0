#include "server_config.hpp"
#include <stdexcept>

namespace erebus {

namespace {

std::vector<std::string> split_csv(std::string value) {
    std::vector<std::string> out;
    size_t pos = 0;
    while ((pos = value.find(',')) != std::string::npos) {
        if (pos > 0) out.push_back(value.substr(0, pos));
        value.erase(0, pos + 1);
    }
    if (!value.empty()) out.push_back(value);
    return out;
}

size_t to_size(const char* name, const char* value) {
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer");
    }
}

int64_t to_int64(const char* name, const char* value) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be an integer");
    }
}

}

void apply_env_overrides(ServerConfig& config, const EnvLookup& env) {
    if (const char* e = env("EREBUS_PORT")) config.port = static_cast<uint16_t>(to_int64("EREBUS_PORT", e));
    if (const char* e = env("EREBUS_ADDR")) config.address = e;
    if (const char* e = env("EREBUS_REDIS_URL")) config.redis_url = e;
    if (const char* e = env("EREBUS_STORAGE")) config.storage_backend = e;
    if (const char* e = env("EREBUS_THREADS")) config.thread_count = static_cast<int>(to_int64("EREBUS_THREADS", e));
    if (const char* e = env("EREBUS_LOCATION_HINT")) config.location_hint = e;
    if (const char* e = env("EREBUS_PUBLIC_KEY_JWK")) config.public_key_jwk = e;
    if (const char* e = env("EREBUS_ROOT_API_KEY")) config.root_api_key = e;
    if (const char* e = env("EREBUS_ADMIN_TOKEN")) config.admin_token = e;
    if (const char* e = env("EREBUS_WEBHOOK_BASE_URL")) config.webhook_base_url = e;
    if (const char* e = env("EREBUS_MAX_CONNECTIONS")) {
        config.max_global_connections = to_size("EREBUS_MAX_CONNECTIONS", e);
    }
    if (const char* e = env("EREBUS_MAX_MESSAGE_SIZE")) {
        config.max_message_size = to_size("EREBUS_MAX_MESSAGE_SIZE", e);
    }
    if (const char* e = env("EREBUS_ALLOWED_ORIGINS")) config.allowed_origins = split_csv(e);
    if (const char* e = env("EREBUS_TLS_CERT")) config.cert_path = e;
    if (const char* e = env("EREBUS_TLS_KEY")) config.key_path = e;
    if (const char* e = env("EREBUS_DEBUG")) config.debug_verbose = std::string(e) == "1";
    if (const char* e = env("EREBUS_DEBUG_VERBOSE")) config.debug_verbose = std::string(e) == "1";

    // --- Broadcast tuning and retention ---
    if (const char* e = env("EREBUS_BROADCAST_BATCH_SIZE")) {
        config.broadcast.batch_size = to_size("EREBUS_BROADCAST_BATCH_SIZE", e);
    }
    if (const char* e = env("EREBUS_PRESENCE_BATCH_SIZE")) {
        config.broadcast.presence_batch_size = to_size("EREBUS_PRESENCE_BATCH_SIZE", e);
    }
    if (const char* e = env("EREBUS_BACKPRESSURE_LOW")) {
        config.broadcast.backpressure_low = to_size("EREBUS_BACKPRESSURE_LOW", e);
    }
    if (const char* e = env("EREBUS_BACKPRESSURE_HIGH")) {
        config.broadcast.backpressure_high = to_size("EREBUS_BACKPRESSURE_HIGH", e);
    }
    if (const char* e = env("EREBUS_MESSAGE_TTL_MS")) config.message_ttl_ms = to_int64("EREBUS_MESSAGE_TTL_MS", e);

    // --- Usage forwarding ---
    if (const char* e = env("EREBUS_USAGE_BATCH_SIZE")) config.usage_batch_size = to_size("EREBUS_USAGE_BATCH_SIZE", e);
    if (const char* e = env("EREBUS_USAGE_FLUSH_MS")) {
        config.usage_flush_interval_ms = static_cast<int>(to_int64("EREBUS_USAGE_FLUSH_MS", e));
    }
    if (const char* e = env("EREBUS_USAGE_TIMEOUT_MS")) {
        config.usage_request_timeout_ms = static_cast<int>(to_int64("EREBUS_USAGE_TIMEOUT_MS", e));
    }

    validate_config(config);
}

void validate_config(const ServerConfig& config) {
    if (config.broadcast.batch_size == 0 || config.broadcast.presence_batch_size == 0) {
        throw std::invalid_argument("Broadcast batch sizes must be positive");
    }
    if (config.broadcast.backpressure_low >= config.broadcast.backpressure_high) {
        throw std::invalid_argument("EREBUS_BACKPRESSURE_LOW must be below EREBUS_BACKPRESSURE_HIGH");
    }
    if (config.message_ttl_ms <= 0) throw std::invalid_argument("EREBUS_MESSAGE_TTL_MS must be positive");
    if (config.usage_batch_size == 0) throw std::invalid_argument("EREBUS_USAGE_BATCH_SIZE must be positive");
    if (config.usage_request_timeout_ms <= 0) throw std::invalid_argument("EREBUS_USAGE_TIMEOUT_MS must be positive");
}

}
