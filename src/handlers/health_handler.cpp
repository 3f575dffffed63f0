#include "handlers/health_handler.hpp"
#include <openssl/crypto.h>

namespace erebus {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["storage"] = config_.storage_backend;
    response["region"] = config_.location_hint;
    response["tls"] = config_.enable_tls;

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_stats(const http::request<http::string_body>& req) {
    json::array shards;
    int64_t total_connections = 0;

    for (const auto& actor : registry_.actors()) {
        auto status = actor->shard_status();

        json::object shard;
        shard["key"] = actor->shard_key();
        shard["connections"] = static_cast<int64_t>(actor->connection_count());
        shard["paused"] = actor->paused();
        if (status.location_hint) {
            shard["locationHint"] = *status.location_hint;
        } else {
            shard["locationHint"] = nullptr;
        }

        json::array siblings;
        for (const auto& s : status.shards) siblings.emplace_back(s);
        shard["shards"] = std::move(siblings);

        json::array remote;
        for (const auto& s : status.remote_shards) remote.emplace_back(s);
        shard["remoteShards"] = std::move(remote);

        total_connections += static_cast<int64_t>(actor->connection_count());
        shards.push_back(std::move(shard));
    }

    json::object response;
    response["active_connections"] = total_connections;
    response["active_shards"] = static_cast<int64_t>(shards.size());
    response["shards"] = std::move(shards);

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) {
    // If no token is configured, admin access is disabled.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    if (provided_token.size() != config_.admin_token.size()) return false;
    return CRYPTO_memcmp(provided_token.data(), config_.admin_token.data(), provided_token.size()) == 0;
}

}
