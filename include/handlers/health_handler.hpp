#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "actor_registry.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace erebus {

class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, ActorRegistry& registry)
        : config_(config), registry_(registry) {}

    http::response<http::string_body> handle_health(unsigned version);

    // Per-shard view: connections, pause state and sibling shards.
    http::response<http::string_body> handle_stats(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Helper used by stats/metrics
    bool verify_admin_request(const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    ActorRegistry& registry_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
        res.set(http::field::cache_control, "no-cache, no-store, must-revalidate");
    }
};

}
