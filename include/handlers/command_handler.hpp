#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include "server_config.hpp"
#include "actor_registry.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace erebus {

// POST /v1/root/command: operator commands authenticated by x-root-api-key.
//   {"command":"pause_project_id"|"unpause_project_id","projectId":"..."}
class CommandHandler {
public:
    CommandHandler(const ServerConfig& config, ActorRegistry& registry)
        : config_(config), registry_(registry) {}

    http::response<http::string_body> handle_command(const http::request<http::string_body>& req,
                                                     const std::string& remote_addr);

private:
    const ServerConfig& config_;
    ActorRegistry& registry_;

    http::response<http::string_body> json_response(http::status status, const json::object& body,
                                                    unsigned version);
};

}
