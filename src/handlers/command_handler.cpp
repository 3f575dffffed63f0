#include "handlers/command_handler.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"
#include <openssl/crypto.h>

namespace erebus {

http::response<http::string_body> CommandHandler::json_response(http::status status, const json::object& body,
                                                                unsigned version) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-cache, no-store, must-revalidate");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> CommandHandler::handle_command(const http::request<http::string_body>& req,
                                                                 const std::string& remote_addr) {
    auto key_it = req.find("x-root-api-key");
    if (key_it == req.end() || key_it->value().empty()) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr, "Root command without API key");
        return json_response(http::status::unauthorized,
                             {{"error", "Authentication required: Root API key must be provided"}}, req.version());
    }

    std::string provided(key_it->value());
    bool valid = !config_.root_api_key.empty() && provided.size() == config_.root_api_key.size() &&
                 CRYPTO_memcmp(provided.data(), config_.root_api_key.data(), provided.size()) == 0;
    if (!valid) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr, "Root command with invalid API key");
        return json_response(http::status::unauthorized,
                             {{"error", "Authentication failed: Invalid root API key provided"}}, req.version());
    }

    std::string command;
    std::string project_id;
    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        if (!body.is_object()) throw std::invalid_argument("not an object");
        const auto& obj = body.as_object();
        auto* c = obj.if_contains("command");
        auto* p = obj.if_contains("projectId");
        if (!c || !c->is_string() || !p || !p->is_string() || p->as_string().empty()) {
            throw std::invalid_argument("missing fields");
        }
        command = std::string(c->as_string());
        project_id = std::string(p->as_string());
    } catch (const std::exception&) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Malformed root command");
        return json_response(http::status::bad_request, {{"error", "Invalid request: Malformed command"}},
                             req.version());
    }

    bool pause;
    if (command == "pause_project_id") {
        pause = true;
    } else if (command == "unpause_project_id") {
        pause = false;
    } else {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Unsupported root command " + command);
        return json_response(http::status::bad_request, {{"error", "Invalid request: Unsupported command type"}},
                             req.version());
    }

    size_t shards = registry_.set_project_paused(project_id, pause);
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, remote_addr,
                        command + " applied to " + std::to_string(shards) + " shards of " + project_id);

    json::object response;
    response["ok"] = true;
    response["command"] = command;
    response["projectId"] = project_id;
    response["shards"] = static_cast<int64_t>(shards);
    return json_response(http::status::ok, response, req.version());
}

}
