#include "http_session.hpp"
#include "websocket_session.hpp"
#include "distributed_key.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include "pubsub_types.hpp"
#include <boost/json.hpp>
#include <cctype>
#include <iostream>

namespace json = boost::json;

namespace erebus {

namespace {

std::string trim(beast::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return std::string(s.substr(begin, end - begin));
}

std::string url_decode(beast::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out += static_cast<char>(std::stoi(std::string(in.substr(i + 1, 2)), nullptr, 16));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

beast::string_view path_of(beast::string_view target) {
    auto q = target.find('?');
    return q == beast::string_view::npos ? target : target.substr(0, q);
}

bool starts_with(beast::string_view s, beast::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

}

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    ActorRegistry& registry,
    const GrantVerifier& verifier,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , registry_(registry)
    , verifier_(verifier)
    , health_handler_(config, registry)
    , command_handler_(config, registry)
    , conn_guard_(std::move(conn_guard))
{
    try {
        auto& s = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
        auto ep = beast::get_lowest_layer(s).socket().remote_endpoint();
        remote_addr_ = ep.address().to_string();
    } catch (const std::exception&) {
        remote_addr_ = "unknown";
    }
}

// Plaintext HTTP Session state (usually behind a local proxy or for testing)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    ActorRegistry& registry,
    const GrantVerifier& verifier,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , registry_(registry)
    , verifier_(verifier)
    , health_handler_(config, registry)
    , command_handler_(config, registry)
    , conn_guard_(std::move(conn_guard))
{
    try {
        auto& s = std::get<beast::tcp_stream>(stream_);
        auto ep = beast::get_lowest_layer(s).socket().remote_endpoint();
        remote_addr_ = ep.address().to_string();
    } catch (const std::exception&) {
        remote_addr_ = "unknown";
    }
}

void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure
        return;
    }
    do_read();
}

void HttpSession::do_read() {
    req_ = {};

    // Bound the time a client may take to send a request
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(
            std::chrono::seconds(60));
    } else {
        beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).expires_after(
            std::chrono::seconds(60));
    }

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        return;
    }

    req_ = parser_->release();
    handle_request();
}

void HttpSession::handle_request() {
    auto path = path_of(req_.target());
    auto method = req_.method();

    if (method == http::verb::options) {
        send_response(handle_cors_preflight());
        return;
    }

    // --- Routing Table ---

    if (starts_with(path, "/v1/pubsub/") || path == "/v1/pubsub") {
        if (!websocket::is_upgrade(req_)) {
            send_response(error_response(http::status::bad_request,
                                         "WebSocket upgrade required for this service"));
            return;
        }
        handle_pubsub_upgrade();
        return;
    }

    if (path == "/health" && method == http::verb::get) {
        send_response(health_handler_.handle_health(req_.version()));
    } else if (path == "/stats" && method == http::verb::get) {
        if (is_loopback() || health_handler_.verify_admin_request(req_)) {
            send_response(health_handler_.handle_stats(req_));
        } else {
            send_response(handle_not_found());
        }
    } else if (path == "/metrics" && method == http::verb::get) {
        if (is_loopback() || health_handler_.verify_admin_request(req_)) {
            send_response(health_handler_.handle_metrics(req_.version()));
        } else {
            send_response(handle_not_found());
        }
    } else if (path == "/v1/root/command" && method == http::verb::post) {
        auto res = command_handler_.handle_command(req_, remote_addr_);
        add_security_headers(res);
        send_response(std::move(res));
    } else {
        send_response(handle_not_found());
    }
}

std::optional<std::string> HttpSession::query_param(beast::string_view target, beast::string_view name) {
    auto q = target.find('?');
    if (q == beast::string_view::npos) return std::nullopt;
    auto query = target.substr(q + 1);

    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        auto eq = pair.find('=');
        auto key = pair.substr(0, eq);
        if (url_decode(key) == std::string(name)) {
            if (eq == beast::string_view::npos) return std::string();
            return url_decode(pair.substr(eq + 1));
        }
        if (amp == beast::string_view::npos) break;
        query = query.substr(amp + 1);
    }
    return std::nullopt;
}

std::optional<std::string> HttpSession::resolve_location_hint(const http::request<http::string_body>& req,
                                                              const std::string& configured) {
    if (configured.empty()) return std::nullopt;
    auto it = req.find("x-location-hint");
    if (it == req.end()) return configured;
    auto hint = trim(it->value());
    if (hint.empty() || hint == configured) return configured;
    return std::nullopt;
}

std::optional<std::string> HttpSession::extract_grant(const http::request<http::string_body>& req) {
    if (auto q = query_param(req.target(), "grant")) {
        auto grant = trim(*q);
        if (!grant.empty()) return grant;
    }
    auto it = req.find("X-Erebus-Grant");
    if (it != req.end()) {
        auto grant = trim(it->value());
        if (!grant.empty()) return grant;
    }
    return std::nullopt;
}

// Verifies the grant, selects the shard for (project, channel, region) and upgrades.
void HttpSession::handle_pubsub_upgrade() {
    auto token = extract_grant(req_);
    if (!token) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr_, "Upgrade without grant");
        send_response(error_response(http::status::unauthorized,
            "Unauthorized: Grant token required in query parameter or X-Erebus-Grant header"));
        return;
    }

    auto grant = verifier_.verify(*token);
    if (!grant) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr_, "Upgrade with invalid grant");
        send_response(error_response(http::status::unauthorized, "Unauthorized: Invalid grant token signature"));
        return;
    }

    auto resolved_hint = resolve_location_hint(req_, config_.location_hint);
    if (!resolved_hint) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr_, "Rejected location hint for region " + config_.location_hint);
        send_response(error_response(http::status::bad_request, "Invalid location hint"));
        return;
    }
    std::string location_hint = std::move(*resolved_hint);

    std::string channel_key;
    std::string shard_key;
    std::shared_ptr<ChannelActor> actor;
    try {
        channel_key = DistributedKey::stringify(grant->project_id, grant->channel, "channel", "v1");
        shard_key = DistributedKey::append_location_hint(channel_key, location_hint);
        actor = registry_.get_or_create(shard_key);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr_, std::string("Shard selection failed: ") + e.what());
        send_response(error_response(http::status::bad_request, "Invalid channel"));
        return;
    }

    registry_.register_shard(grant->project_id, channel_key, shard_key);
    upgrade_to_websocket(std::move(actor), std::move(location_hint));
}

// Transitions the HTTP session to a long-lived WebSocket session owned by the shard actor.
void HttpSession::upgrade_to_websocket(std::shared_ptr<ChannelActor> actor, std::string location_hint) {
    std::shared_ptr<WebSocketSession> ws_session;

    if (is_tls_) {
        ws_session = std::make_shared<WebSocketSession>(
            std::move(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)),
            config_
        );
    } else {
        ws_session = std::make_shared<WebSocketSession>(
            std::move(std::get<beast::tcp_stream>(stream_)),
            config_
        );
    }

    ws_session->set_conn_guard(std::move(conn_guard_));
    ws_session->set_message_handler([actor](std::shared_ptr<WebSocketSession> session, std::string data) {
        actor->on_message(std::move(session), std::move(data));
    });
    ws_session->set_close_handler([actor](std::shared_ptr<WebSocketSession> session) {
        actor->on_close(std::move(session));
    });

    auto remote = remote_addr_;
    ws_session->accept(std::move(req_), [ws_session, actor, location_hint, remote](beast::error_code ec) {
        if (ec) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                remote, "WebSocket handshake failed: " + ec.message());
            return;
        }
        MetricsRegistry::instance().increment_counter("erebus_connections_accepted_total");
        actor->attach(ws_session, location_hint);
        ws_session->run();
    });
}

http::response<http::string_body> HttpSession::handle_cors_preflight() {
    http::response<http::string_body> res{http::status::no_content, req_.version()};
    add_cors_headers(res);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Erebus Gateway: The endpoint you requested does not exist. "
                        "Please check your URL or consult the Erebus API documentation for available endpoints.";
    response["docs"] = "https://docs.erebus.sh/";
    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    add_security_headers(res);
    add_cors_headers(res);
    return res;
}

http::response<http::string_body> HttpSession::error_response(http::status status, const std::string& message) {
    json::object response;
    response["error"] = message;
    response["timestamp"] = iso8601_utc(wall_now_ms());
    http::response<http::string_body> res{status, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-cache, no-store, must-revalidate");
    res.body() = json::serialize(response);
    res.prepare_payload();
    add_security_headers(res);
    add_cors_headers(res);
    return res;
}

template<class Body>
void HttpSession::add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "Erebus/1.0");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "strict-origin-when-cross-origin");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");
    if (config_.enable_tls) {
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    }
}

template<class Body>
void HttpSession::add_cors_headers(http::response<Body>& res) {
    std::string origin;
    auto origin_it = req_.find(http::field::origin);
    if (origin_it != req_.end()) {
        origin = std::string(origin_it->value());
    }

    for (const auto& allowed : config_.allowed_origins) {
        if (allowed == "*" || allowed == origin) {
            res.set(http::field::access_control_allow_origin, (allowed == "*" && !origin.empty()) ? origin : allowed);
            break;
        }
    }

    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers,
            "Content-Type,X-Erebus-Grant,x-location-hint,x-root-api-key,X-Admin-Token");
    res.set(http::field::access_control_max_age, "86400");
    res.set(http::field::vary, "Origin");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        std::cerr << "[!] HTTP write error: " << ec.message() << "\n";
        return;
    }

    if (close) {
        if (is_tls_) {
            beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        } else {
            beast::get_lowest_layer(std::get<beast::tcp_stream>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        }
        return;
    }

    do_read();
}

}
