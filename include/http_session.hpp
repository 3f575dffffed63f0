#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/strand.hpp>
#include <boost/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "server_config.hpp"
#include "actor_registry.hpp"
#include "grant.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/command_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace erebus {

// One accepted HTTP(S) connection. Routes plain requests and hands
// /v1/pubsub/* upgrades to the channel shard selected by the grant.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::ssl_stream<beast::tcp_stream>&& stream,
        const ServerConfig& config,
        ActorRegistry& registry,
        const GrantVerifier& verifier,
        std::shared_ptr<void> conn_guard
    );

    HttpSession(
        beast::tcp_stream&& stream,
        const ServerConfig& config,
        ActorRegistry& registry,
        const GrantVerifier& verifier,
        std::shared_ptr<void> conn_guard
    );

    ~HttpSession() = default;

    void run();

    // Grant from the "grant" query parameter, else the X-Erebus-Grant header. Trimmed.
    static std::optional<std::string> extract_grant(const http::request<http::string_body>& req);

    static std::optional<std::string> query_param(beast::string_view target, beast::string_view name);

    // This node only hosts shards for its own region. An X-Location-Hint header is accepted
    // when it names that region; anything else, or no configured region, yields nullopt.
    static std::optional<std::string> resolve_location_hint(const http::request<http::string_body>& req,
                                                            const std::string& configured);

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    ActorRegistry& registry_;
    const GrantVerifier& verifier_;

    // Handlers
    HealthHandler health_handler_;
    CommandHandler command_handler_;

    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);

    void handle_pubsub_upgrade();
    void upgrade_to_websocket(std::shared_ptr<ChannelActor> actor, std::string location_hint);

    bool is_loopback() const { return remote_addr_ == "127.0.0.1" || remote_addr_ == "::1"; }

    http::response<http::string_body> handle_cors_preflight();
    http::response<http::string_body> handle_not_found();
    http::response<http::string_body> error_response(http::status status, const std::string& message);

    template<class Body>
    void add_security_headers(http::response<Body>& res);

    template<class Body>
    void add_cors_headers(http::response<Body>& res);
};

}
