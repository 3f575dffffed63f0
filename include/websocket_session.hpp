#pragma once

#include "client_socket.hpp"
#include "server_config.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <variant>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace erebus {

// Server side of one WebSocket connection, plaintext or TLS.
// Writes are queued on the connection's strand; buffered_amount() reports
// bytes accepted by send_text() that have not completed writing yet.
class WebSocketSession : public ClientSocket, public std::enable_shared_from_this<WebSocketSession> {
public:
    using MessageHandler = std::function<void(std::shared_ptr<WebSocketSession>, std::string)>;
    using CloseHandler = std::function<void(std::shared_ptr<WebSocketSession>)>;

    WebSocketSession(beast::ssl_stream<beast::tcp_stream>&& stream, const ServerConfig& config);
    WebSocketSession(beast::tcp_stream&& stream, const ServerConfig& config);
    ~WebSocketSession() override = default;

    WebSocketSession(const WebSocketSession&) = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;

    template<class Body, class Allocator>
    void accept(http::request<Body, http::basic_fields<Allocator>>&& req,
                std::function<void(beast::error_code)> on_accept);

    // Starts the read loop. Handlers must be set before.
    void run();

    void set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { on_close_ = std::move(handler); }
    void set_conn_guard(std::shared_ptr<void> guard) { conn_guard_ = std::move(guard); }

    // ClientSocket
    void send_text(const std::string& message) override;
    void close(WsCloseCode code, const std::string& reason) override;
    bool is_open() const override { return open_.load(); }
    size_t buffered_amount() const override { return buffered_.load(); }
    void set_attachment(const std::string& data) override;
    std::optional<std::string> attachment() const override;
    std::string remote_address() const override { return remote_addr_; }

    net::any_io_executor get_executor();

private:
    std::variant<
        websocket::stream<beast::ssl_stream<beast::tcp_stream>>,
        websocket::stream<beast::tcp_stream>
    > ws_;

    bool is_tls_;
    std::string remote_addr_;
    const ServerConfig& config_;

    std::atomic<bool> open_{false};
    std::atomic<bool> close_triggered_{false};
    std::atomic<size_t> buffered_{0};

    mutable std::mutex attachment_mutex_;
    std::optional<std::string> attachment_;

    beast::flat_buffer read_buffer_;
    std::queue<std::shared_ptr<std::string>> write_queue_;
    bool is_writing_ = false;
    std::optional<websocket::close_reason> pending_close_;
    bool closing_ = false;

    MessageHandler on_message_;
    CloseHandler on_close_;
    std::shared_ptr<void> conn_guard_;

    void configure();
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred, size_t size);

    void do_close();
    void trigger_close_handler();
};

}
