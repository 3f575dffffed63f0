#include "websocket_session.hpp"
#include "security_logger.hpp"
#include <boost/asio/post.hpp>

namespace erebus {

using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
using PlainWs = websocket::stream<beast::tcp_stream>;

WebSocketSession::WebSocketSession(beast::ssl_stream<beast::tcp_stream>&& stream, const ServerConfig& config)
    : ws_(TlsWs(std::move(stream)))
    , is_tls_(true)
    , config_(config)
{
    try {
        auto ep = beast::get_lowest_layer(std::get<TlsWs>(ws_)).socket().remote_endpoint();
        remote_addr_ = ep.address().to_string();
    } catch (const std::exception&) {
        remote_addr_ = "unknown";
    }
    configure();
}

// Plaintext WebSocket Constructor (behind a TLS-terminating proxy or for development)
WebSocketSession::WebSocketSession(beast::tcp_stream&& stream, const ServerConfig& config)
    : ws_(PlainWs(std::move(stream)))
    , is_tls_(false)
    , config_(config)
{
    try {
        auto ep = beast::get_lowest_layer(std::get<PlainWs>(ws_)).socket().remote_endpoint();
        remote_addr_ = ep.address().to_string();
    } catch (const std::exception&) {
        remote_addr_ = "unknown";
    }
    configure();
}

void WebSocketSession::configure() {
    std::visit([this](auto& ws) {
        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = std::chrono::seconds(config_.websocket_handshake_timeout_sec);
        opt.idle_timeout = std::chrono::seconds(config_.websocket_idle_timeout_sec);
        opt.keep_alive_pings = true;
        ws.set_option(opt);

        // The WebSocket layer owns timeouts from here on.
        beast::get_lowest_layer(ws).expires_never();

        websocket::permessage_deflate pmd;
        pmd.server_enable = true;
        pmd.client_enable = true;
        ws.set_option(pmd);
        ws.read_message_max(config_.max_message_size);
    }, ws_);
}

net::any_io_executor WebSocketSession::get_executor() {
    return std::visit([](auto& ws) -> net::any_io_executor { return ws.get_executor(); }, ws_);
}

// Perform the WebSocket Upgrade handshake
template<class Body, class Allocator>
void WebSocketSession::accept(http::request<Body, http::basic_fields<Allocator>>&& req,
                              std::function<void(beast::error_code)> on_accept) {
    auto self = shared_from_this();
    auto handler = [self, on_accept](beast::error_code ec) {
        if (!ec) self->open_ = true;
        if (on_accept) on_accept(ec);
    };

    if (is_tls_) {
        std::get<TlsWs>(ws_).async_accept(req, handler);
    } else {
        std::get<PlainWs>(ws_).async_accept(req, handler);
    }
}

template void WebSocketSession::accept<http::string_body, std::allocator<char>>(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req,
    std::function<void(beast::error_code)> on_accept
);

void WebSocketSession::run() {
    do_read();
}

void WebSocketSession::do_read() {
    auto self = shared_from_this();
    std::visit([&](auto& ws) {
        ws.async_read(read_buffer_, [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
    }, ws_);
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec == websocket::error::closed) {
        trigger_close_handler();
        return;
    }

    if (ec) {
        if (ec != net::error::operation_aborted) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE,
                                remote_addr_, "WS Read Error: " + ec.message());
        }
        trigger_close_handler();
        return;
    }

    std::string message = beast::buffers_to_string(beast::buffers_prefix(bytes_transferred, read_buffer_.data()));
    read_buffer_.consume(bytes_transferred);

    if (on_message_) {
        on_message_(shared_from_this(), std::move(message));
    }

    do_read();
}

// Enqueue text message for asynchronous delivery
void WebSocketSession::send_text(const std::string& message) {
    if (!open_) return;
    auto msg_data = std::make_shared<std::string>(message);
    buffered_ += msg_data->size();

    net::post(get_executor(), [self = shared_from_this(), msg_data]() {
        if (self->closing_) {
            self->buffered_ -= msg_data->size();
            return;
        }
        self->write_queue_.push(msg_data);
        self->do_write();
    });
}

void WebSocketSession::do_write() {
    if (is_writing_) return;

    if (write_queue_.empty()) {
        if (pending_close_ && !closing_) do_close();
        return;
    }

    is_writing_ = true;
    auto item = write_queue_.front();
    write_queue_.pop();

    auto self = shared_from_this();
    std::visit([&](auto& ws) {
        ws.text(true);
        ws.async_write(net::buffer(*item), [self, item](beast::error_code ec, std::size_t bytes) {
            self->on_write(ec, bytes, item->size());
        });
    }, ws_);
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t, size_t size) {
    is_writing_ = false;
    buffered_ -= size;

    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE,
                            remote_addr_, "WS Write Error: " + ec.message());
        open_ = false;
        return;
    }

    do_write();
}

// Flushes queued writes, then sends the close frame with the application code.
void WebSocketSession::close(WsCloseCode code, const std::string& reason) {
    if (!open_.exchange(false)) return;

    websocket::close_reason cr(static_cast<std::uint16_t>(code), reason);
    net::post(get_executor(), [self = shared_from_this(), cr]() {
        if (self->pending_close_) return;
        self->pending_close_ = cr;
        self->do_write();
    });
}

void WebSocketSession::do_close() {
    closing_ = true;
    auto self = shared_from_this();
    std::visit([&](auto& ws) {
        ws.async_close(*pending_close_, [self](beast::error_code ec) {
            if (ec) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE,
                                    self->remote_addr_, "WS Close Error: " + ec.message());
            }
        });
    }, ws_);
}

void WebSocketSession::trigger_close_handler() {
    open_ = false;
    if (close_triggered_.exchange(true)) return;

    auto handler = std::move(on_close_);
    on_message_ = nullptr;
    on_close_ = nullptr;
    if (handler) handler(shared_from_this());
}

void WebSocketSession::set_attachment(const std::string& data) {
    std::lock_guard<std::mutex> lock(attachment_mutex_);
    attachment_ = data;
}

std::optional<std::string> WebSocketSession::attachment() const {
    std::lock_guard<std::mutex> lock(attachment_mutex_);
    return attachment_;
}

}
