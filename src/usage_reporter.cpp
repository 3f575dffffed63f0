#include "usage_reporter.hpp"
#include "metrics.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <openssl/err.h>
#include <chrono>
#include <iostream>
#include <optional>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace erebus {

boost::json::object UsageEvent::to_envelope() const {
    boost::json::object data;
    data["projectId"] = project_id;
    if (key_id) data["keyId"] = *key_id;
    data["payloadLength"] = payload_length;

    boost::json::object payload;
    payload["event"] = event;
    payload["data"] = std::move(data);

    boost::json::object envelope;
    envelope["packetType"] = "usage";
    envelope["payload"] = std::move(payload);
    return envelope;
}

UsageReporter::UsageReporter(const ServerConfig& config)
    : config_(config)
    , endpoint_(parse_endpoint(config.webhook_base_url))
    , ssl_ctx_(ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);

    if (!config.webhook_base_url.empty() && !endpoint_) {
        std::cerr << "[!] Invalid usage webhook URL, usage forwarding disabled: " << config.webhook_base_url << "\n";
    }
}

UsageReporter::~UsageReporter() {
    stop();
}

std::optional<UsageReporter::Endpoint> UsageReporter::parse_endpoint(const std::string& base_url) {
    Endpoint ep;
    std::string rest;
    if (base_url.rfind("https://", 0) == 0) {
        ep.tls = true;
        ep.port = "443";
        rest = base_url.substr(8);
    } else if (base_url.rfind("http://", 0) == 0) {
        ep.port = "80";
        rest = base_url.substr(7);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string base_path = slash == std::string::npos ? "" : rest.substr(slash);
    while (!base_path.empty() && base_path.back() == '/') base_path.pop_back();

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        ep.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (ep.port.empty() || ep.port.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    }
    if (authority.empty()) return std::nullopt;

    ep.host = authority;
    ep.target = base_path + "/api/v1/webhooks/usage";
    return ep;
}

void UsageReporter::start() {
    if (!endpoint_ || running_.exchange(true)) return;
    worker_ = std::thread(&UsageReporter::worker_loop, this);
    std::cout << "[*] Usage reporting to " << endpoint_->host << endpoint_->target << "\n";
}

void UsageReporter::stop() {
    if (!running_.exchange(false)) return;
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void UsageReporter::enqueue(UsageEvent event) {
    if (!endpoint_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= MAX_QUEUE) {
            MetricsRegistry::instance().increment_counter("erebus_usage_dropped_total");
            return;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

size_t UsageReporter::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void UsageReporter::worker_loop() {
    const auto interval = std::chrono::milliseconds(config_.usage_flush_interval_ms);

    while (running_) {
        std::vector<UsageEvent> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval, [this] { return !running_ || !queue_.empty(); });
            while (!queue_.empty() && batch.size() < config_.usage_batch_size) {
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }

        for (const auto& ev : batch) {
            if (post(boost::json::serialize(ev.to_envelope()))) {
                MetricsRegistry::instance().increment_counter("erebus_usage_sent_total");
            } else {
                MetricsRegistry::instance().increment_counter("erebus_usage_failed_total");
            }
        }
    }
}

namespace {

// Drives one request/response over an already connected stream. Every step is async so the
// stream timer and the io_context deadline both apply.
template <class Stream>
void exchange(Stream& stream, http::request<http::string_body>& req, beast::flat_buffer& buffer,
              http::response<http::string_body>& res, beast::error_code& result) {
    http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
        if (ec) {
            result = ec;
            return;
        }
        http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) { result = ec; });
    });
}

}

bool UsageReporter::post(const std::string& body) {
    if (!endpoint_) return false;
    const auto& ep = *endpoint_;
    const auto timeout = std::chrono::milliseconds(config_.usage_request_timeout_ms);

    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);

        http::request<http::string_body> req{http::verb::post, ep.target, 11};
        req.set(http::field::host, ep.host);
        req.set(http::field::user_agent, "erebus-usage/1.0");
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        beast::error_code result = net::error::would_block;

        std::optional<beast::ssl_stream<beast::tcp_stream>> tls_stream;
        std::optional<beast::tcp_stream> plain_stream;
        if (ep.tls) {
            tls_stream.emplace(ioc, ssl_ctx_);
            if (!SSL_set_tlsext_host_name(tls_stream->native_handle(), ep.host.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "Failed to set SNI hostname");
            }
        } else {
            plain_stream.emplace(ioc);
        }
        beast::tcp_stream& lowest = ep.tls ? beast::get_lowest_layer(*tls_stream) : *plain_stream;

        resolver.async_resolve(ep.host, ep.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                result = ec;
                return;
            }
            lowest.expires_after(timeout);
            lowest.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) {
                    result = ec;
                    return;
                }
                if (!ep.tls) {
                    exchange(*plain_stream, req, buffer, res, result);
                    return;
                }
                tls_stream->async_handshake(ssl::stream_base::client, [&](beast::error_code ec) {
                    if (ec) {
                        result = ec;
                        return;
                    }
                    exchange(*tls_stream, req, buffer, res, result);
                });
            });
        });

        // The stream timer does not cover name resolution; the run deadline covers everything.
        ioc.run_for(timeout);
        if (!ioc.stopped()) {
            resolver.cancel();
            beast::error_code ignored;
            lowest.socket().close(ignored);
            ioc.run();
            std::cerr << "[!] Usage webhook timed out after " << timeout.count() << "ms\n";
            return false;
        }
        if (result) {
            std::cerr << "[!] Usage webhook failed: " << result.message() << "\n";
            return false;
        }

        beast::error_code ec;
        lowest.socket().shutdown(tcp::socket::shutdown_both, ec);

        if (http::to_status_class(res.result()) != http::status_class::successful) {
            std::cerr << "[!] Usage webhook returned HTTP " << res.result_int() << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[!] Usage webhook failed: " << e.what() << "\n";
        return false;
    }
}

}
