#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdlib>

#include "server_config.hpp"
#include "actor_registry.hpp"
#include "grant.hpp"
#include "redis_manager.hpp"
#include "redis_storage.hpp"
#include "memory_storage.hpp"
#include "usage_reporter.hpp"
#include "http_session.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace erebus {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ActorRegistry& registry,
        const GrantVerifier& verifier
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , registry_(registry)
        , verifier_(verifier)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

    size_t open_connections() const { return open_connections_.load(); }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ActorRegistry& registry_;
    const GrantVerifier& verifier_;

    std::atomic<size_t> open_connections_{0};

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == net::error::operation_aborted) return;
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED,
                                "internal", "Accept error: " + ec.message());
        } else {
            std::string remote_ip;
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            remote_ip = ep_ec ? "unknown" : ep.address().to_string();

            if (open_connections_.load() >= config_.max_global_connections) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CAPACITY_EXCEEDED,
                                    remote_ip, "Global connection limit reached");
                MetricsRegistry::instance().increment_counter("erebus_global_limit_rejected_total");
                // Socket is closed when it goes out of scope here
            } else {
                // Released when the session tree (HTTP or upgraded WebSocket) is destroyed
                open_connections_++;
                auto guard = std::shared_ptr<void>(nullptr, [self_ref = shared_from_this()](void*) {
                    self_ref->open_connections_--;
                });

                if (config_.enable_tls) {
                    auto stream = beast::ssl_stream<beast::tcp_stream>(
                        beast::tcp_stream(std::move(socket)),
                        ssl_ctx_
                    );

                    std::make_shared<HttpSession>(
                        std::move(stream),
                        config_,
                        registry_,
                        verifier_,
                        guard
                    )->run();
                } else {
                    std::make_shared<HttpSession>(
                        beast::tcp_stream(std::move(socket)),
                        config_,
                        registry_,
                        verifier_,
                        guard
                    )->run();
                }
            }
        }

        do_accept();
    }
};

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

int main(int argc, char* argv[]) {
    using erebus::SecurityLogger;
    try {
        erebus::ServerConfig config;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--tls" || arg == "-t") {
                config.enable_tls = true;
            } else if (arg == "--memory-storage" || arg == "-m") {
                config.storage_backend = "memory";
            } else if (arg == "--verbose" || arg == "-v") {
                config.debug_verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --tls, -t             Serve HTTPS/WSS with certs/server.{crt,key}\n"
                          << "  --no-tls, -n          Disable TLS (for local development)\n"
                          << "  --memory-storage, -m  Keep shard state in-process instead of Redis\n"
                          << "  --verbose, -v         Log per-message debug events\n"
                          << "  --help, -h            Show this help\n";
                return 0;
            } else {
                try {
                    config.port = static_cast<uint16_t>(std::stoi(arg));
                } catch (const std::exception&) {
                    std::cerr << "[!] Unknown argument: " << arg << "\n";
                    return 1;
                }
            }
        }

        // --- Environment Variable Overrides ---
        erebus::apply_env_overrides(config, [](const char* name) { return std::getenv(name); });

        SecurityLogger::set_verbose(config.debug_verbose);

        if (config.allowed_origins.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "No CORS origins configured");
        }

        if (config.location_hint.empty()) {
            std::cerr << "CRITICAL CONFIGURATION ERROR: NO LOCATION HINT\n";
            std::cerr << "Set 'EREBUS_LOCATION_HINT' to the region this process serves.\n";
            return 1;
        }

        erebus::GrantVerifier verifier(config.public_key_jwk);
        if (!verifier.is_configured()) {
            std::cerr << "CRITICAL SECURITY ERROR: NO GRANT VERIFICATION KEY\n";
            std::cerr << "Set 'EREBUS_PUBLIC_KEY_JWK' to the Ed25519 public JWK of the grant issuer.\n";
            return 1;
        }

        if (config.root_api_key.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "No root API key configured; /v1/root/command is disabled");
        }

        if (config.storage_backend != "redis" && config.storage_backend != "memory") {
            std::cerr << "[!] Unknown storage backend '" << config.storage_backend << "' (expected redis or memory)\n";
            return 1;
        }

        if (config.thread_count <= 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        // Initialize environment
        std::filesystem::path exe_path;
        try {
            exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
        } catch (const std::exception& e) {
            std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
            exe_path = std::filesystem::current_path();
        }

        if (config.enable_tls) {
            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }

            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Run 'cmake --build . --target generate_certs' to generate them.\n"
                          << "[*] Or use --no-tls for development without TLS.\n";
                return 1;
            }
        }

        std::cout << R"(
EREBUS PUB/SUB GATEWAY v1.0
)" << (config.enable_tls ? "  TLS 1.2+/1.3 encrypted transport\n"
                         : "  TLS DISABLED (development mode)\n")
   << "  region:  " << config.location_hint << "\n"
   << "  storage: " << config.storage_backend << "\n"
   << "\n";

        auto& metrics = erebus::MetricsRegistry::instance();
        metrics.describe("erebus_active_shards", "Channel shard actors hosted by this process");
        metrics.describe("erebus_active_connections", "Open pub/sub sockets");
        metrics.describe("erebus_publish_rejected_total", "Publish packets refused, by reason code");
        metrics.describe("erebus_shard_replication_failed_total", "Publishes that could not reach a sibling region");

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        erebus::UsageReporter usage(config);
        usage.start();
        if (!usage.enabled()) {
            std::cout << "[*] Usage webhooks disabled (no EREBUS_WEBHOOK_BASE_URL)\n";
        }

        std::unique_ptr<erebus::RedisManager> redis;
        erebus::ActorRegistry::StorageFactory storage_factory;

        if (config.storage_backend == "redis") {
            redis = std::make_unique<erebus::RedisManager>(config);
            if (!redis->is_connected()) {
                std::cerr << "[!] Redis storage selected but " << config.redis_url << " is unreachable\n";
                return 1;
            }
            erebus::RedisManager* r = redis.get();
            storage_factory = [r](const std::string& shard_key) -> std::shared_ptr<erebus::ChannelStorage> {
                return std::make_shared<erebus::RedisStorage>(r->client(), shard_key);
            };
        } else {
            storage_factory = [](const std::string&) -> std::shared_ptr<erebus::ChannelStorage> {
                return std::make_shared<erebus::MemoryStorage>();
            };
        }

        erebus::ActorRegistry registry(ioc.get_executor(), config, verifier, usage, storage_factory, redis.get());

        if (redis) {
            redis->start_rpc_listener(config.location_hint,
                [&registry](const std::string& shard_key, const std::string& payload) {
                    registry.dispatch_rpc(shard_key, payload);
                });
        }

        auto listener = std::make_shared<erebus::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            registry,
            verifier
        );
        listener->run();

        std::cout << "[+] Listening on " << config.address << ":" << config.port << "\n";

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, &registry, &usage, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                                    "Initiating graceful shutdown");
                listener->stop();
                for (auto& actor : registry.actors()) {
                    actor->close_all(erebus::WsCloseCode::InternalServerError, "Server shutting down");
                }
                usage.stop();
                // Give queued close frames a moment, then stop the loop.
                auto timer = std::make_shared<net::steady_timer>(ioc, std::chrono::seconds(2));
                timer->async_wait([&ioc, timer](beast::error_code) { ioc.stop(); });
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
