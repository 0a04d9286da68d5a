#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <functional>

#include "server_config.hpp"
#include "connection_manager.hpp"
#include "http_session.hpp"
#include "control_api.hpp"
#include "security_gateway.hpp"
#include "pattern_validator.hpp"
#include "rate_limiter.hpp"
#include "vehicle_state_machine.hpp"
#include "simulation_ticker.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace auvctl {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        ControlApi& api
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , conn_manager_(conn_manager)
        , api_(api)
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

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    ControlApi& api_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }

        if (ec) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED,
                                "internal", "Accept error: " + ec.message());
        } else {
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            const std::string remote_ip = ep_ec ? "unknown" : ep.address().to_string();

            if (!conn_manager_.try_acquire(remote_ip, config_.max_connections_per_ip,
                                           config_.max_global_connections)) {
                // Socket closes when it goes out of scope.
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                                    remote_ip, "Connection limit reached");
                MetricsRegistry::instance().increment_counter("connections_rejected_total");
            } else {
                // Releases the slot once the session tree is destroyed.
                auto guard = std::shared_ptr<void>(nullptr, [self_ref = shared_from_this(), remote_ip](void*) {
                    self_ref->conn_manager_.release(remote_ip);
                });

                if (config_.enable_tls) {
                    auto stream = beast::ssl_stream<beast::tcp_stream>(
                        beast::tcp_stream(std::move(socket)),
                        ssl_ctx_
                    );
                    std::make_shared<HttpSession>(std::move(stream), config_, api_, guard)->run();
                } else {
                    std::make_shared<HttpSession>(beast::tcp_stream(std::move(socket)), config_, api_, guard)->run();
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
    using auvctl::SecurityLogger;
    try {
        auvctl::ServerConfig config;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--tls" || arg == "-t") {
                config.enable_tls = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --tls, -t      Serve HTTPS (certs/server.crt, certs/server.key)\n"
                          << "  --no-tls, -n   Serve plain HTTP (default)\n"
                          << "  --help, -h     Show this help\n"
                          << "Environment: AUVCTL_PORT, AUVCTL_ADDR, AUVCTL_THREADS, AUVCTL_TLS,\n"
                          << "  AUVCTL_RATE_LIMIT, AUVCTL_RATE_WINDOW_SEC, AUVCTL_BLOCK_SEC,\n"
                          << "  AUVCTL_MAX_REQUEST_BYTES, AUVCTL_TICK_MS, AUVCTL_SECRET_SALT,\n"
                          << "  AUVCTL_TRUSTED_PROXY_HEADERS, ...\n";
                return 0;
            } else {
                try {
                    size_t consumed = 0;
                    const int port = std::stoi(arg, &consumed);
                    if (consumed != arg.size() || port < 1 || port > 65535) {
                        throw std::out_of_range(arg);
                    }
                    config.port = static_cast<uint16_t>(port);
                } catch (const std::exception&) {
                    std::cerr << "[!] Invalid argument: " << arg << " (see --help)\n";
                    return 1;
                }
            }
        }

        // --- Environment Variable Overrides ---
        auvctl::apply_env_overrides(config);
        config.validate();

        static const std::string DEFAULT_SALT = auvctl::ServerConfig{}.secret_salt;
        if (config.secret_salt == DEFAULT_SALT) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "Default secret salt in use; set AUVCTL_SECRET_SALT in production");
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls) {
            std::filesystem::path exe_path;
            try {
                exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
            } catch (const std::exception& e) {
                std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
                exe_path = std::filesystem::current_path();
            }

            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }

            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Set AUVCTL_CERT_PATH / AUVCTL_KEY_PATH, or use --no-tls.\n";
                return 1;
            }
        }

        std::cout << "AUVCTL vehicle control server\n"
                  << "  listening on " << config.address << ":" << config.port
                  << (config.enable_tls ? " (TLS 1.2+)" : " (plain HTTP, development mode)") << "\n"
                  << "  simulation tick " << config.tick_interval_ms << " ms, "
                  << config.thread_count << " worker threads\n\n";

        // Outlives the io_context: connection guards still pending in it release into this.
        auvctl::ConnectionManager conn_manager(config.secret_salt);

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        // --- Core components ---
        auvctl::RateLimiter::Policy policy;
        policy.capacity = config.rate_limit_capacity;
        policy.window = std::chrono::seconds(config.rate_limit_window_sec);
        policy.block = std::chrono::seconds(config.rate_limit_block_sec);
        policy.max_tracked_clients = config.max_tracked_clients;
        auvctl::RateLimiter rate_limiter(policy);

        auvctl::PatternValidator::Limits limits;
        limits.max_field_bytes = config.max_field_bytes;
        limits.max_total_bytes = config.max_request_bytes;
        auvctl::PatternValidator validator(limits, config.trusted_proxy_headers);

        auvctl::SecurityGateway gateway(config, rate_limiter, validator);
        auvctl::VehicleStateMachine vehicle;
        auvctl::ControlApi api(config, gateway, vehicle, conn_manager);

        auvctl::SimulationTicker ticker(ioc, vehicle, std::chrono::milliseconds(config.tick_interval_ms));
        ticker.start();

        const auto cleanup_interval = std::chrono::seconds(config.limiter_cleanup_interval_sec);
        net::steady_timer cleanup_timer(ioc, cleanup_interval);
        std::function<void(beast::error_code)> on_cleanup;
        on_cleanup = [&](beast::error_code ec) {
            if (!ec) {
                rate_limiter.prune_idle();
                cleanup_timer.expires_after(cleanup_interval);
                cleanup_timer.async_wait(on_cleanup);
            }
        };
        cleanup_timer.async_wait(on_cleanup);

        auto listener = std::make_shared<auvctl::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            conn_manager,
            api
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Server started");

        // SIGINT and SIGTERM: stop accepting, stop the simulation, let sessions drain.
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, &ticker, listener, &cleanup_timer](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                                    "Initiating graceful shutdown");
                cleanup_timer.cancel();
                listener->stop();
                ticker.stop();
                ioc.stop();
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
