#include "handlers/health_handler.hpp"
#include <openssl/crypto.h>

namespace auvctl {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["tick_hz"] = config_.tick_interval_ms > 0 ? 1000.0 / config_.tick_interval_ms : 0.0;
    response["tls"] = config_.enable_tls;
    response["ticks"] = vehicle_.tick_count();
    response["active_connections"] = static_cast<int64_t>(conn_manager_.connection_count());

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    MetricsRegistry::instance().set_gauge("active_connections",
                                          static_cast<double>(conn_manager_.connection_count()));
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();
    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req,
                                         const std::string& remote_addr) const {
    if (is_loopback(remote_addr)) {
        return true;
    }

    // No token configured: remote admin access is disabled.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    if (provided_token.size() != config_.admin_token.size()) {
        return false;
    }
    return CRYPTO_memcmp(provided_token.data(), config_.admin_token.data(), provided_token.size()) == 0;
}

bool HealthHandler::is_loopback(const std::string& remote_addr) {
    return remote_addr == "127.0.0.1" || remote_addr == "::1" || remote_addr == "::ffff:127.0.0.1";
}

} // namespace auvctl
