#include "server_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace auvctl {

namespace {

long long parse_integer(const char* name, const char* raw, long long min, long long max) {
    std::string text(raw);
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be an integer");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string(name) + " must be an integer");
    }
    if (value < min || value > max) {
        throw std::invalid_argument(std::string(name) + " out of range [" +
                                    std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return value;
}

template<typename T>
void override_integer(const char* name, T& target, long long min, long long max) {
    if (const char* raw = std::getenv(name)) {
        target = static_cast<T>(parse_integer(name, raw, min, max));
    }
}

std::vector<std::string> split_list(const std::string& input) {
    std::vector<std::string> out;
    std::string rest = input;
    size_t pos = 0;
    while ((pos = rest.find(',')) != std::string::npos) {
        if (pos > 0) out.push_back(rest.substr(0, pos));
        rest.erase(0, pos + 1);
    }
    if (!rest.empty()) {
        out.push_back(rest);
    }
    return out;
}

} // namespace

void ServerConfig::validate() const {
    if (rate_limit_capacity == 0) {
        throw std::invalid_argument("rate_limit_capacity must be positive");
    }
    if (rate_limit_window_sec <= 0 || rate_limit_block_sec <= 0) {
        throw std::invalid_argument("rate limit window and block duration must be positive");
    }
    if (tick_interval_ms <= 0) {
        throw std::invalid_argument("tick_interval_ms must be positive");
    }
    if (request_timeout_sec <= 0) {
        throw std::invalid_argument("request_timeout_sec must be positive");
    }
    if (max_field_bytes == 0 || max_field_bytes > max_request_bytes) {
        throw std::invalid_argument("max_field_bytes must be in (0, max_request_bytes]");
    }
    if (limiter_cleanup_interval_sec <= 0) {
        throw std::invalid_argument("limiter_cleanup_interval_sec must be positive");
    }
    if (max_tracked_clients == 0 || max_connections_per_ip == 0 || max_global_connections == 0) {
        throw std::invalid_argument("client and connection caps must be positive");
    }
    if (enable_tls && (cert_path.empty() || key_path.empty())) {
        throw std::invalid_argument("TLS enabled without certificate/key paths");
    }
}

void apply_env_overrides(ServerConfig& config) {
    override_integer("AUVCTL_PORT", config.port, 1, 65535);
    if (const char* env_addr = std::getenv("AUVCTL_ADDR")) {
        config.address = env_addr;
    }
    override_integer("AUVCTL_THREADS", config.thread_count, 0, 1024);

    if (const char* env_tls = std::getenv("AUVCTL_TLS")) {
        std::string v(env_tls);
        config.enable_tls = (v == "1" || v == "true" || v == "on");
    }
    if (const char* e = std::getenv("AUVCTL_CERT_PATH")) config.cert_path = e;
    if (const char* e = std::getenv("AUVCTL_KEY_PATH")) config.key_path = e;

    override_integer("AUVCTL_REQUEST_TIMEOUT_SEC", config.request_timeout_sec, 1, 3600);
    override_integer("AUVCTL_MAX_CONNS_PER_IP", config.max_connections_per_ip, 1, 1000000);
    override_integer("AUVCTL_MAX_CONNS", config.max_global_connections, 1, 10000000);

    // Payload ceilings
    override_integer("AUVCTL_MAX_REQUEST_BYTES", config.max_request_bytes, 64, 64 * 1024 * 1024);
    override_integer("AUVCTL_MAX_FIELD_BYTES", config.max_field_bytes, 16, 64 * 1024 * 1024);

    // Rate limiting
    override_integer("AUVCTL_RATE_LIMIT", config.rate_limit_capacity, 1, 100000000);
    override_integer("AUVCTL_RATE_WINDOW_SEC", config.rate_limit_window_sec, 1, 86400);
    override_integer("AUVCTL_BLOCK_SEC", config.rate_limit_block_sec, 1, 86400);
    override_integer("AUVCTL_MAX_TRACKED_CLIENTS", config.max_tracked_clients, 1, 100000000);

    override_integer("AUVCTL_TICK_MS", config.tick_interval_ms, 1, 10000);

    if (const char* env_salt = std::getenv("AUVCTL_SECRET_SALT")) {
        config.secret_salt = env_salt;
    }
    if (const char* env_admin = std::getenv("AUVCTL_ADMIN_TOKEN")) {
        config.admin_token = env_admin;
    }
    if (const char* env_origins = std::getenv("AUVCTL_ALLOWED_ORIGINS")) {
        config.allowed_origins = split_list(env_origins);
    }
    if (const char* env_proxy = std::getenv("AUVCTL_TRUSTED_PROXY_HEADERS")) {
        config.trusted_proxy_headers = split_list(env_proxy);
    }
}

}
