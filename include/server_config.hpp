#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace auvctl {


// Core server configuration and gateway policy definitions.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection & Resource Management ---
    int request_timeout_sec = 10;           // bounds both request read and response write
    size_t max_connections_per_ip = 16;
    size_t max_global_connections = 10000;

    // --- Payload Ceilings ---
    size_t max_request_bytes = 10 * 1024;   // body + query + header values
    size_t max_field_bytes = 1024;          // any single inspected field
    size_t max_header_bytes = 8 * 1024;     // parser header limit
    size_t max_json_depth = 8;

    // --- Sliding-Window Rate Limiting (per client address) ---
    size_t rate_limit_capacity = 300;
    int rate_limit_window_sec = 60;
    int rate_limit_block_sec = 300;
    size_t max_tracked_clients = 100000;
    int limiter_cleanup_interval_sec = 60;

    // --- Simulation ---
    int tick_interval_ms = 20;

    // --- Identity & Secrets ---
    std::string secret_salt = "auvctl_default_deployment_salt"; // MUST be overridden via ENV in production
    std::string admin_token = ""; // Used for privileged metrics access

    // --- Reverse Proxy ---
    // Override-style headers the fronting proxy adds itself; exempt from the
    // forbidden-header rule. Empty means every such header is rejected.
    std::vector<std::string> trusted_proxy_headers = {};

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};

    // Throws std::invalid_argument describing the first inconsistent setting.
    void validate() const;
};

// Applies AUVCTL_* environment overrides on top of the current values.
// Malformed numbers raise std::invalid_argument naming the variable.
void apply_env_overrides(ServerConfig& config);

}
