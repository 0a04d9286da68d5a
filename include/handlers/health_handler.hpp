#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "connection_manager.hpp"
#include "vehicle_state_machine.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace auvctl {

class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, ConnectionManager& conn_manager,
                  const VehicleStateMachine& vehicle)
        : config_(config), conn_manager_(conn_manager), vehicle_(vehicle) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Metrics are served to loopback peers, or to anyone presenting the
    // configured admin token.
    bool verify_admin_request(const http::request<http::string_body>& req,
                              const std::string& remote_addr) const;

    static bool is_loopback(const std::string& remote_addr);

private:
    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    const VehicleStateMachine& vehicle_;
};

} // namespace auvctl
