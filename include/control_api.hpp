#pragma once

#include <boost/beast/http.hpp>
#include <string>

#include "server_config.hpp"
#include "security_gateway.hpp"
#include "vehicle_state_machine.hpp"
#include "connection_manager.hpp"
#include "handlers/vehicle_handler.hpp"
#include "handlers/health_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace auvctl {

// Request dispatcher shared by every session. Each request is screened by the
// gateway, routed, and answered with a complete response; no exception
// escapes handle().
class ControlApi {
public:
    ControlApi(const ServerConfig& config, SecurityGateway& gateway,
               VehicleStateMachine& vehicle, ConnectionManager& conn_manager);

    http::response<http::string_body> handle(const http::request<http::string_body>& req,
                                             const std::string& remote_addr);

    // Answers a request the transport refused to finish reading.
    http::response<http::string_body> handle_oversize(unsigned version, const std::string& remote_addr,
                                                      const std::string& detail);

private:
    const ServerConfig& config_;
    SecurityGateway& gateway_;

    VehicleHandler vehicle_handler_;
    HealthHandler health_handler_;

    http::response<http::string_body> dispatch(const http::request<http::string_body>& req,
                                               const std::string& remote_addr);

    http::response<http::string_body> handle_cors_preflight(unsigned version);
    http::response<http::string_body> handle_not_found(unsigned version);
    http::response<http::string_body> handle_method_not_allowed(unsigned version, const char* allow);
    http::response<http::string_body> handle_error(http::status status, unsigned version,
                                                   const std::string& message);

    void add_cors_headers(http::response<http::string_body>& res,
                          const http::request<http::string_body>& req) const;
};

}
