#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "vehicle_state_machine.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace auvctl {

// Telemetry and control endpoints. Requests reaching this handler have
// already passed the security gateway.
class VehicleHandler {
public:
    VehicleHandler(const ServerConfig& config, VehicleStateMachine& vehicle)
        : config_(config), vehicle_(vehicle) {}

    http::response<http::string_body> handle_status(unsigned version);

    /**
     * Applies {"value": <number>} to one control channel and echoes the
     * stored setting as {"<channel>": n}.
     * @throws ValidationError when the body does not carry a finite number.
     */
    http::response<http::string_body> handle_set_control(const http::request<http::string_body>& req,
                                                         ControlChannel channel);

    static json::object status_to_json(const VehicleState& state);

private:
    const ServerConfig& config_;
    VehicleStateMachine& vehicle_;
};

} // namespace auvctl
