#include "control_api.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <boost/json.hpp>

namespace json = boost::json;

namespace auvctl {

namespace {

beast::string_view route_path(beast::string_view target) {
    return target.substr(0, target.find('?'));
}

bool is_local_origin(const std::string& origin) {
    for (const char* base : {"http://localhost", "https://localhost", "http://127.0.0.1", "https://127.0.0.1"}) {
        const std::string prefix(base);
        if (origin == prefix || origin.rfind(prefix + ":", 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

ControlApi::ControlApi(const ServerConfig& config, SecurityGateway& gateway,
                       VehicleStateMachine& vehicle, ConnectionManager& conn_manager)
    : config_(config)
    , gateway_(gateway)
    , vehicle_handler_(config, vehicle)
    , health_handler_(config, conn_manager, vehicle)
{}

http::response<http::string_body> ControlApi::handle(const http::request<http::string_body>& req,
                                                     const std::string& remote_addr) {
    MetricsRegistry::instance().increment_counter("http_requests_total");

    http::response<http::string_body> res;
    try {
        const GatewayDecision decision = gateway_.screen(req, remote_addr);
        if (!decision.passed()) {
            res = gateway_.rejection_response(decision, req.version());
        } else {
            res = dispatch(req, remote_addr);
        }
    } catch (const ValidationError& e) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, std::string(req.target()) + ": " + e.what());
        res = handle_error(http::status::bad_request, req.version(), e.what());
    } catch (const std::exception& e) {
        // The response is settled before anything else can fail.
        res = handle_error(http::status::internal_server_error, req.version(), "Internal server error");
        res.keep_alive(false);
        MetricsRegistry::instance().increment_counter("gateway_rejected_total", {{"category", "internal_error"}});
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::INTERNAL_ERROR,
                            remote_addr, std::string(req.target()) + ": " + e.what());
    }

    gateway_.add_security_headers(res);
    add_cors_headers(res, req);
    res.keep_alive(res.keep_alive() && req.keep_alive());
    return res;
}

http::response<http::string_body> ControlApi::handle_oversize(unsigned version, const std::string& remote_addr,
                                                              const std::string& detail) {
    MetricsRegistry::instance().increment_counter("http_requests_total");
    auto res = gateway_.rejection_response(gateway_.reject_oversize(remote_addr, detail), version);
    res.keep_alive(false);
    return res;
}

// --- Routing Table ---
http::response<http::string_body> ControlApi::dispatch(const http::request<http::string_body>& req,
                                                       const std::string& remote_addr) {
    const auto path = route_path(req.target());
    const auto method = req.method();
    const unsigned version = req.version();

    if (method == http::verb::options) {
        return handle_cors_preflight(version);
    }

    if (path == "/status") {
        if (method != http::verb::get) return handle_method_not_allowed(version, "GET, OPTIONS");
        return vehicle_handler_.handle_status(version);
    }
    if (path == "/pitch" || path == "/yaw" || path == "/prop") {
        if (method != http::verb::post) return handle_method_not_allowed(version, "POST, OPTIONS");
        const ControlChannel channel = path == "/pitch" ? ControlChannel::PITCH_FIN
                                     : path == "/yaw"   ? ControlChannel::YAW_FIN
                                                        : ControlChannel::PROP;
        return vehicle_handler_.handle_set_control(req, channel);
    }

    // Health & Metrics
    if (path == "/health") {
        if (method != http::verb::get) return handle_method_not_allowed(version, "GET, OPTIONS");
        return health_handler_.handle_health(version);
    }
    if (path == "/metrics") {
        if (method != http::verb::get) return handle_method_not_allowed(version, "GET, OPTIONS");
        if (!health_handler_.verify_admin_request(req, remote_addr)) {
            // Do not advertise the endpoint to unauthorised callers.
            return handle_not_found(version);
        }
        return health_handler_.handle_metrics(version);
    }

    return handle_not_found(version);
}

http::response<http::string_body> ControlApi::handle_cors_preflight(unsigned version) {
    http::response<http::string_body> res{http::status::no_content, version};
    res.prepare_payload();
    return res;
}

http::response<http::string_body> ControlApi::handle_not_found(unsigned version) {
    return handle_error(http::status::not_found, version, "Not Found");
}

http::response<http::string_body> ControlApi::handle_method_not_allowed(unsigned version, const char* allow) {
    auto res = handle_error(http::status::method_not_allowed, version, "Method Not Allowed");
    res.set(http::field::allow, allow);
    return res;
}

http::response<http::string_body> ControlApi::handle_error(http::status status, unsigned version,
                                                           const std::string& message) {
    json::object response;
    response["error"] = message;

    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

void ControlApi::add_cors_headers(http::response<http::string_body>& res,
                                  const http::request<http::string_body>& req) const {
    std::string origin;
    auto origin_it = req.find(http::field::origin);
    if (origin_it != req.end()) {
        origin = std::string(origin_it->value());
    }

    for (const auto& allowed : config_.allowed_origins) {
        if (allowed == "*" || (!origin.empty() && allowed == origin)) {
            res.set(http::field::access_control_allow_origin, origin.empty() ? allowed : origin);
            break;
        }
    }

    // Local browser clients during development.
    if (!res.count(http::field::access_control_allow_origin) && !origin.empty()) {
        if (is_local_origin(origin)) {
            res.set(http::field::access_control_allow_origin, origin);
        }
    }

    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, X-Admin-Token");
    res.set(http::field::access_control_max_age, "86400");
    res.set(http::field::vary, "Origin");
}

}
