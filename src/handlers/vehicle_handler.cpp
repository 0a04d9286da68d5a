#include "handlers/vehicle_handler.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"

namespace auvctl {

namespace {

json::object vec_to_json(const Vec3& v) {
    json::object out;
    out["x"] = v.x;
    out["y"] = v.y;
    out["z"] = v.z;
    return out;
}

} // namespace

json::object VehicleHandler::status_to_json(const VehicleState& state) {
    json::object att;
    att["yaw"] = state.attitude.yaw;
    att["pitch"] = state.attitude.pitch;
    att["roll"] = state.attitude.roll;

    json::object controls;
    controls["pitch_fin"] = state.controls.pitch_fin;
    controls["yaw_fin"] = state.controls.yaw_fin;
    controls["prop"] = state.controls.prop;

    json::object response;
    response["pos_m"] = vec_to_json(state.position);
    response["vel_mps"] = vec_to_json(state.velocity);
    response["att_deg"] = std::move(att);
    response["controls"] = std::move(controls);
    return response;
}

http::response<http::string_body> VehicleHandler::handle_status(unsigned version) {
    const VehicleState snapshot = vehicle_.get_status();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(status_to_json(snapshot));
    res.prepare_payload();
    return res;
}

http::response<http::string_body> VehicleHandler::handle_set_control(
    const http::request<http::string_body>& req, ControlChannel channel) {

    const double requested = InputValidator::parse_control_value(req.body(), config_.max_json_depth);
    const int stored = vehicle_.set_control(channel, requested);
    MetricsRegistry::instance().increment_counter("control_updates_total");

    json::object response;
    response[VehicleStateMachine::channel_name(channel)] = stored;

    http::response<http::string_body> res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

} // namespace auvctl
