#include "vehicle_state_machine.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace auvctl {

namespace {

constexpr double kPi = 3.14159265358979323846;

double deg2rad(double d) { return d * kPi / 180.0; }
double rad2deg(double r) { return r * 180.0 / kPi; }

double wrap_degrees(double angle) {
    double wrapped = std::fmod(angle + 180.0, 360.0);
    if (wrapped < 0) wrapped += 360.0;
    return wrapped - 180.0;
}

bool finite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

bool finite(const VehicleState& s) {
    return finite(s.position) && finite(s.velocity) && finite(s.body_rates) &&
           std::isfinite(s.attitude.yaw) && std::isfinite(s.attitude.pitch) &&
           std::isfinite(s.attitude.roll);
}

// Hydrodynamic moment of a control fin pair about the CG, including the
// damping that comes from rotation changing the fin's angle of attack.
// Returns N m. u is forward speed (m/s), rate in rad/s, deflection in rad.
double fin_moment(const VehicleParams& p, double u, double deflection, double rate) {
    const double arm = std::abs(p.fin_x);
    const double lift_per_alpha = 0.5 * p.rho * p.fin_area * p.fin_lift_slope;
    const double control = lift_per_alpha * p.fin_ref_speed * u * deflection * arm;
    const double damping = lift_per_alpha * std::abs(u) * arm * arm * rate;
    return control - damping - p.angular_damping * rate;
}

} // namespace

VehicleStateMachine::VehicleStateMachine(VehicleParams params)
    : params_(params)
{
    state_ = initial_state();
}

VehicleState VehicleStateMachine::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int VehicleStateMachine::set_control(ControlChannel channel, double requested) {
    if (!std::isfinite(requested)) {
        throw ValidationError("value must be a finite number");
    }
    const int value = clamp_control(channel, requested);

    std::lock_guard<std::mutex> lock(mutex_);
    switch (channel) {
        case ControlChannel::PITCH_FIN: state_.controls.pitch_fin = value; break;
        case ControlChannel::YAW_FIN: state_.controls.yaw_fin = value; break;
        case ControlChannel::PROP: state_.controls.prop = value; break;
    }
    return value;
}

void VehicleStateMachine::tick(double dt) {
    if (!std::isfinite(dt) || dt < 0.0) {
        throw ValidationError("dt must be a finite, non-negative duration");
    }
    if (dt == 0.0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    VehicleState next = integrate(params_, state_, dt);
    if (!finite(next)) {
        throw InternalFailure("integration produced a non-finite state; step discarded");
    }
    state_ = next;
    ++ticks_;
}

void VehicleStateMachine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = initial_state();
    ticks_ = 0;
}

uint64_t VehicleStateMachine::tick_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticks_;
}

ControlRange VehicleStateMachine::range_of(ControlChannel channel) {
    switch (channel) {
        case ControlChannel::PITCH_FIN: return {-30, 30};
        case ControlChannel::YAW_FIN: return {-30, 30};
        case ControlChannel::PROP: return {-30, 100};
    }
    return {0, 0};
}

const char* VehicleStateMachine::channel_name(ControlChannel channel) {
    switch (channel) {
        case ControlChannel::PITCH_FIN: return "pitch_fin";
        case ControlChannel::YAW_FIN: return "yaw_fin";
        case ControlChannel::PROP: return "prop";
    }
    return "unknown";
}

int VehicleStateMachine::clamp_control(ControlChannel channel, double requested) {
    const ControlRange range = range_of(channel);
    const double clamped = std::clamp(requested, static_cast<double>(range.min),
                                      static_cast<double>(range.max));
    return static_cast<int>(std::trunc(clamped));
}

// Forces and moments are evaluated on the current state, then rates are
// integrated, then position and attitude from the updated rates.
VehicleState VehicleStateMachine::integrate(const VehicleParams& p, const VehicleState& s, double dt) {
    VehicleState n = s;

    const double yaw = deg2rad(s.attitude.yaw);
    const double pitch = deg2rad(s.attitude.pitch);
    const Vec3 heading{std::cos(pitch) * std::cos(yaw),
                       std::cos(pitch) * std::sin(yaw),
                       std::sin(pitch)};

    const Vec3& v = s.velocity;
    const double speed = std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
    const double u = v.x * heading.x + v.y * heading.y + v.z * heading.z;

    // --- Translational forces (world frame) ---
    const double thrust = p.thrust_max * (s.controls.prop / 100.0);
    const double k_drag = 0.5 * p.rho * p.Cd * p.area_ref;
    const double net_buoyancy = (p.rho * p.displaced_volume - p.mass) * p.gravity;

    const Vec3 force{thrust * heading.x - k_drag * speed * v.x,
                     thrust * heading.y - k_drag * speed * v.y,
                     thrust * heading.z - k_drag * speed * v.z + net_buoyancy};

    n.velocity.x += force.x / p.mass * dt;
    n.velocity.y += force.y / p.mass * dt;
    n.velocity.z += force.z / p.mass * dt;

    // --- Rotational dynamics (body rates) ---
    const double p_rate = deg2rad(s.body_rates.x);
    const double q_rate = deg2rad(s.body_rates.y);
    const double r_rate = deg2rad(s.body_rates.z);

    const double roll_moment = -p.angular_damping * p_rate;
    const double pitch_moment = fin_moment(p, u, deg2rad(s.controls.pitch_fin), q_rate);
    const double yaw_moment = fin_moment(p, u, deg2rad(s.controls.yaw_fin), r_rate);

    n.body_rates.x = rad2deg(p_rate + roll_moment / p.Ixx * dt);
    n.body_rates.y = rad2deg(q_rate + pitch_moment / p.Iyy * dt);
    n.body_rates.z = rad2deg(r_rate + yaw_moment / p.Izz * dt);

    // --- Kinematics with the updated rates ---
    n.position.x += n.velocity.x * dt;
    n.position.y += n.velocity.y * dt;
    n.position.z += n.velocity.z * dt;

    n.attitude.roll = wrap_degrees(s.attitude.roll + n.body_rates.x * dt);
    n.attitude.pitch = wrap_degrees(s.attitude.pitch + n.body_rates.y * dt);
    n.attitude.yaw = wrap_degrees(s.attitude.yaw + n.body_rates.z * dt);

    return n;
}

VehicleState VehicleStateMachine::initial_state() const {
    VehicleState s;
    s.mass = params_.mass;
    return s;
}

}
