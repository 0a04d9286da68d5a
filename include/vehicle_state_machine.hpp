#pragma once

#include <cstdint>
#include <mutex>

namespace auvctl {

struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// Degrees. Yaw and roll wrap to [-180, 180); pitch likewise.
struct Attitude {
    double yaw = 0.0;
    double pitch = 0.0;
    double roll = 0.0;
};

struct Controls {
    int pitch_fin = 0;  // deg
    int yaw_fin = 0;    // deg
    int prop = 0;       // percent of maximum thrust
};

enum class ControlChannel {
    PITCH_FIN,
    YAW_FIN,
    PROP
};

struct ControlRange {
    int min;
    int max;
};

// Hull and actuator constants. Defaults describe a 0.46 m diameter,
// 500 kg torpedo-shaped AUV trimmed to neutral buoyancy.
struct VehicleParams {
    double mass = 500.0;            // kg
    double Ixx = 90.0;              // kg m^2
    double Iyy = 260.0;
    double Izz = 260.0;
    double rho = 1025.0;            // kg/m^3, sea water
    double gravity = 9.80665;       // m/s^2
    double Cd = 0.1;
    double area_ref = 3.14159265358979323846 * (0.4572 / 2) * (0.4572 / 2); // m^2
    double displaced_volume = 500.0 / 1025.0;                               // m^3
    double thrust_max = 9000.0;     // N
    double fin_area = 0.0207;       // m^2
    double fin_lift_slope = 3.5;    // 1/rad
    double fin_x = -1.8;            // m, fin station aft of the centre of gravity
    double fin_ref_speed = 2.0;     // m/s, fin control moment is linear in speed about this point
    double angular_damping = 200.0; // N m s/rad, speed-independent hull damping
};

struct VehicleState {
    Vec3 position;      // m, world frame, z up
    Vec3 velocity;      // m/s, world frame
    Attitude attitude;  // deg
    Vec3 body_rates;    // deg/s: x = roll rate, y = pitch rate, z = yaw rate
    Controls controls;
    double mass = 0.0;
};

// Owns the single authoritative vehicle state. Reads and the two mutators
// (set_control, tick) are serialised by one state lock; nothing else can
// reach the state.
class VehicleStateMachine {
public:
    explicit VehicleStateMachine(VehicleParams params = VehicleParams{});
    ~VehicleStateMachine() = default;

    VehicleStateMachine(const VehicleStateMachine&) = delete;
    VehicleStateMachine& operator=(const VehicleStateMachine&) = delete;

    // Consistent snapshot of the whole state.
    VehicleState get_status() const;

    /**
     * Clamps the request into the channel's range, truncates it to an integer
     * setting, stores it and returns the stored value.
     * Throws ValidationError for NaN or infinite input.
     */
    int set_control(ControlChannel channel, double requested);

    /**
     * Advances the model by dt seconds (semi-implicit Euler).
     * dt == 0 is a no-op. Negative or non-finite dt raises ValidationError;
     * a step that would produce a non-finite state is discarded and raises
     * InternalFailure.
     */
    void tick(double dt);

    // Restores the at-rest initial state with neutral controls.
    void reset();

    uint64_t tick_count() const;
    const VehicleParams& params() const { return params_; }

    static ControlRange range_of(ControlChannel channel);
    static const char* channel_name(ControlChannel channel);
    static int clamp_control(ControlChannel channel, double requested);

    // One integration step on a copy of the state.
    static VehicleState integrate(const VehicleParams& params, const VehicleState& state, double dt);

private:
    VehicleState initial_state() const;

    VehicleParams params_;
    VehicleState state_;
    uint64_t ticks_ = 0;
    mutable std::mutex mutex_;
};

}
