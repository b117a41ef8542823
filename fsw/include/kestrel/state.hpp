#pragma once

#include <Eigen/Dense>

namespace kestrel {

// Euler attitude [rad], body relative to the local level frame.
struct Attitude {
    double roll{};
    double pitch{};
    double yaw{};
};

// One fused sensor snapshot. Position and velocity are in a local frame with z up [m], [m/s].
struct VehicleState {
    double timestamp_s{};
    Eigen::Vector3d position{Eigen::Vector3d::Zero()};
    Eigen::Vector3d velocity{Eigen::Vector3d::Zero()};
    Attitude attitude{};
    double battery_fraction{1.0};
};

// Setpoint held constant between updates from the experiment driver.
struct DesiredState {
    Eigen::Vector3d position{Eigen::Vector3d::Zero()};
    Eigen::Vector3d velocity{Eigen::Vector3d::Zero()};
    Eigen::Vector3d acceleration{Eigen::Vector3d::Zero()};  // feed-forward
    double yaw{};
};

struct ControlOutput {
    double roll{};      // desired roll angle [rad]
    double pitch{};     // desired pitch angle [rad]
    double yaw_rate{};  // desired yaw rate [rad/s]
    double thrust{};    // normalized [0, 1]
};

// Zero tilt, zero yaw rate, the given thrust.
inline ControlOutput neutral_command(double thrust) {
    ControlOutput cmd{};
    cmd.thrust = thrust;
    return cmd;
}

bool is_finite(const VehicleState& state);

} // namespace kestrel
