#pragma once

#include <algorithm>

#include <Eigen/Dense>

#include "kestrel/config.hpp"
#include "kestrel/controller.hpp"
#include "kestrel/state.hpp"

namespace kestrel {
namespace test {

constexpr double HOV = 0.5;
constexpr double QUAD_MASS = 0.087;

inline Config pid_config() {
    Config c;
    c.set("quad_mass", QUAD_MASS);
    c.set("hov_percent", HOV);
    c.set("Kp_xy", 2.0);
    c.set("Kp_z", 2.0);
    c.set("Kv_xy", 2.0);
    c.set("Kv_z", 2.0);
    c.set("Kvi_xy", 0.3);
    c.set("Kvi_z", 0.3);
    return c;
}

inline Config ude_config() {
    Config c;
    c.set("quad_mass", QUAD_MASS);
    c.set("hov_percent", HOV);
    c.set("Kp_xy", 0.5);
    c.set("Kp_z", 0.5);
    c.set("Kd_xy", 2.0);
    c.set("Kd_z", 2.0);
    c.set("T_ude", 1.0);
    return c;
}

inline Config adrc_config() {
    Config c;
    c.set("quad_mass", QUAD_MASS);
    c.set("hov_percent", HOV);
    c.set("k", 0.8);
    c.set("k1", -0.15);
    c.set("k2", -3.0);
    c.set("c1", 1.5);
    c.set("c2", 0.6);
    c.set("lambda_D", 1.0);
    c.set("beta_max", 1.0);
    c.set("gamma", 0.2);
    c.set("lambda", 0.8);
    c.set("sigma", 0.9);
    c.set("omega_star", 0.02);
    c.set("t1", 0.02);
    c.set("t2", 0.04);
    c.set("l", 5.0);
    return c;
}

inline VehicleState state_at(double x, double y, double z) {
    VehicleState s{};
    s.position = Eigen::Vector3d(x, y, z);
    return s;
}

inline DesiredState target_at(double x, double y, double z) {
    DesiredState t{};
    t.position = Eigen::Vector3d(x, y, z);
    return t;
}

// Point mass with instantaneous attitude tracking, z up.
class PointMassPlant {
public:
    PointMassPlant(double hov_percent, const Eigen::Vector3d& position)
        : hov_(hov_percent), position_(position) {}

    void set_bias(const Eigen::Vector3d& bias) { bias_ = bias; }

    void apply(const ControlOutput& cmd, double dt_s) {
        attitude_.roll = cmd.roll;
        attitude_.pitch = cmd.pitch;
        attitude_.yaw = wrap_pi(attitude_.yaw + cmd.yaw_rate * dt_s);

        const Eigen::Vector3d accel = body_z_axis(attitude_) * (cmd.thrust / hov_ * GRAVITY_MPS2)
                                    - Eigen::Vector3d(0.0, 0.0, GRAVITY_MPS2)
                                    + bias_;
        velocity_ += accel * dt_s;
        position_ += velocity_ * dt_s;
        if (position_.z() < 0.0) {
            position_.z() = 0.0;
            velocity_.z() = std::max(velocity_.z(), 0.0);
        }
        time_s_ += dt_s;
    }

    VehicleState state() const {
        VehicleState s{};
        s.timestamp_s = time_s_;
        s.position = position_;
        s.velocity = velocity_;
        s.attitude = attitude_;
        return s;
    }

private:
    double hov_;
    Eigen::Vector3d position_;
    Eigen::Vector3d velocity_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d bias_{Eigen::Vector3d::Zero()};
    Attitude attitude_{};
    double time_s_{};
};

} // namespace test
} // namespace kestrel
