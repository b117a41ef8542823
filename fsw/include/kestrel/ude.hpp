#pragma once

#include <Eigen/Dense>

#include "controller.hpp"

namespace kestrel {

// Uncertainty and disturbance estimator law.
//   u_nom = a_ff + Kp*e_p + Kd*e_v
//   d_hat' = (e_v - d_hat) / T_ude
//   a_des = u_nom - d_hat
// T_ude trades noise amplification (small) against slow rejection (large).
class UdeController : public Controller {
public:
    void initialize(const Config& cfg) override;
    void set_target(const DesiredState& target) override { target_ = target; }
    ControlOutput step(const VehicleState& state, double dt_s) override;
    void reset() override;
    ControllerStatus status() const override;

    const Eigen::Vector3d& disturbance_estimate() const { return d_hat_; }
    double time_constant() const { return t_ude_; }

private:
    Eigen::Vector3d kp_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d kd_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d d_max_{Eigen::Vector3d::Zero()};
    double t_ude_{1.0};

    VehicleLimits limits_{};
    bool initialized_{false};

    DesiredState target_{};
    Eigen::Vector3d d_hat_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d last_error_{Eigen::Vector3d::Zero()};
    ControlOutput last_output_{};
    SnapshotFilter filter_{};

    unsigned long iterations_{0};
    unsigned long resets_{0};
    unsigned long saturation_events_{0};
};

} // namespace kestrel
