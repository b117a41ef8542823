#pragma once

#include <Eigen/Dense>

#include "controller.hpp"

namespace kestrel {

// Cascaded position/velocity PID with conditional integration.
//   a_des = a_ff + Kp*e_p + Kv*e_v + integral
// The integral accumulates Kvi*e_p*dt only while the previous output was unsaturated
// and the axis error is inside its integration band.
class PidController : public Controller {
public:
    void initialize(const Config& cfg) override;
    void set_target(const DesiredState& target) override { target_ = target; }
    ControlOutput step(const VehicleState& state, double dt_s) override;
    void reset() override;
    ControllerStatus status() const override;

    const Eigen::Vector3d& integral() const { return integral_; }
    const VehicleLimits& limits() const { return limits_; }

private:
    // Per-axis gains, x and y share the *_xy values
    Eigen::Vector3d kp_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d kv_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d kvi_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d int_max_{Eigen::Vector3d::Zero()};

    VehicleLimits limits_{};
    bool initialized_{false};

    DesiredState target_{};
    Eigen::Vector3d integral_{Eigen::Vector3d::Zero()};
    Eigen::Vector3d last_error_{Eigen::Vector3d::Zero()};
    ControlOutput last_output_{};
    bool last_saturated_{false};
    SnapshotFilter filter_{};

    unsigned long iterations_{0};
    unsigned long resets_{0};
    unsigned long saturation_events_{0};
};

} // namespace kestrel
