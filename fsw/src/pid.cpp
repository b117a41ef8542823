#include "kestrel/pid.hpp"

#include <cmath>

namespace kestrel {

namespace {

// Integration band per axis [m]
constexpr double INT_BAND_XY_M = 0.2;
constexpr double INT_BAND_Z_M  = 0.5;

} // namespace

void PidController::initialize(const Config& cfg) {
    const double kp_xy  = cfg.require_range("Kp_xy", 0.0, 100.0);
    const double kp_z   = cfg.require_range("Kp_z", 0.0, 100.0);
    const double kv_xy  = cfg.require_range("Kv_xy", 0.0, 100.0);
    const double kv_z   = cfg.require_range("Kv_z", 0.0, 100.0);
    const double kvi_xy = cfg.require_range("Kvi_xy", 0.0, 100.0);
    const double kvi_z  = cfg.require_range("Kvi_z", 0.0, 100.0);

    kp_  = Eigen::Vector3d(kp_xy, kp_xy, kp_z);
    kv_  = Eigen::Vector3d(kv_xy, kv_xy, kv_z);
    kvi_ = Eigen::Vector3d(kvi_xy, kvi_xy, kvi_z);

    const double int_xy = cfg.optional_range("pxy_int_max", 0.5, 0.0, 10.0);
    const double int_z  = cfg.optional_range("pz_int_max", 0.5, 0.0, 10.0);
    int_max_ = Eigen::Vector3d(int_xy, int_xy, int_z);

    limits_ = VehicleLimits::from_config(cfg, 10.0, 0.1, 1.0);
    initialized_ = true;
    reset();
    resets_ = 0;
}

ControlOutput PidController::step(const VehicleState& state, double dt_s) {
    if (!initialized_ || !std::isfinite(dt_s) || dt_s <= 0.0) {
        return last_output_;
    }
    const VehicleState& s = filter_.accept(state);

    const Eigen::Vector3d e_p = saturate_error(target_.position - s.position, MAX_TRACKING_ERROR);
    const Eigen::Vector3d e_v = saturate_error(target_.velocity - s.velocity, MAX_TRACKING_ERROR);

    for (int i = 0; i < 3; ++i) {
        const double band = (i < 2) ? INT_BAND_XY_M : INT_BAND_Z_M;
        if (std::abs(e_p(i)) >= band) {
            integral_(i) = 0.0;
        } else if (!last_saturated_) {
            integral_(i) = sat(integral_(i) + kvi_(i) * e_p(i) * dt_s, int_max_(i));
        }
    }

    const Eigen::Vector3d accel = target_.acceleration
                                + kp_.cwiseProduct(e_p)
                                + kv_.cwiseProduct(e_v)
                                + integral_;

    AttitudeCommand cmd = map_acceleration(accel, s, limits_);
    cmd.output.yaw_rate = yaw_rate_command(target_.yaw, s.attitude.yaw, limits_);

    last_saturated_ = cmd.saturated;
    if (cmd.saturated) {
        ++saturation_events_;
    }
    last_error_  = e_p;
    last_output_ = cmd.output;
    ++iterations_;
    return last_output_;
}

void PidController::reset() {
    integral_.setZero();
    last_error_.setZero();
    last_output_ = ControlOutput{};
    last_saturated_ = false;
    filter_.reset();
    iterations_ = 0;
    saturation_events_ = 0;
    ++resets_;
}

ControllerStatus PidController::status() const {
    ControllerStatus st;
    st.name = "pid";
    st.gains = {
        {"Kp_xy", kp_.x()},  {"Kp_z", kp_.z()},
        {"Kv_xy", kv_.x()},  {"Kv_z", kv_.z()},
        {"Kvi_xy", kvi_.x()}, {"Kvi_z", kvi_.z()},
    };
    st.last_position_error = last_error_;
    st.disturbance_estimate = integral_;
    st.last_output = last_output_;
    st.iterations = iterations_;
    st.resets = resets_;
    st.saturation_events = saturation_events_;
    st.stale_substitutions = filter_.substitutions();
    return st;
}

} // namespace kestrel
