#include "kestrel/ude.hpp"

#include <cmath>

namespace kestrel {

void UdeController::initialize(const Config& cfg) {
    const double kp_xy = cfg.require_range("Kp_xy", 0.0, 100.0);
    const double kp_z  = cfg.require_range("Kp_z", 0.0, 100.0);
    const double kd_xy = cfg.require_range("Kd_xy", 0.0, 100.0);
    const double kd_z  = cfg.require_range("Kd_z", 0.0, 100.0);
    t_ude_ = cfg.require_range("T_ude", 1e-3, 100.0);

    kp_ = Eigen::Vector3d(kp_xy, kp_xy, kp_z);
    kd_ = Eigen::Vector3d(kd_xy, kd_xy, kd_z);

    const double d_xy = cfg.optional_range("pxy_int_max", 1.0, 0.0, 20.0);
    const double d_z  = cfg.optional_range("pz_int_max", 1.0, 0.0, 20.0);
    d_max_ = Eigen::Vector3d(d_xy, d_xy, d_z);

    limits_ = VehicleLimits::from_config(cfg, 20.0, 0.1, 1.0);
    initialized_ = true;
    reset();
    resets_ = 0;
}

ControlOutput UdeController::step(const VehicleState& state, double dt_s) {
    if (!initialized_ || !std::isfinite(dt_s) || dt_s <= 0.0) {
        return last_output_;
    }
    const VehicleState& s = filter_.accept(state);

    const Eigen::Vector3d e_p = saturate_error(target_.position - s.position, MAX_TRACKING_ERROR);
    const Eigen::Vector3d e_v = saturate_error(target_.velocity - s.velocity, MAX_TRACKING_ERROR);

    const Eigen::Vector3d u_nom = target_.acceleration + kp_.cwiseProduct(e_p) + kd_.cwiseProduct(e_v);

    // First-order filter, discretized exactly so any dt lands between d_hat and e_v
    const double alpha = 1.0 - std::exp(-dt_s / t_ude_);
    d_hat_ += (e_v - d_hat_) * alpha;
    for (int i = 0; i < 3; ++i) {
        d_hat_(i) = sat(d_hat_(i), d_max_(i));
    }

    AttitudeCommand cmd = map_acceleration(u_nom - d_hat_, s, limits_);
    cmd.output.yaw_rate = yaw_rate_command(target_.yaw, s.attitude.yaw, limits_);

    if (cmd.saturated) {
        ++saturation_events_;
    }
    last_error_  = e_p;
    last_output_ = cmd.output;
    ++iterations_;
    return last_output_;
}

void UdeController::reset() {
    d_hat_.setZero();
    last_error_.setZero();
    last_output_ = ControlOutput{};
    filter_.reset();
    iterations_ = 0;
    saturation_events_ = 0;
    ++resets_;
}

ControllerStatus UdeController::status() const {
    ControllerStatus st;
    st.name = "ude";
    st.gains = {
        {"Kp_xy", kp_.x()}, {"Kp_z", kp_.z()},
        {"Kd_xy", kd_.x()}, {"Kd_z", kd_.z()},
        {"T_ude", t_ude_},
    };
    st.last_position_error = last_error_;
    st.disturbance_estimate = d_hat_;
    st.last_output = last_output_;
    st.iterations = iterations_;
    st.resets = resets_;
    st.saturation_events = saturation_events_;
    st.stale_substitutions = filter_.substitutions();
    return st;
}

} // namespace kestrel
