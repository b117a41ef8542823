#include "kestrel/adrc.hpp"

#include <algorithm>
#include <cmath>

namespace kestrel {

namespace {

// Observer integration step limit relative to its bandwidth
constexpr double OBSERVER_STEP_FACTOR = 0.2;

// Longer intervals are integrated in MAX_SUBSTEPS coarser steps
constexpr double MAX_SUBSTEPS = 1000.0;

int substeps(double dt_s, double h_max) {
    const double n = std::ceil(dt_s / h_max - 1e-9);
    return static_cast<int>(std::min(std::max(n, 1.0), MAX_SUBSTEPS));
}

} // namespace

// --- TrackingDifferentiator ---

void TrackingDifferentiator::prime(double input) {
    r_ = input;
    r_dot_ = 0.0;
    primed_ = true;
}

void TrackingDifferentiator::update(double input, double dt_s) {
    if (!primed_) {
        prime(input);
        return;
    }
    if (dt_s > MAX_SUBSTEPS * 0.5 * std::min(t1_, t2_)) {
        // Settled long before the end of such a gap
        r_ = input;
        r_dot_ = 0.0;
        return;
    }
    const double t12 = t1_ * t2_;
    const int n = substeps(dt_s, 0.5 * std::min(t1_, t2_));
    const double h = dt_s / n;
    for (int k = 0; k < n; ++k) {
        const double r_ddot = -(r_ - input) / t12 - (t1_ + t2_) / t12 * r_dot_;
        r_ += r_dot_ * h;
        r_dot_ += r_ddot * h;
    }
}

void TrackingDifferentiator::reset() {
    r_ = 0.0;
    r_dot_ = 0.0;
    primed_ = false;
}

// --- AmesoObserver ---

AmesoObserver::Vector9d AmesoObserver::basis(double z, double z_dot) {
    Vector9d phi;
    phi << 1.0,
           std::sin(z), std::sin(z_dot),
           std::cos(z), std::cos(z_dot),
           std::sin(2.0 * z), std::sin(2.0 * z_dot),
           std::cos(2.0 * z), std::cos(2.0 * z_dot);
    return phi;
}

void AmesoObserver::prime(double height_m, double rate_mps) {
    z_ = Eigen::Vector3d(height_m, rate_mps, 0.0);
    f_hat_ = 0.0;
    innovation_ = 0.0;
    primed_ = true;
}

bool AmesoObserver::propagate(double height_m, double u, double dt_s, bool adapt) {
    const double l = params_.l;
    const int n = substeps(dt_s, OBSERVER_STEP_FACTOR / l);
    const double h = dt_s / n;

    bool dead_zone = false;
    for (int k = 0; k < n; ++k) {
        const double e = height_m - z_(0);
        const Vector9d phi = basis(height_m, z_(1));
        const double f_a = w_.dot(phi);

        const Eigen::Vector3d z_dot(
            z_(1) + 3.0 * l * e,
            u + f_a + z_(2) + 3.0 * l * l * e,
            l * l * l * e);

        if (adapt && std::abs(e) >= params_.omega_star) {
            w_ += (params_.lambda * e * phi - params_.sigma * params_.lambda * std::abs(e) * w_) * h;
        } else if (adapt) {
            dead_zone = true;
        }
        z_ += z_dot * h;
    }
    return dead_zone;
}

void AmesoObserver::update(double height_m, double u, double dt_s) {
    if (!primed_) {
        prime(height_m, 0.0);
        return;
    }
    if (!std::isfinite(height_m) || !std::isfinite(u)) {
        frozen_ = true;
        ++divergences_;
        return;
    }
    const Eigen::Vector3d z_prev = z_;
    const Vector9d w_prev = w_;

    innovation_ = height_m - z_(0);
    const bool dead_zone = propagate(height_m, u, dt_s, true);

    const double f_total = w_.dot(basis(height_m, z_(1))) + z_(2);
    if (std::isfinite(f_total) && z_.allFinite() && w_.allFinite() &&
        std::abs(f_total) <= params_.disturbance_max) {
        f_hat_ = f_total;
        frozen_ = dead_zone;
        return;
    }

    // Adaptation frozen for this tick and the last valid estimate kept.
    // Height and rate keep tracking the measurement with the residual bounded.
    ++divergences_;
    frozen_ = true;
    z_ = z_prev;
    w_ = w_prev;
    propagate(height_m, u, dt_s, false);
    z_(2) = sat(z_(2), params_.disturbance_max);
    if (!z_.allFinite()) {
        z_ = z_prev;
    }
}

void AmesoObserver::reset() {
    z_.setZero();
    w_.setZero();
    f_hat_ = 0.0;
    innovation_ = 0.0;
    frozen_ = false;
    primed_ = false;
    divergences_ = 0;
}

// --- SlidingModeLaw ---

double SlidingModeLaw::variable_exponent(double x) const {
    const double ax = std::abs(x);
    const double shift = std::min(params_.beta_max, std::pow(ax, params_.gamma));
    const double beta = 1.0 + shift * (ax > 1.0 ? 1.0 : -1.0);
    return std::min(std::max(beta, 0.1), params_.beta_max + 1.0);
}

double SlidingModeLaw::switching_gain(double s_abs) const {
    return std::min(params_.beta_max, std::pow(s_abs, params_.gamma));
}

double SlidingModeLaw::boundary_sat(double s, double width) {
    return sat(s / width, 1.0);
}

double SlidingModeLaw::sig_pow(double x, double beta) {
    if (std::abs(x) < 1e-6) {
        return x;
    }
    return sign(x) * std::pow(std::abs(x), beta);
}

void SlidingModeLaw::prime(double e_p, double e_v) {
    e_n1_ = e_p;
    e_n2_ = e_v;
    integral_ = 0.0;
    s_ = params_.c1 * e_n1_ + params_.c2 * e_n2_;
    primed_ = true;
}

double SlidingModeLaw::update(double e_p, double e_v, double dt_s) {
    if (!primed_) {
        prime(e_p, e_v);
    }
    const Params& p = params_;

    const double eb1 = sig_pow(e_n1_, variable_exponent(e_n1_));
    const double eb2 = sig_pow(e_n2_, variable_exponent(e_n2_));

    s_ = p.c1 * e_n1_ + p.c2 * e_n2_ + p.lambda_D * integral_;
    const double rho = switching_gain(std::abs(s_));

    const double a_n = -p.k * rho * boundary_sat(s_, p.boundary_width) / p.c2
                     - (p.c1 / p.c2) * e_n2_
                     - p.lambda_D * (p.c1 / p.c2) * eb1
                     - p.lambda_D * eb2;
    const double a_f = p.k1 * (e_p - e_n1_) + p.k2 * (e_v - e_n2_);

    // Nominal model
    integral_ += (p.c1 * eb1 + p.c2 * eb2) * dt_s;
    e_n1_ += e_n2_ * dt_s;
    e_n2_ += a_n * dt_s;

    return a_n + a_f;
}

void SlidingModeLaw::reset() {
    e_n1_ = 0.0;
    e_n2_ = 0.0;
    integral_ = 0.0;
    s_ = 0.0;
    primed_ = false;
}

// --- AdrcController ---

void AdrcController::initialize(const Config& cfg) {
    SlidingModeLaw::Params sp;
    sp.k        = cfg.require_range("k", 0.0, 100.0);
    sp.k1       = cfg.require_range("k1", -100.0, 100.0);
    sp.k2       = cfg.require_range("k2", -100.0, 100.0);
    sp.c1       = cfg.require_range("c1", 1e-6, 100.0);
    sp.c2       = cfg.require_range("c2", 1e-6, 100.0);
    sp.lambda_D = cfg.require_range("lambda_D", 0.0, 100.0);
    sp.beta_max = cfg.require_range("beta_max", 1e-3, 10.0);
    sp.gamma    = cfg.require_range("gamma", 1e-3, 10.0);
    sp.boundary_width = cfg.optional_range("boundary_width", 1.0, 1e-6, 100.0);

    AmesoObserver::Params op;
    op.l          = cfg.require_range("l", 1e-3, 1000.0);
    op.lambda     = cfg.require_range("lambda", 0.0, 100.0);
    op.sigma      = cfg.require_range("sigma", 0.0, 100.0);
    op.omega_star = cfg.require_range("omega_star", 0.0, 100.0);
    op.disturbance_max = cfg.optional_range("disturbance_max", 20.0, 1e-3, 1000.0);

    const double t1 = cfg.require_range("t1", 1e-4, 10.0);
    const double t2 = cfg.require_range("t2", 1e-4, 10.0);

    limits_ = VehicleLimits::from_config(cfg, 10.0, 0.3, 0.7);

    // Horizontal PID shares the vehicle description
    Config xy;
    const double kp = cfg.optional_range("kp", 2.0, 0.0, 100.0);
    const double ki = cfg.optional_range("ki", 0.3, 0.0, 100.0);
    const double kd = cfg.optional_range("kd", 2.0, 0.0, 100.0);
    xy.set("Kp_xy", kp);
    xy.set("Kp_z", kp);
    xy.set("Kv_xy", kd);
    xy.set("Kv_z", kd);
    xy.set("Kvi_xy", ki);
    xy.set("Kvi_z", ki);
    xy.set("quad_mass", limits_.quad_mass_kg);
    xy.set("hov_percent", limits_.hov_percent);
    xy.set("tilt_angle_max", limits_.max_tilt_rad * 180.0 / 3.14159265358979323846);
    xy.set("thrust_min", limits_.thrust_min);
    xy.set("thrust_max", limits_.thrust_max);
    xy.set("K_yaw", limits_.k_yaw);
    xy.set("yaw_rate_max", limits_.yaw_rate_max_radps);
    xy.set("pxy_int_max", cfg.optional_range("int_max_xy", 0.5, 0.0, 10.0));
    xy.set("pz_int_max", cfg.optional_range("int_max_z", 0.5, 0.0, 10.0));
    xy_pid_.initialize(xy);
    xy_pid_.set_target(target_);

    td_ = TrackingDifferentiator(t1, t2);
    observer_ = AmesoObserver(op);
    smc_ = SlidingModeLaw(sp);
    initialized_ = true;
    reset();
    resets_ = 0;
}

void AdrcController::set_target(const DesiredState& target) {
    target_ = target;
    xy_pid_.set_target(target);
}

ControlOutput AdrcController::step(const VehicleState& state, double dt_s) {
    if (!initialized_ || !std::isfinite(dt_s) || dt_s <= 0.0) {
        return last_output_;
    }
    const VehicleState& s = filter_.accept(state);
    const double y = s.position.z();

    // 1. Reference
    if (!td_.primed()) {
        td_.prime(target_.position.z());
    } else {
        td_.update(target_.position.z(), dt_s);
    }

    // 2. Observer, driven by the command applied over the last interval
    if (!observer_.primed()) {
        observer_.prime(y, s.velocity.z());
    } else {
        observer_.update(y, u_applied_, dt_s);
    }

    // 3. Sliding-mode law on the estimated errors
    const double e_p = sat(observer_.height() - td_.reference(), MAX_TRACKING_ERROR);
    const double e_v = sat(observer_.rate() - (td_.rate() + target_.velocity.z()), MAX_TRACKING_ERROR);
    if (!smc_.primed()) {
        smc_.prime(e_p, e_v);
    }
    const double a_smc = smc_.update(e_p, e_v, dt_s);

    // 4. Vertical thrust
    bool saturated = false;
    double a_z = GRAVITY_MPS2 + target_.acceleration.z() + a_smc - observer_.disturbance();
    if (!std::isfinite(a_z) || a_z < 0.01) {
        a_z = GRAVITY_MPS2;
        saturated = true;
    }
    const double tilt = std::max(0.5, std::cos(s.attitude.roll) * std::cos(s.attitude.pitch));
    const double thrust_raw = limits_.hov_percent * a_z / (GRAVITY_MPS2 * tilt);
    const double thrust = std::min(std::max(thrust_raw, limits_.thrust_min), limits_.thrust_max);
    if (thrust != thrust_raw) {
        saturated = true;
    }
    u_applied_ = thrust * GRAVITY_MPS2 * tilt / limits_.hov_percent - GRAVITY_MPS2;

    const ControlOutput xy = xy_pid_.step(s, dt_s);

    if (saturated) {
        ++saturation_events_;
    }
    last_error_z_ = e_p;
    last_output_.roll = xy.roll;
    last_output_.pitch = xy.pitch;
    last_output_.yaw_rate = xy.yaw_rate;
    last_output_.thrust = thrust;
    ++iterations_;
    return last_output_;
}

void AdrcController::reset() {
    td_.reset();
    observer_.reset();
    smc_.reset();
    xy_pid_.reset();
    u_applied_ = 0.0;
    last_error_z_ = 0.0;
    last_output_ = ControlOutput{};
    filter_.reset();
    iterations_ = 0;
    saturation_events_ = 0;
    ++resets_;
}

ControllerStatus AdrcController::status() const {
    const SlidingModeLaw::Params& sp = smc_.params();
    const AmesoObserver::Params& op = observer_.params();
    const ControllerStatus xy = xy_pid_.status();

    ControllerStatus st;
    st.name = "adrc";
    st.gains = {
        {"k", sp.k}, {"k1", sp.k1}, {"k2", sp.k2},
        {"c1", sp.c1}, {"c2", sp.c2}, {"lambda_D", sp.lambda_D},
        {"beta_max", sp.beta_max}, {"gamma", sp.gamma},
        {"lambda", op.lambda}, {"sigma", op.sigma}, {"omega_star", op.omega_star}, {"l", op.l},
        {"kp", xy.gains.at("Kp_xy")}, {"ki", xy.gains.at("Kvi_xy")}, {"kd", xy.gains.at("Kv_xy")},
    };
    // Vertical error reported as target minus position, like the other laws
    st.last_position_error = Eigen::Vector3d(xy.last_position_error.x(),
                                             xy.last_position_error.y(),
                                             -last_error_z_);
    st.disturbance_estimate = Eigen::Vector3d(0.0, 0.0, observer_.disturbance());
    st.last_output = last_output_;
    st.iterations = iterations_;
    st.resets = resets_;
    st.saturation_events = saturation_events_;
    st.stale_substitutions = filter_.substitutions();
    st.observer_divergences = observer_.divergences();
    st.adaptation_frozen = observer_.adaptation_frozen();
    return st;
}

} // namespace kestrel
