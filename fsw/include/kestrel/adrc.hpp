#pragma once

#include <Eigen/Dense>

#include "controller.hpp"
#include "pid.hpp"

namespace kestrel {

// Second-order tracking differentiator: smoothed reference r and its rate.
//   r_dot' = -(r - input)/(t1*t2) - (t1 + t2)/(t1*t2) * r_dot
class TrackingDifferentiator {
public:
    TrackingDifferentiator() = default;
    TrackingDifferentiator(double t1, double t2) : t1_(t1), t2_(t2) {}

    void prime(double input);
    void update(double input, double dt_s);
    void reset();

    bool primed() const { return primed_; }
    double reference() const { return r_; }
    double rate() const { return r_dot_; }

private:
    double t1_{0.02};
    double t2_{0.04};
    double r_{};
    double r_dot_{};
    bool primed_{false};
};

// Adaptive model extended state observer for the vertical channel.
// States (z1, z2, z3) = (height, vertical rate, lumped residual), plus a
// 9-term basis expansion of the model mismatch whose weights adapt outside a dead zone.
class AmesoObserver {
public:
    static constexpr int N_BASIS = 9;
    using Vector9d = Eigen::Matrix<double, N_BASIS, 1>;

    struct Params {
        double l{5.0};                 // observer bandwidth, poles at -l
        double lambda{0.8};            // adaptation rate
        double sigma{0.9};             // weight leakage
        double omega_star{0.02};       // innovation dead zone [m]
        double disturbance_max{20.0};  // sanity bound on the estimate [m/s^2]
    };

    AmesoObserver() = default;
    explicit AmesoObserver(const Params& params) : params_(params) {}

    void prime(double height_m, double rate_mps);

    // u is the net vertical acceleration commanded over the elapsed interval.
    // A diverging update keeps the previous weights and estimate and is counted;
    // height and rate still follow the measurement.
    void update(double height_m, double u, double dt_s);
    void reset();

    static Vector9d basis(double z, double z_dot);

    bool primed() const { return primed_; }
    double height() const { return z_(0); }
    double rate() const { return z_(1); }
    double residual() const { return z_(2); }
    double disturbance() const { return f_hat_; }
    double last_innovation() const { return innovation_; }
    bool adaptation_frozen() const { return frozen_; }
    unsigned long divergences() const { return divergences_; }

    const Vector9d& weights() const { return w_; }
    void set_weights(const Vector9d& w) { w_ = w; }
    const Params& params() const { return params_; }

private:
    Params params_{};
    Eigen::Vector3d z_{Eigen::Vector3d::Zero()};
    Vector9d w_{Vector9d::Zero()};
    double f_hat_{};
    double innovation_{};
    bool frozen_{false};
    bool primed_{false};
    unsigned long divergences_{0};

    // Integrates one interval; returns true if the dead zone held the weights.
    bool propagate(double height_m, double u, double dt_s, bool adapt);
};

// Variable-exponent sliding-mode law acting on a nominal error model.
// The nominal model (e_n1, e_n2) is driven by the reaching law; the feedback
// part k1, k2 pulls the measured errors onto the nominal trajectory.
class SlidingModeLaw {
public:
    struct Params {
        double k{0.8};
        double k1{-0.15};
        double k2{-3.0};
        double c1{1.5};
        double c2{0.6};
        double lambda_D{1.0};
        double beta_max{1.0};
        double gamma{0.2};
        double boundary_width{1.0};
    };

    SlidingModeLaw() = default;
    explicit SlidingModeLaw(const Params& params) : params_(params) {}

    void prime(double e_p, double e_v);

    // Commanded error acceleration a_n + a_f; advances the nominal model by dt_s.
    double update(double e_p, double e_v, double dt_s);
    void reset();

    // Exponent in [0.1, beta_max + 1]: below 1 near zero, above 1 far from it.
    double variable_exponent(double x) const;
    // Switching gain, grows with |s| and saturates at beta_max.
    double switching_gain(double s_abs) const;

    // Boundary-layer saturation of s/width into [-1, 1].
    static double boundary_sat(double s, double width);
    // sign(x) * |x|^beta
    static double sig_pow(double x, double beta);

    bool primed() const { return primed_; }
    double surface() const { return s_; }
    double nominal_position_error() const { return e_n1_; }
    double nominal_velocity_error() const { return e_n2_; }
    const Params& params() const { return params_; }

private:
    Params params_{};
    double e_n1_{};
    double e_n2_{};
    double integral_{};
    double s_{};
    bool primed_{false};
};

// Vertical channel: tracking differentiator -> observer -> sliding-mode law -> thrust.
// Horizontal channel: an owned PidController.
class AdrcController : public Controller {
public:
    void initialize(const Config& cfg) override;
    void set_target(const DesiredState& target) override;
    ControlOutput step(const VehicleState& state, double dt_s) override;
    void reset() override;
    ControllerStatus status() const override;

    const TrackingDifferentiator& differentiator() const { return td_; }
    const AmesoObserver& observer() const { return observer_; }
    const SlidingModeLaw& sliding_mode() const { return smc_; }

private:
    TrackingDifferentiator td_{};
    AmesoObserver observer_{};
    SlidingModeLaw smc_{};
    PidController xy_pid_{};

    VehicleLimits limits_{};
    bool initialized_{false};

    DesiredState target_{};
    double u_applied_{};  // net vertical acceleration of the previous command
    double last_error_z_{};
    ControlOutput last_output_{};
    SnapshotFilter filter_{};

    unsigned long iterations_{0};
    unsigned long resets_{0};
    unsigned long saturation_events_{0};
};

} // namespace kestrel
