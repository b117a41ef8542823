#pragma once

#include <map>
#include <string>

#include <Eigen/Dense>

#include "config.hpp"
#include "state.hpp"

namespace kestrel {

constexpr double GRAVITY_MPS2 = 9.8;

// Recoverable conditions, counted rather than thrown.
enum class HealthEvent {
    STALE_SENSOR,
    SATURATION,
    OBSERVER_DIVERGENCE
};

// Diagnostics snapshot of one controller instance.
struct ControllerStatus {
    std::string name;
    std::map<std::string, double> gains;
    Eigen::Vector3d last_position_error{Eigen::Vector3d::Zero()};
    Eigen::Vector3d disturbance_estimate{Eigen::Vector3d::Zero()};
    ControlOutput last_output{};
    unsigned long iterations{0};
    unsigned long resets{0};
    unsigned long saturation_events{0};
    unsigned long stale_substitutions{0};
    unsigned long observer_divergences{0};
    bool adaptation_frozen{false};

    unsigned long count(HealthEvent event) const {
        switch (event) {
        case HealthEvent::STALE_SENSOR:        return stale_substitutions;
        case HealthEvent::SATURATION:          return saturation_events;
        case HealthEvent::OBSERVER_DIVERGENCE: return observer_divergences;
        }
        return 0;
    }
};

// Capability contract shared by every control law. step() is the only call made per control tick.
class Controller {
public:
    virtual ~Controller() = default;

    // Validates and latches parameters. Throws ConfigError.
    virtual void initialize(const Config& cfg) = 0;

    // Replaces the setpoint; filter and observer state are kept.
    virtual void set_target(const DesiredState& target) = 0;

    // dt_s is the measured time since the previous tick.
    virtual ControlOutput step(const VehicleState& state, double dt_s) = 0;

    virtual void reset() = 0;

    virtual ControllerStatus status() const = 0;
};

// Vehicle and output limits shared by all laws.
struct VehicleLimits {
    double quad_mass_kg{1.0};
    double hov_percent{0.5};
    double max_tilt_rad{0.1745};
    double thrust_min{0.1};
    double thrust_max{1.0};
    double k_yaw{1.0};
    double yaw_rate_max_radps{1.0};

    static VehicleLimits from_config(const Config& cfg,
                                     double default_tilt_deg,
                                     double default_thrust_min,
                                     double default_thrust_max);

    // Normalized thrust that balances gravity on a level vehicle is hov_percent.
    double full_thrust_n() const { return quad_mass_kg * GRAVITY_MPS2 / hov_percent; }
};

struct AttitudeCommand {
    ControlOutput output{};
    bool saturated{false};
};

// Desired world acceleration (z up) -> tilt angles and normalized thrust.
AttitudeCommand map_acceleration(const Eigen::Vector3d& accel_des,
                                 const VehicleState& state,
                                 const VehicleLimits& limits);

double yaw_rate_command(double target_yaw, double yaw, const VehicleLimits& limits);

// Holds the last finite snapshot and substitutes it for malformed ones.
class SnapshotFilter {
public:
    const VehicleState& accept(const VehicleState& state);
    unsigned long substitutions() const { return substitutions_; }
    void reset();

private:
    VehicleState last_good_{};
    unsigned long substitutions_{0};
};

double sat(double x, double limit);
double sign(double x);
double wrap_pi(double angle);
Eigen::Vector3d saturate_error(const Eigen::Vector3d& e, double limit);
Eigen::Vector3d body_z_axis(const Attitude& att);

// Maximum per-axis tracking error fed to any law [m] or [m/s].
constexpr double MAX_TRACKING_ERROR = 3.0;

// One-line summary for periodic console output.
std::string format_status(const ControllerStatus& status);

} // namespace kestrel
