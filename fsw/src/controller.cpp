#include "kestrel/controller.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace kestrel {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG2RAD = PI / 180.0;

// Below this vertical force the tilt geometry is meaningless.
constexpr double MIN_VERTICAL_FORCE_N = 0.01;

} // namespace

double sat(double x, double limit) {
    if (x > limit)  return limit;
    if (x < -limit) return -limit;
    return x;
}

double sign(double x) {
    if (x > 0.0) return 1.0;
    if (x < 0.0) return -1.0;
    return 0.0;
}

double wrap_pi(double angle) {
    if (!std::isfinite(angle)) {
        return 0.0;
    }
    while (angle > PI) {
        angle -= 2.0 * PI;
    }
    while (angle < -PI) {
        angle += 2.0 * PI;
    }
    return angle;
}

Eigen::Vector3d saturate_error(const Eigen::Vector3d& e, double limit) {
    return Eigen::Vector3d(sat(e.x(), limit), sat(e.y(), limit), sat(e.z(), limit));
}

Eigen::Vector3d body_z_axis(const Attitude& att) {
    const Eigen::Matrix3d R =
        (Eigen::AngleAxisd(att.yaw,   Eigen::Vector3d::UnitZ()) *
         Eigen::AngleAxisd(att.pitch, Eigen::Vector3d::UnitY()) *
         Eigen::AngleAxisd(att.roll,  Eigen::Vector3d::UnitX())).toRotationMatrix();
    return R.col(2);
}

bool is_finite(const VehicleState& state) {
    return std::isfinite(state.timestamp_s) &&
           state.position.allFinite() &&
           state.velocity.allFinite() &&
           std::isfinite(state.attitude.roll) &&
           std::isfinite(state.attitude.pitch) &&
           std::isfinite(state.attitude.yaw) &&
           std::isfinite(state.battery_fraction);
}

VehicleLimits VehicleLimits::from_config(const Config& cfg,
                                         double default_tilt_deg,
                                         double default_thrust_min,
                                         double default_thrust_max) {
    VehicleLimits l;
    l.quad_mass_kg = cfg.require_range("quad_mass", 1e-3, 100.0);
    l.hov_percent  = cfg.require_range("hov_percent", 0.01, 1.0);
    l.max_tilt_rad = cfg.optional_range("tilt_angle_max", default_tilt_deg, 0.1, 89.0) * DEG2RAD;
    l.thrust_min   = cfg.optional_range("thrust_min", default_thrust_min, 0.0, 1.0);
    l.thrust_max   = cfg.optional_range("thrust_max", default_thrust_max, 0.0, 1.0);
    if (l.thrust_min >= l.thrust_max) {
        throw ConfigError("thrust_min must be below thrust_max");
    }
    if (l.hov_percent < l.thrust_min || l.hov_percent > l.thrust_max) {
        throw ConfigError("hov_percent must lie inside [thrust_min, thrust_max]");
    }
    l.k_yaw              = cfg.optional_range("K_yaw", 1.0, 0.0, 20.0);
    l.yaw_rate_max_radps = cfg.optional_range("yaw_rate_max", 1.0, 0.0, 10.0);
    return l;
}

AttitudeCommand map_acceleration(const Eigen::Vector3d& accel_des,
                                 const VehicleState& state,
                                 const VehicleLimits& limits) {
    AttitudeCommand cmd{};
    const double m = limits.quad_mass_kg;
    const double hover_force = m * GRAVITY_MPS2;

    Eigen::Vector3d F = accel_des * m + Eigen::Vector3d(0.0, 0.0, hover_force);

    if (std::abs(F.z()) < MIN_VERTICAL_FORCE_N) {
        // Fall back to half hover force, no tilt
        F = Eigen::Vector3d(0.0, 0.0, 0.5 * hover_force);
        cmd.saturated = true;
    }

    // Vertical force window, whole vector scaled to keep its direction
    if (F.z() < 0.5 * hover_force) {
        F = F / F.z() * (0.5 * hover_force);
        cmd.saturated = true;
    } else if (F.z() > 2.0 * hover_force) {
        F = F / F.z() * (2.0 * hover_force);
        cmd.saturated = true;
    }

    // Tilt limit on the horizontal force norm, independent of heading
    const double f_h_max = F.z() * std::tan(limits.max_tilt_rad);
    const double f_h = std::hypot(F.x(), F.y());
    if (f_h > f_h_max) {
        const double scale = f_h_max / f_h;
        F.x() *= scale;
        F.y() *= scale;
        cmd.saturated = true;
    }

    // Horizontal force into the heading frame of the current yaw
    const double cos_yaw = std::cos(state.attitude.yaw);
    const double sin_yaw = std::sin(state.attitude.yaw);
    const double f_bx =  cos_yaw * F.x() + sin_yaw * F.y();
    const double f_by = -sin_yaw * F.x() + cos_yaw * F.y();

    cmd.output.roll  = std::atan2(-f_by, F.z());
    cmd.output.pitch = std::atan2(f_bx, F.z());

    // Thrust along the current body z axis
    const double thrust_raw = F.dot(body_z_axis(state.attitude));
    const double thrust = thrust_raw / limits.full_thrust_n();
    cmd.output.thrust = std::min(std::max(thrust, limits.thrust_min), limits.thrust_max);
    if (cmd.output.thrust != thrust) {
        cmd.saturated = true;
    }

    return cmd;
}

double yaw_rate_command(double target_yaw, double yaw, const VehicleLimits& limits) {
    const double yaw_err = wrap_pi(target_yaw - yaw);
    return sat(limits.k_yaw * yaw_err, limits.yaw_rate_max_radps);
}

const VehicleState& SnapshotFilter::accept(const VehicleState& state) {
    if (is_finite(state)) {
        last_good_ = state;
    } else {
        ++substitutions_;
    }
    return last_good_;
}

void SnapshotFilter::reset() {
    last_good_ = VehicleState{};
    substitutions_ = 0;
}

std::string format_status(const ControllerStatus& status) {
    constexpr double RAD2DEG = 180.0 / PI;
    std::ostringstream os;
    os << std::fixed << std::setprecision(2)
       << status.name
       << " - Roll: "  << status.last_output.roll * RAD2DEG << " deg"
       << ", Pitch: "  << status.last_output.pitch * RAD2DEG << " deg"
       << ", YawRate: " << status.last_output.yaw_rate * RAD2DEG << " deg/s"
       << std::setprecision(3)
       << ", Thrust: " << status.last_output.thrust
       << ", ez: "     << status.last_position_error.z()
       << ", dz: "     << status.disturbance_estimate.z()
       << ", iter: "   << status.iterations
       << ", sat: "    << status.count(HealthEvent::SATURATION);
    if (status.count(HealthEvent::OBSERVER_DIVERGENCE) > 0) {
        os << ", diverged: " << status.observer_divergences;
    }
    return os.str();
}

} // namespace kestrel
