#include "kestrel/estimator.hpp"

#include <algorithm>
#include <cmath>

#include "kestrel/controller.hpp"

namespace kestrel {

namespace {

// Initial uncertainty for states never observed
constexpr double INITIAL_VARIANCE = 10.0;

} // namespace

EstimatorConfig EstimatorConfig::from_config(const Config& cfg) {
    EstimatorConfig e;
    e.accel_noise_std_mps2   = cfg.optional_range("accel_noise_std", e.accel_noise_std_mps2, 1e-6, 100.0);
    e.range_noise_std_m      = cfg.optional_range("range_noise_std", e.range_noise_std_m, 1e-6, 10.0);
    e.velocity_noise_std_mps = cfg.optional_range("velocity_noise_std", e.velocity_noise_std_mps, 1e-6, 10.0);
    e.gate_sigma             = cfg.optional_range("gate_sigma", e.gate_sigma, 1.0, 100.0);
    return e;
}

KalmanEstimator::KalmanEstimator(const EstimatorConfig& cfg)
    : cfg_(cfg) {
    x_.setZero();
    P_.setIdentity();
    P_ *= INITIAL_VARIANCE;
}

void KalmanEstimator::build_process_noise(double dt_s, Mat6& Q) const {
    Q.setZero();

    const double sa2 = cfg_.accel_noise_std_mps2 * cfg_.accel_noise_std_mps2;
    const double dt2 = dt_s * dt_s;

    for (int i = 0; i < 3; ++i) {
        Q(i, i)         = 0.25 * sa2 * dt2 * dt2;  // position
        Q(i, i + 3)     = 0.5 * sa2 * dt2 * dt_s;
        Q(i + 3, i)     = Q(i, i + 3);
        Q(i + 3, i + 3) = sa2 * dt2;               // velocity
    }
}

// --- Predict ---

void KalmanEstimator::predict(double dt_s, const ImuMeasurement& imu) {
    if (!std::isfinite(dt_s) || dt_s <= 0.0) {
        return;
    }

    Eigen::Vector3d a_w = Eigen::Vector3d::Zero();
    if (imu.valid) {
        attitude_.roll  = imu.euler_rad[0];
        attitude_.pitch = imu.euler_rad[1];
        attitude_.yaw   = imu.euler_rad[2];

        const Eigen::Matrix3d R =
            (Eigen::AngleAxisd(attitude_.yaw,   Eigen::Vector3d::UnitZ()) *
             Eigen::AngleAxisd(attitude_.pitch, Eigen::Vector3d::UnitY()) *
             Eigen::AngleAxisd(attitude_.roll,  Eigen::Vector3d::UnitX())).toRotationMatrix();
        const Eigen::Vector3d f_b(imu.accel_mps2[0], imu.accel_mps2[1], imu.accel_mps2[2]);
        a_w = R * f_b - Eigen::Vector3d(0.0, 0.0, GRAVITY_MPS2);
        if (!a_w.allFinite()) {
            a_w.setZero();
        }
        timestamp_s_ = std::max(timestamp_s_, imu.timestamp_s);
    }

    // Constant-acceleration step over dt
    x_.head<3>() += x_.tail<3>() * dt_s + 0.5 * a_w * dt_s * dt_s;
    x_.tail<3>() += a_w * dt_s;

    Mat6 F = Mat6::Identity();
    F.block<3, 3>(0, 3) = Eigen::Matrix3d::Identity() * dt_s;

    Mat6 Q;
    build_process_noise(dt_s, Q);

    P_ = F * P_ * F.transpose() + Q;
}

// --- Range update ---

void KalmanEstimator::update_range(const RangeMeasurement& range) {
    if (!range.valid) {
        return;
    }
    // TOF preferred, barometric height when out of range
    const double z = (range.tof_height_m > 0.0) ? range.tof_height_m : range.baro_height_m;
    if (!std::isfinite(z)) {
        ++rejected_;
        return;
    }
    timestamp_s_ = std::max(timestamp_s_, range.timestamp_s);

    if (!initialized_) {
        x_(2) = z;
        P_(2, 2) = cfg_.range_noise_std_m * cfg_.range_noise_std_m;
        initialized_ = true;
        return;
    }

    Eigen::Matrix<double, 1, 6> H;
    H.setZero();
    H(0, 2) = 1.0;

    const double y = z - x_(2);  // innovation
    const double S = (H * P_ * H.transpose())(0, 0) + cfg_.range_noise_std_m * cfg_.range_noise_std_m;
    if (y * y > cfg_.gate_sigma * cfg_.gate_sigma * S) {
        ++rejected_;
        return;
    }
    const Vec6 K = P_ * H.transpose() / S;

    x_ = x_ + K * y;
    P_ = (Mat6::Identity() - K * H) * P_;
}

// --- Velocity update ---

void KalmanEstimator::update_velocity(const VelocityMeasurement& vel) {
    if (!vel.valid) {
        return;
    }
    const Eigen::Vector3d z(vel.velocity_mps[0], vel.velocity_mps[1], vel.velocity_mps[2]);
    if (!z.allFinite()) {
        ++rejected_;
        return;
    }
    timestamp_s_ = std::max(timestamp_s_, vel.timestamp_s);

    Eigen::Matrix<double, 3, 6> H;
    H.setZero();
    H.block<3, 3>(0, 3) = Eigen::Matrix3d::Identity();

    const Eigen::Matrix3d R =
        Eigen::Matrix3d::Identity() * cfg_.velocity_noise_std_mps * cfg_.velocity_noise_std_mps;

    const Eigen::Vector3d y = z - H * x_;
    const Eigen::Matrix3d S = H * P_ * H.transpose() + R;
    if (y.dot(S.ldlt().solve(y)) > cfg_.gate_sigma * cfg_.gate_sigma * 3.0) {
        ++rejected_;
        return;
    }
    const Eigen::Matrix<double, 6, 3> K = P_ * H.transpose() * S.inverse();

    x_ = x_ + K * y;
    P_ = (Mat6::Identity() - K * H) * P_;
}

void KalmanEstimator::update_battery(const BatteryMeasurement& battery) {
    if (!battery.valid || !std::isfinite(battery.fraction)) {
        return;
    }
    battery_fraction_ = std::min(std::max(battery.fraction, 0.0), 1.0);
}

// --- VehicleState output ---

VehicleState KalmanEstimator::get_state() const {
    VehicleState s{};
    s.timestamp_s = timestamp_s_;
    s.position = x_.head<3>();
    s.velocity = x_.tail<3>();
    s.attitude = attitude_;
    s.battery_fraction = battery_fraction_;
    return s;
}

} // namespace kestrel
