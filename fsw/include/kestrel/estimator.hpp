#pragma once

#include <Eigen/Dense>

#include "config.hpp"
#include "sensors.hpp"
#include "state.hpp"

namespace kestrel {

class Estimator {
public:
    virtual ~Estimator() = default;

    virtual void predict(double dt_s, const ImuMeasurement& imu) = 0;
    virtual void update_range(const RangeMeasurement& range) = 0;
    virtual void update_velocity(const VelocityMeasurement& vel) = 0;
    virtual void update_battery(const BatteryMeasurement& battery) = 0;

    virtual VehicleState get_state() const = 0;
};

struct EstimatorConfig {
    double accel_noise_std_mps2{0.5};
    double range_noise_std_m{0.05};
    double velocity_noise_std_mps{0.1};
    double gate_sigma{5.0};  // innovations beyond this many sigma are rejected

    static EstimatorConfig from_config(const Config& cfg);
};

// Linear Kalman filter on position and velocity (z up). IMU specific force
// drives the prediction; range height and ground velocity correct it.
class KalmanEstimator : public Estimator {
public:
    explicit KalmanEstimator(const EstimatorConfig& cfg = {});

    void predict(double dt_s, const ImuMeasurement& imu) override;
    void update_range(const RangeMeasurement& range) override;
    void update_velocity(const VelocityMeasurement& vel) override;
    void update_battery(const BatteryMeasurement& battery) override;
    VehicleState get_state() const override;

    bool initialized() const { return initialized_; }
    unsigned long rejected() const { return rejected_; }
    const Eigen::Matrix<double, 6, 6>& covariance() const { return P_; }

private:
    using Vec6 = Eigen::Matrix<double, 6, 1>;
    using Mat6 = Eigen::Matrix<double, 6, 6>;

    EstimatorConfig cfg_;
    Vec6 x_;   // [px, py, pz, vx, vy, vz]
    Mat6 P_;

    Attitude attitude_{};
    double battery_fraction_{1.0};
    double timestamp_s_{};
    bool initialized_{false};
    unsigned long rejected_{0};

    void build_process_noise(double dt_s, Mat6& Q) const;
};

} // namespace kestrel
