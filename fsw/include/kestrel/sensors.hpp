#pragma once

#include <array>

namespace kestrel {

struct ImuMeasurement {
    double timestamp_s{};
    std::array<double, 3> accel_mps2{};  // body-frame specific force, reads +g on z at rest
    std::array<double, 3> euler_rad{};   // roll, pitch, yaw from the onboard attitude filter
    bool valid{true};
};

// Height above ground. A non-positive TOF reading means out of range.
struct RangeMeasurement {
    double timestamp_s{};
    double tof_height_m{};
    double baro_height_m{};
    bool valid{true};
};

struct VelocityMeasurement {
    double timestamp_s{};
    std::array<double, 3> velocity_mps{};  // local frame, z up
    bool valid{true};
};

struct BatteryMeasurement {
    double timestamp_s{};
    double fraction{1.0};
    bool valid{true};
};

} // namespace kestrel
