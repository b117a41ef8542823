#pragma once

#include <ostream>

#include "controller.hpp"
#include "modes.hpp"
#include "state.hpp"

namespace kestrel {

// One row per control tick.
struct TelemetryRecord {
    double timestamp_s{};
    ControlMode mode{ControlMode::MANUAL};
    int phase_index{-1};
    VehicleState state{};
    DesiredState target{};
    ControlOutput command{};
    ControllerStatus status{};
};

class TelemetryLogger {
public:
    virtual ~TelemetryLogger() = default;
    virtual void log(const TelemetryRecord& record) = 0;
};

class CsvLogger : public TelemetryLogger {
public:
    explicit CsvLogger(std::ostream& os);

    void log(const TelemetryRecord& record) override;

private:
    std::ostream& os_;
    bool header_written_{false};
    void write_header();
};

} // namespace kestrel
