#pragma once

#include "config.hpp"
#include "state.hpp"

namespace kestrel {

enum class DescentPhase {
    HOLD,      // hover at takeoff height
    DESCEND,   // ramp the height setpoint down to land height
    LANDED     // done, hand the vehicle back
};

struct DescentConfig {
    double takeoff_height_m{1.0};
    double hold_tolerance_m{0.1};
    double hold_settle_s{2.0};     // time inside tolerance before descending
    double hold_timeout_s{15.0};
    double land_height_m{0.1};
    double descend_speed_mps{0.1};
    double land_tolerance_m{0.05};
    double descend_timeout_s{12.0};

    // Section "experiment"; absent keys keep their defaults.
    static DescentConfig from_config(const Config& cfg);
};

// Setpoint sequencer for the hold-then-land experiment.
class DescentScript {
public:
    explicit DescentScript(const DescentConfig& cfg = {});

    // Call once per tick. Returns true when the phase changed.
    bool update(double t_s, const VehicleState& state);

    DescentPhase phase() const { return phase_; }
    const DesiredState& target() const { return target_; }
    double phase_elapsed_s(double t_s) const { return t_s - phase_start_s_; }

private:
    DescentConfig cfg_;
    DescentPhase phase_{DescentPhase::HOLD};
    DesiredState target_{};

    bool started_{false};
    double phase_start_s_{};
    double settled_since_s_{-1.0};

    void handle_hold(double t_s, const VehicleState& state);
    void handle_descend(double t_s, const VehicleState& state);
    void enter(DescentPhase phase, double t_s);
};

const char* to_string(DescentPhase p);

} // namespace kestrel
