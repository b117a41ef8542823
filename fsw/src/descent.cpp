#include "kestrel/descent.hpp"

#include <algorithm>
#include <cmath>

namespace kestrel {

DescentConfig DescentConfig::from_config(const Config& cfg) {
    DescentConfig d;
    d.takeoff_height_m  = cfg.optional_range("takeoff_height", d.takeoff_height_m, 0.1, 10.0);
    d.hold_tolerance_m  = cfg.optional_range("hold_tolerance", d.hold_tolerance_m, 0.0, 1.0);
    d.hold_settle_s     = cfg.optional_range("hold_settle_s", d.hold_settle_s, 0.0, 60.0);
    d.hold_timeout_s    = cfg.optional_range("hold_timeout_s", d.hold_timeout_s, 0.0, 600.0);
    d.land_height_m     = cfg.optional_range("land_height", d.land_height_m, 0.0, 10.0);
    d.descend_speed_mps = cfg.optional_range("descend_speed", d.descend_speed_mps, 0.01, 2.0);
    d.land_tolerance_m  = cfg.optional_range("land_tolerance", d.land_tolerance_m, 0.0, 1.0);
    d.descend_timeout_s = cfg.optional_range("descend_timeout_s", d.descend_timeout_s, 0.0, 600.0);
    if (d.land_height_m >= d.takeoff_height_m) {
        throw ConfigError("land_height must be below takeoff_height");
    }
    return d;
}

const char* to_string(DescentPhase p) {
    switch (p) {
    case DescentPhase::HOLD:    return "HOLD";
    case DescentPhase::DESCEND: return "DESCEND";
    case DescentPhase::LANDED:  return "LANDED";
    }
    return "UNKNOWN";
}

DescentScript::DescentScript(const DescentConfig& cfg)
    : cfg_(cfg) {
    target_.position.z() = cfg_.takeoff_height_m;
}

bool DescentScript::update(double t_s, const VehicleState& state) {
    if (!started_) {
        started_ = true;
        phase_start_s_ = t_s;
    }
    const DescentPhase before = phase_;

    switch (phase_) {
    case DescentPhase::HOLD:
        handle_hold(t_s, state);
        break;
    case DescentPhase::DESCEND:
        handle_descend(t_s, state);
        break;
    case DescentPhase::LANDED:
        break;
    }
    return phase_ != before;
}

void DescentScript::handle_hold(double t_s, const VehicleState& state) {
    target_ = DesiredState{};
    target_.position.z() = cfg_.takeoff_height_m;

    const bool inside = std::abs(state.position.z() - cfg_.takeoff_height_m) <= cfg_.hold_tolerance_m;
    if (!inside) {
        settled_since_s_ = -1.0;
    } else if (settled_since_s_ < 0.0) {
        settled_since_s_ = t_s;
    }

    const bool settled = inside && (t_s - settled_since_s_ >= cfg_.hold_settle_s);
    const bool timed_out = phase_elapsed_s(t_s) >= cfg_.hold_timeout_s;
    if (settled || timed_out) {
        enter(DescentPhase::DESCEND, t_s);
        handle_descend(t_s, state);
    }
}

void DescentScript::handle_descend(double t_s, const VehicleState& state) {
    // Height setpoint ramps at descend speed, velocity feed-forward while ramping
    const double ramp = cfg_.takeoff_height_m - cfg_.descend_speed_mps * phase_elapsed_s(t_s);
    target_ = DesiredState{};
    target_.position.z() = std::max(ramp, cfg_.land_height_m);
    target_.velocity.z() = (ramp > cfg_.land_height_m) ? -cfg_.descend_speed_mps : 0.0;

    const bool ramp_done = ramp <= cfg_.land_height_m;
    const bool landed = ramp_done &&
                        std::abs(state.position.z() - cfg_.land_height_m) <= cfg_.land_tolerance_m;
    const bool timed_out = phase_elapsed_s(t_s) >= cfg_.descend_timeout_s;
    if (landed || timed_out) {
        enter(DescentPhase::LANDED, t_s);
        target_ = DesiredState{};
        target_.position.z() = cfg_.land_height_m;
    }
}

void DescentScript::enter(DescentPhase phase, double t_s) {
    phase_ = phase;
    phase_start_s_ = t_s;
    settled_since_s_ = -1.0;
}

} // namespace kestrel
