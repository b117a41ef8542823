#include "kestrel/modes.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace kestrel {

namespace {

constexpr double PI = 3.14159265358979323846;

} // namespace

const char* to_string(ControlMode m) {
    switch (m) {
    case ControlMode::MANUAL:     return "MANUAL";
    case ControlMode::ATTITUDE:   return "ATTITUDE";
    case ControlMode::POSITION:   return "POSITION";
    case ControlMode::VELOCITY:   return "VELOCITY";
    case ControlMode::TRAJECTORY: return "TRAJECTORY";
    case ControlMode::EMERGENCY:  return "EMERGENCY";
    }
    return "UNKNOWN";
}

ManagerConfig ManagerConfig::from_config(const Config& cfg) {
    ManagerConfig m;
    m.battery_critical = cfg.optional_range("battery_critical", m.battery_critical, 0.0, 1.0);
    m.sensor_timeout_s = cfg.optional_range("sensor_timeout_s", m.sensor_timeout_s, 1e-3, 60.0);
    m.max_stale_ticks  = static_cast<int>(cfg.optional_range("max_stale_ticks", m.max_stale_ticks, 0.0, 1000.0));
    m.max_attitude_deg = cfg.optional_range("max_attitude_deg", m.max_attitude_deg, 1.0, 90.0);
    m.neutral_thrust   = cfg.optional_range("neutral_thrust", m.neutral_thrust, 0.0, 1.0);
    return m;
}

ControllerManager::ControllerManager(const ManagerConfig& cfg)
    : cfg_(cfg) {
    bindings_[ControlMode::ATTITUDE]   = "attitude";
    bindings_[ControlMode::POSITION]   = "position";
    bindings_[ControlMode::VELOCITY]   = "velocity";
    bindings_[ControlMode::TRAJECTORY] = "trajectory";
}

bool ControllerManager::transition_allowed(ControlMode from, ControlMode to) {
    if (from == ControlMode::EMERGENCY) {
        return to == ControlMode::EMERGENCY;
    }
    return true;
}

void ControllerManager::register_controller(const std::string& name,
                                            std::unique_ptr<Controller> controller) {
    if (running_) {
        throw std::logic_error("cannot register controller '" + name + "' while the loop is running");
    }
    if (!controller) {
        throw std::logic_error("controller '" + name + "' is null");
    }
    const bool was_active = (active_ != nullptr && active_name_ == name);
    if (was_active) {
        deactivate();
    }
    controllers_[name] = std::move(controller);
    if (was_active) {
        activate(name);
    }
}

void ControllerManager::bind_mode(ControlMode mode, const std::string& name) {
    if (mode == ControlMode::MANUAL || mode == ControlMode::EMERGENCY) {
        throw std::logic_error(std::string("mode ") + to_string(mode) + " has no controller");
    }
    bindings_[mode] = name;
}

const Controller* ControllerManager::controller(const std::string& name) const {
    const auto it = controllers_.find(name);
    return it == controllers_.end() ? nullptr : it->second.get();
}

bool ControllerManager::request_mode(ControlMode mode) {
    if (!transition_allowed(mode_, mode)) {
        std::cerr << "[manager] transition " << to_string(mode_) << " -> "
                  << to_string(mode) << " rejected\n";
        return false;
    }
    if (mode == mode_) {
        return true;
    }

    switch (mode) {
    case ControlMode::EMERGENCY:
        enter_emergency("requested");
        return true;
    case ControlMode::MANUAL:
        deactivate();
        mode_ = mode;
        return true;
    default:
        break;
    }

    const auto binding = bindings_.find(mode);
    if (binding == bindings_.end() || controllers_.count(binding->second) == 0) {
        std::cerr << "[manager] no controller registered for " << to_string(mode) << "\n";
        return false;
    }
    deactivate();
    activate(binding->second);
    mode_ = mode;
    return true;
}

void ControllerManager::set_target(const DesiredState& target) {
    target_ = target;
    has_target_ = true;
    if (active_ != nullptr) {
        active_->set_target(target_);
    }
}

void ControllerManager::trigger_emergency(const std::string& reason) {
    enter_emergency(reason);
}

ControlOutput ControllerManager::update(const VehicleState& snapshot,
                                        double sample_age_s,
                                        double dt_s) {
    ++ticks_;
    if (mode_ == ControlMode::EMERGENCY) {
        return neutral();
    }

    const bool fresh = is_finite(snapshot) &&
                       std::isfinite(sample_age_s) &&
                       sample_age_s <= cfg_.sensor_timeout_s;
    if (fresh) {
        last_good_ = snapshot;
        has_good_ = true;
        consecutive_stale_ = 0;
    } else {
        ++consecutive_stale_;
        ++stale_ticks_;
        if (consecutive_stale_ > cfg_.max_stale_ticks) {
            enter_emergency("stale sensor data");
            return neutral();
        }
        if (!has_good_) {
            return neutral();
        }
    }

    // Interlocks on the snapshot the controller will see
    const VehicleState& s = last_good_;
    if (s.battery_fraction < cfg_.battery_critical) {
        enter_emergency("battery critical");
        return neutral();
    }
    const double max_att = cfg_.max_attitude_deg * PI / 180.0;
    if (std::abs(s.attitude.roll) > max_att || std::abs(s.attitude.pitch) > max_att) {
        enter_emergency("attitude limit exceeded");
        return neutral();
    }

    if (mode_ == ControlMode::MANUAL || active_ == nullptr) {
        return neutral();
    }
    return active_->step(s, dt_s);
}

ManagerStatus ControllerManager::status() const {
    ManagerStatus st;
    st.mode = mode_;
    st.active_controller = active_ != nullptr ? active_name_ : std::string();
    st.ticks = ticks_;
    st.consecutive_stale_ticks = consecutive_stale_;
    st.stale_ticks = stale_ticks_;
    st.emergency_reason = emergency_reason_;
    return st;
}

void ControllerManager::deactivate() {
    if (active_ != nullptr) {
        active_->reset();
    }
    active_ = nullptr;
    active_name_.clear();
}

void ControllerManager::activate(const std::string& name) {
    active_ = controllers_.at(name).get();
    active_name_ = name;
    active_->set_target(entry_target());
}

// Without a commanded target, hold the last known position.
DesiredState ControllerManager::entry_target() const {
    if (has_target_ || !has_good_) {
        return target_;
    }
    DesiredState hold;
    hold.position = last_good_.position;
    hold.yaw = last_good_.attitude.yaw;
    return hold;
}

void ControllerManager::enter_emergency(const std::string& reason) {
    if (mode_ == ControlMode::EMERGENCY) {
        return;
    }
    std::cerr << "[manager] EMERGENCY: " << reason << "\n";
    deactivate();
    mode_ = ControlMode::EMERGENCY;
    emergency_reason_ = reason;
}

} // namespace kestrel
