#pragma once

#include <map>
#include <memory>
#include <string>

#include "config.hpp"
#include "controller.hpp"
#include "state.hpp"

namespace kestrel {

enum class ControlMode {
    MANUAL,      // neutral command, pilot or upstream owns the vehicle
    ATTITUDE,
    POSITION,
    VELOCITY,
    TRAJECTORY,
    EMERGENCY    // terminal, neutral command until restart
};

const char* to_string(ControlMode m);

// For logging mode states
inline int control_mode_to_int(ControlMode m) {
    switch (m) {
    case ControlMode::MANUAL:     return 0;
    case ControlMode::ATTITUDE:   return 1;
    case ControlMode::POSITION:   return 2;
    case ControlMode::VELOCITY:   return 3;
    case ControlMode::TRAJECTORY: return 4;
    case ControlMode::EMERGENCY:  return 5;
    }
    return -1;
}

struct ManagerConfig {
    double battery_critical{0.10};   // fraction
    double sensor_timeout_s{0.5};
    int max_stale_ticks{5};          // consecutive stale ticks tolerated
    double max_attitude_deg{60.0};
    double neutral_thrust{0.45};

    // Section "manager"; absent keys keep their defaults.
    static ManagerConfig from_config(const Config& cfg);
};

struct ManagerStatus {
    ControlMode mode{ControlMode::MANUAL};
    std::string active_controller;
    unsigned long ticks{0};
    int consecutive_stale_ticks{0};
    unsigned long stale_ticks{0};
    std::string emergency_reason;
};

// Owns the controllers, keeps exactly one of them active per mode and applies
// the safety interlocks before delegating a tick.
class ControllerManager {
public:
    explicit ControllerManager(const ManagerConfig& cfg = {});

    // Registering a name twice replaces the instance. Throws std::logic_error while running.
    void register_controller(const std::string& name, std::unique_ptr<Controller> controller);

    // Throws std::logic_error for MANUAL or EMERGENCY.
    void bind_mode(ControlMode mode, const std::string& name);

    // Returns false when the transition is not allowed or the mode has no controller.
    bool request_mode(ControlMode mode);

    void set_target(const DesiredState& target);
    void trigger_emergency(const std::string& reason);

    // One control tick. sample_age_s is the age of the snapshot at the tick.
    ControlOutput update(const VehicleState& snapshot, double sample_age_s, double dt_s);

    ControlOutput neutral() const { return neutral_command(cfg_.neutral_thrust); }
    ControlMode mode() const { return mode_; }
    const Controller* active_controller() const { return active_; }
    const Controller* controller(const std::string& name) const;
    ManagerStatus status() const;
    const ManagerConfig& config() const { return cfg_; }

    void set_running(bool running) { running_ = running; }
    bool running() const { return running_; }

    static bool transition_allowed(ControlMode from, ControlMode to);

private:
    ManagerConfig cfg_;
    ControlMode mode_{ControlMode::MANUAL};

    std::map<std::string, std::unique_ptr<Controller>> controllers_;
    std::map<ControlMode, std::string> bindings_;
    Controller* active_{nullptr};
    std::string active_name_;

    DesiredState target_{};
    bool has_target_{false};

    VehicleState last_good_{};
    bool has_good_{false};
    int consecutive_stale_{0};
    unsigned long stale_ticks_{0};
    unsigned long ticks_{0};
    std::string emergency_reason_;
    bool running_{false};

    void deactivate();
    void activate(const std::string& name);
    void enter_emergency(const std::string& reason);
    DesiredState entry_target() const;
};

} // namespace kestrel
