#include <catch2/catch.hpp>

#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

#include "kestrel/modes.hpp"
#include "kestrel/pid.hpp"
#include "support/fake_controller.hpp"
#include "support/fixtures.hpp"

using namespace kestrel;
using test::FakeController;

namespace {

std::unique_ptr<Controller> fake(FakeController::Calls& calls, double thrust = 0.6) {
    return std::make_unique<FakeController>(calls, thrust);
}

} // namespace

TEST_CASE("Transition table", "[modes]") {
    const ControlMode all[] = {ControlMode::MANUAL, ControlMode::ATTITUDE, ControlMode::POSITION,
                               ControlMode::VELOCITY, ControlMode::TRAJECTORY, ControlMode::EMERGENCY};
    for (ControlMode from : all) {
        for (ControlMode to : all) {
            const bool expected = (from != ControlMode::EMERGENCY) || (to == ControlMode::EMERGENCY);
            REQUIRE(ControllerManager::transition_allowed(from, to) == expected);
        }
    }
}

TEST_CASE("Manager starts in MANUAL with the neutral command", "[modes]") {
    ControllerManager mgr;
    REQUIRE(mgr.mode() == ControlMode::MANUAL);

    const ControlOutput out = mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02);
    REQUIRE(out.thrust == Approx(0.45));
    REQUIRE(out.roll == 0.0);
    REQUIRE(out.pitch == 0.0);
    REQUIRE(out.yaw_rate == 0.0);
}

TEST_CASE("Mode switching activates and resets controllers", "[modes]") {
    FakeController::Calls pos;
    FakeController::Calls vel;
    ControllerManager mgr;
    mgr.register_controller("position", fake(pos, 0.6));
    mgr.register_controller("velocity", fake(vel, 0.7));

    mgr.set_target(test::target_at(0.0, 0.0, 1.5));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));
    REQUIRE(pos.set_target == 1);
    REQUIRE(pos.last_target.position.z() == 1.5);
    REQUIRE(mgr.status().active_controller == "position");

    REQUIRE(mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02).thrust == 0.6);
    REQUIRE(pos.step == 1);

    REQUIRE(mgr.request_mode(ControlMode::VELOCITY));
    REQUIRE(pos.reset == 1);
    REQUIRE(vel.set_target == 1);
    REQUIRE(mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02).thrust == 0.7);
    REQUIRE(pos.step == 1);

    SECTION("set_target reaches only the active controller") {
        mgr.set_target(test::target_at(0.0, 0.0, 2.0));
        REQUIRE(vel.last_target.position.z() == 2.0);
        REQUIRE(pos.last_target.position.z() == 1.5);
    }

    SECTION("MANUAL releases the controller") {
        REQUIRE(mgr.request_mode(ControlMode::MANUAL));
        REQUIRE(vel.reset == 1);
        REQUIRE(mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02).thrust == Approx(0.45));
    }

    SECTION("mode without a registered controller is refused") {
        REQUIRE_FALSE(mgr.request_mode(ControlMode::TRAJECTORY));
        REQUIRE(mgr.mode() == ControlMode::VELOCITY);
    }

    SECTION("rebinding a mode") {
        mgr.bind_mode(ControlMode::TRAJECTORY, "position");
        REQUIRE(mgr.request_mode(ControlMode::TRAJECTORY));
        REQUIRE(mgr.status().active_controller == "position");
        REQUIRE_THROWS_AS(mgr.bind_mode(ControlMode::MANUAL, "position"), std::logic_error);
    }
}

TEST_CASE("Entering a mode without a target holds position", "[modes]") {
    FakeController::Calls pos;
    ControllerManager mgr;
    mgr.register_controller("position", fake(pos));

    mgr.update(test::state_at(0.5, -0.5, 0.8), 0.0, 0.02);
    REQUIRE(mgr.request_mode(ControlMode::POSITION));
    REQUIRE(pos.last_target.position.x() == 0.5);
    REQUIRE(pos.last_target.position.y() == -0.5);
    REQUIRE(pos.last_target.position.z() == 0.8);
}

TEST_CASE("EMERGENCY is terminal and neutral", "[modes]") {
    FakeController::Calls pos;
    ControllerManager mgr;
    mgr.register_controller("position", fake(pos));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));
    REQUIRE(mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02).thrust == 0.6);

    mgr.trigger_emergency("test");
    REQUIRE(mgr.mode() == ControlMode::EMERGENCY);
    REQUIRE(pos.reset == 1);
    REQUIRE(mgr.status().emergency_reason == "test");
    REQUIRE(mgr.status().active_controller.empty());

    const ControlOutput out = mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02);
    REQUIRE(out.thrust == Approx(0.45));
    REQUIRE(out.roll == 0.0);
    REQUIRE(pos.step == 1);

    REQUIRE_FALSE(mgr.request_mode(ControlMode::POSITION));
    REQUIRE_FALSE(mgr.request_mode(ControlMode::MANUAL));
    REQUIRE(mgr.request_mode(ControlMode::EMERGENCY));
    REQUIRE(mgr.mode() == ControlMode::EMERGENCY);
}

TEST_CASE("EMERGENCY resets a real controller exactly once", "[modes][pid]") {
    auto pid = std::make_unique<PidController>();
    pid->initialize(test::pid_config());
    ControllerManager mgr;
    mgr.register_controller("position", std::move(pid));
    mgr.set_target(test::target_at(0.0, 0.0, 1.2));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    for (int i = 0; i < 10; ++i) {
        mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02);
    }
    const Controller* c = mgr.controller("position");
    REQUIRE(c != nullptr);
    REQUIRE(c->status().iterations == 10);
    REQUIRE(c->status().resets == 0);

    mgr.trigger_emergency("test");
    REQUIRE(mgr.mode() == ControlMode::EMERGENCY);
    REQUIRE(c->status().resets == 1);
    REQUIRE(c->status().iterations == 0);
    REQUIRE(c->status().disturbance_estimate.norm() == 0.0);

    const ControlOutput out = mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02);
    REQUIRE(out.thrust == Approx(mgr.config().neutral_thrust));
    REQUIRE(c->status().iterations == 0);
    REQUIRE(c->status().resets == 1);
}

TEST_CASE("Stale snapshots are held then escalate", "[modes]") {
    FakeController::Calls pos;
    ManagerConfig cfg;
    cfg.max_stale_ticks = 5;
    ControllerManager mgr(cfg);
    mgr.register_controller("position", fake(pos));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02);

    SECTION("old sample") {
        for (int i = 1; i <= 5; ++i) {
            const ControlOutput out = mgr.update(test::state_at(0.0, 0.0, 3.0), 1.0, 0.02);
            REQUIRE(out.thrust == 0.6);
            REQUIRE(pos.last_state.position.z() == 1.0);
            REQUIRE(mgr.status().consecutive_stale_ticks == i);
        }
        REQUIRE(mgr.mode() == ControlMode::POSITION);

        mgr.update(test::state_at(0.0, 0.0, 3.0), 1.0, 0.02);
        REQUIRE(mgr.mode() == ControlMode::EMERGENCY);
        REQUIRE(mgr.status().stale_ticks == 6);
    }

    SECTION("malformed sample") {
        VehicleState bad = test::state_at(0.0, 0.0, std::numeric_limits<double>::quiet_NaN());
        mgr.update(bad, 0.0, 0.02);
        REQUIRE(pos.last_state.position.z() == 1.0);
        REQUIRE(mgr.status().consecutive_stale_ticks == 1);
    }

    SECTION("fresh sample resets the counter") {
        for (int i = 0; i < 4; ++i) {
            mgr.update(test::state_at(0.0, 0.0, 3.0), 1.0, 0.02);
        }
        mgr.update(test::state_at(0.0, 0.0, 1.1), 0.01, 0.02);
        REQUIRE(mgr.status().consecutive_stale_ticks == 0);
        for (int i = 0; i < 5; ++i) {
            mgr.update(test::state_at(0.0, 0.0, 3.0), 1.0, 0.02);
        }
        REQUIRE(mgr.mode() == ControlMode::POSITION);
        REQUIRE(pos.last_state.position.z() == 1.1);
    }
}

TEST_CASE("Safety interlocks", "[modes]") {
    FakeController::Calls pos;
    ControllerManager mgr;
    mgr.register_controller("position", fake(pos));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    SECTION("battery critical") {
        VehicleState s = test::state_at(0.0, 0.0, 1.0);
        s.battery_fraction = 0.05;
        REQUIRE(mgr.update(s, 0.0, 0.02).thrust == Approx(0.45));
        REQUIRE(mgr.mode() == ControlMode::EMERGENCY);
        REQUIRE(mgr.status().emergency_reason == "battery critical");
    }

    SECTION("attitude limit") {
        VehicleState s = test::state_at(0.0, 0.0, 1.0);
        s.attitude.roll = 1.2;
        mgr.update(s, 0.0, 0.02);
        REQUIRE(mgr.mode() == ControlMode::EMERGENCY);
        REQUIRE(pos.step == 0);
    }
}

TEST_CASE("Registration", "[modes]") {
    FakeController::Calls first;
    FakeController::Calls second;
    ControllerManager mgr;
    mgr.register_controller("position", fake(first, 0.6));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    SECTION("same name replaces the instance") {
        mgr.register_controller("position", fake(second, 0.55));
        REQUIRE(first.reset == 1);
        REQUIRE(second.set_target == 1);
        REQUIRE(mgr.update(test::state_at(0.0, 0.0, 1.0), 0.0, 0.02).thrust == 0.55);
        REQUIRE(mgr.controller("position") != nullptr);
    }

    SECTION("rejected while running") {
        mgr.set_running(true);
        REQUIRE_THROWS_AS(mgr.register_controller("velocity", fake(second)), std::logic_error);
        mgr.set_running(false);
        REQUIRE_NOTHROW(mgr.register_controller("velocity", fake(second)));
    }

    SECTION("null controller") {
        REQUIRE_THROWS_AS(mgr.register_controller("velocity", nullptr), std::logic_error);
    }
}

TEST_CASE("Manager configuration", "[modes]") {
    Config c;
    c.set("max_stale_ticks", 3.0);
    c.set("neutral_thrust", 0.4);
    const ManagerConfig m = ManagerConfig::from_config(c);
    REQUIRE(m.max_stale_ticks == 3);
    REQUIRE(m.neutral_thrust == 0.4);
    REQUIRE(m.battery_critical == 0.10);

    c.set("battery_critical", 1.5);
    REQUIRE_THROWS_AS(ManagerConfig::from_config(c), ConfigError);
}
