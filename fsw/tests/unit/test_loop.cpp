#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <unistd.h>

#include "kestrel/loop.hpp"
#include "support/fake_controller.hpp"
#include "support/fixtures.hpp"

using namespace kestrel;
using test::FakeController;

namespace {

std::unique_ptr<Controller> fake(FakeController::Calls& calls) {
    return std::make_unique<FakeController>(calls);
}

} // namespace

TEST_CASE("Snapshot slot", "[loop]") {
    SnapshotSlot slot;
    VehicleState out{};
    double received = -1.0;
    REQUIRE_FALSE(slot.read(out, received));

    slot.publish(test::state_at(0.0, 0.0, 1.0), 3.5);
    REQUIRE(slot.read(out, received));
    REQUIRE(out.position.z() == 1.0);
    REQUIRE(received == 3.5);

    slot.publish(test::state_at(0.0, 0.0, 2.0), 4.0);
    REQUIRE(slot.read(out, received));
    REQUIRE(out.position.z() == 2.0);
    REQUIRE(received == 4.0);
}

TEST_CASE("Loop tick uses measured dt and sample age", "[loop]") {
    FakeController::Calls calls;
    ControllerManager mgr;
    mgr.register_controller("position", fake(calls));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    SnapshotSlot slot;
    std::vector<ControlOutput> sent;
    ControlLoop loop(mgr, slot, [&](const ControlOutput& c) { sent.push_back(c); }, 0.02);

    SECTION("no snapshot yet is stale and neutral") {
        const ControlOutput out = loop.tick(10.0);
        REQUIRE(out.thrust == Approx(0.45));
        REQUIRE(calls.step == 0);
        REQUIRE(mgr.status().stale_ticks == 1);
    }

    SECTION("dt follows the tick clock") {
        slot.publish(test::state_at(0.0, 0.0, 1.0), 10.0);
        loop.tick(10.0);
        REQUIRE(calls.last_dt_s == Approx(0.02));
        loop.tick(10.035);
        REQUIRE(calls.last_dt_s == Approx(0.035));
        REQUIRE(sent.size() == 2);
        REQUIRE(loop.ticks() == 2);
    }

    SECTION("old sample counts as stale") {
        slot.publish(test::state_at(0.0, 0.0, 1.0), 9.0);
        loop.tick(10.0);
        REQUIRE(mgr.status().consecutive_stale_ticks == 1);
    }

    SECTION("tick hook sees the snapshot before the update") {
        double hook_z = -1.0;
        loop.set_tick_hook([&](double, const VehicleState& s) {
            hook_z = s.position.z();
            mgr.set_target(test::target_at(0.0, 0.0, 2.0));
        });
        slot.publish(test::state_at(0.0, 0.0, 1.25), 10.0);
        loop.tick(10.0);
        REQUIRE(hook_z == 1.25);
        REQUIRE(calls.last_target.position.z() == 2.0);
    }
}

TEST_CASE("Loop run stops cooperatively with a final neutral command", "[loop]") {
    FakeController::Calls calls;
    ControllerManager mgr;
    mgr.register_controller("position", fake(calls));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    SnapshotSlot slot;
    std::atomic<bool> stop{false};
    std::vector<ControlOutput> sent;
    bool register_rejected = false;

    ControlLoop loop(mgr, slot, [&](const ControlOutput& c) {
        sent.push_back(c);
        if (sent.size() == 1) {
            FakeController::Calls other;
            try {
                mgr.register_controller("velocity", fake(other));
            } catch (const std::logic_error&) {
                register_rejected = true;
            }
        }
    }, 0.01);

    std::thread feeder([&]() {
        for (int i = 0; i < 10; ++i) {
            slot.publish(test::state_at(0.0, 0.0, 1.0), monotonic_seconds());
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        stop.store(true);
    });

    loop.run(stop);
    feeder.join();

    REQUIRE(sent.size() >= 2);
    REQUIRE(sent.back().thrust == Approx(0.45));
    REQUIRE(sent.back().roll == 0.0);
    REQUIRE(calls.step >= 1);
    REQUIRE(register_rejected);
    REQUIRE_FALSE(mgr.running());
}

TEST_CASE("Loop run exits after entering EMERGENCY", "[loop]") {
    FakeController::Calls calls;
    ControllerManager mgr;
    mgr.register_controller("position", fake(calls));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    SnapshotSlot slot;
    VehicleState s = test::state_at(0.0, 0.0, 1.0);
    s.battery_fraction = 0.01;
    slot.publish(s, monotonic_seconds());

    std::atomic<bool> stop{false};
    std::vector<ControlOutput> sent;
    ControlLoop loop(mgr, slot, [&](const ControlOutput& c) { sent.push_back(c); }, 0.01);
    loop.run(stop);

    REQUIRE(mgr.mode() == ControlMode::EMERGENCY);
    REQUIRE(loop.ticks() == 1);
    REQUIRE(sent.size() == 2);
    REQUIRE(sent.back().thrust == Approx(0.45));
    REQUIRE(calls.step == 0);
}

TEST_CASE("Loop run records cycle time and overruns", "[loop]") {
    FakeController::Calls calls;
    ControllerManager mgr;
    mgr.register_controller("position", fake(calls));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    SnapshotSlot slot;
    std::atomic<bool> stop{false};
    int commands = 0;

    // Each command takes twice the period, so every cycle misses its deadline
    ControlLoop loop(mgr, slot, [&](const ControlOutput&) {
        slot.publish(test::state_at(0.0, 0.0, 1.0), monotonic_seconds());
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        if (++commands == 5) {
            stop.store(true);
        }
    }, 0.01);

    REQUIRE(loop.timing().cycles == 0);
    REQUIRE(loop.timing().average_cycle_s() == 0.0);

    loop.run(stop);

    const LoopTiming& t = loop.timing();
    REQUIRE(t.cycles == 5);
    REQUIRE(t.overruns == 5);
    REQUIRE(t.max_cycle_s >= 0.02);
    REQUIRE(t.average_cycle_s() >= 0.02);
    REQUIRE(t.average_cycle_s() <= t.max_cycle_s);
    REQUIRE(commands == 6);
}

TEST_CASE("Loop run counts each cycle once", "[loop]") {
    FakeController::Calls calls;
    ControllerManager mgr;
    mgr.register_controller("position", fake(calls));
    REQUIRE(mgr.request_mode(ControlMode::POSITION));

    SnapshotSlot slot;
    slot.publish(test::state_at(0.0, 0.0, 1.0), monotonic_seconds());
    std::atomic<bool> stop{false};
    int commands = 0;
    ControlLoop loop(mgr, slot, [&](const ControlOutput&) {
        if (++commands == 3) {
            stop.store(true);
        }
    }, 0.05);
    loop.run(stop);

    REQUIRE(loop.timing().cycles == 3);
    REQUIRE(loop.timing().max_cycle_s < 0.05);
}

TEST_CASE("Waiting for input returns on stop or data", "[loop]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    std::atomic<bool> stop{false};

    SECTION("an idle descriptor releases the waiter once stop is set") {
        std::thread stopper([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            stop.store(true);
        });
        const double start = monotonic_seconds();
        REQUIRE_FALSE(wait_readable(fds[0], stop, 0.01));
        stopper.join();
        REQUIRE(monotonic_seconds() - start < 1.0);
    }

    SECTION("pending data is reported without waiting for stop") {
        REQUIRE(::write(fds[1], "1.0\n", 4) == 4);
        REQUIRE(wait_readable(fds[0], stop, 0.01));
    }

    SECTION("a closed writer reads as end of file") {
        ::close(fds[1]);
        fds[1] = -1;
        REQUIRE(wait_readable(fds[0], stop, 0.01));
    }

    SECTION("stop already set returns at once") {
        stop.store(true);
        REQUIRE_FALSE(wait_readable(fds[0], stop, 0.01));
    }

    ::close(fds[0]);
    if (fds[1] >= 0) {
        ::close(fds[1]);
    }
}
