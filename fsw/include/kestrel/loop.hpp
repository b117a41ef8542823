#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>

#include "modes.hpp"
#include "state.hpp"

namespace kestrel {

// Single-writer/single-reader handoff of the latest complete snapshot.
class SnapshotSlot {
public:
    void publish(const VehicleState& state, double received_s);

    // False until a first snapshot was published.
    bool read(VehicleState& out, double& received_s) const;

private:
    mutable std::mutex mutex_;
    VehicleState state_{};
    double received_s_{};
    bool has_state_{false};
};

// Seconds on the steady clock.
double monotonic_seconds();

// Blocks until fd is readable (data or end of file) or stop is set.
// Returns false on stop or a poll error; stop is checked every poll_interval_s.
bool wait_readable(int fd, const std::atomic<bool>& stop, double poll_interval_s = 0.1);

// Cycle statistics of ControlLoop::run.
struct LoopTiming {
    unsigned long cycles{0};
    unsigned long overruns{0};   // cycles that ended past their deadline
    double total_cycle_s{0.0};
    double max_cycle_s{0.0};

    double average_cycle_s() const { return cycles == 0 ? 0.0 : total_cycle_s / cycles; }
};

// Periodic driver of the ControllerManager. Only this loop calls update().
class ControlLoop {
public:
    using CommandSink = std::function<void(const ControlOutput&)>;
    // Called before each update once a snapshot exists, e.g. to sequence setpoints.
    using TickHook = std::function<void(double now_s, const VehicleState&)>;

    ControlLoop(ControllerManager& manager,
                const SnapshotSlot& slot,
                CommandSink sink,
                double period_s = 0.02);

    void set_tick_hook(TickHook hook) { hook_ = std::move(hook); }

    ControlOutput tick(double now_s);

    // Runs until stop is set or EMERGENCY is entered, then emits one neutral command.
    void run(const std::atomic<bool>& stop);

    double period_s() const { return period_s_; }
    unsigned long ticks() const { return ticks_; }
    const ControlOutput& last_output() const { return last_output_; }
    const LoopTiming& timing() const { return timing_; }

private:
    ControllerManager& manager_;
    const SnapshotSlot& slot_;
    CommandSink sink_;
    TickHook hook_;
    double period_s_;

    double last_tick_s_{};
    unsigned long ticks_{0};
    ControlOutput last_output_{};
    LoopTiming timing_{};
};

} // namespace kestrel
