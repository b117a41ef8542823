#include "kestrel/loop.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <limits>
#include <thread>

#include <poll.h>

namespace kestrel {

namespace {

// Registration is rejected while this is alive.
class RunningScope {
public:
    explicit RunningScope(ControllerManager& manager) : manager_(manager) { manager_.set_running(true); }
    ~RunningScope() { manager_.set_running(false); }
    RunningScope(const RunningScope&) = delete;
    RunningScope& operator=(const RunningScope&) = delete;

private:
    ControllerManager& manager_;
};

} // namespace

void SnapshotSlot::publish(const VehicleState& state, double received_s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    received_s_ = received_s;
    has_state_ = true;
}

bool SnapshotSlot::read(VehicleState& out, double& received_s) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_state_) {
        return false;
    }
    out = state_;
    received_s = received_s_;
    return true;
}

double monotonic_seconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

bool wait_readable(int fd, const std::atomic<bool>& stop, double poll_interval_s) {
    const int timeout_ms = std::max(1, static_cast<int>(poll_interval_s * 1e3));
    while (!stop.load()) {
        pollfd p{};
        p.fd = fd;
        p.events = POLLIN;
        const int ready = ::poll(&p, 1, timeout_ms);
        if (ready > 0) {
            return true;
        }
        if (ready < 0 && errno != EINTR) {
            std::cerr << "[loop] poll failed on fd " << fd << ", errno " << errno << "\n";
            return false;
        }
    }
    return false;
}

ControlLoop::ControlLoop(ControllerManager& manager,
                         const SnapshotSlot& slot,
                         CommandSink sink,
                         double period_s)
    : manager_(manager),
      slot_(slot),
      sink_(std::move(sink)),
      period_s_(period_s) {}

ControlOutput ControlLoop::tick(double now_s) {
    const double dt_s = (ticks_ == 0) ? period_s_ : now_s - last_tick_s_;
    last_tick_s_ = now_s;
    ++ticks_;

    VehicleState snapshot{};
    double received_s = 0.0;
    double age_s = std::numeric_limits<double>::infinity();
    if (slot_.read(snapshot, received_s)) {
        age_s = now_s - received_s;
        if (hook_) {
            hook_(now_s, snapshot);
        }
    }

    last_output_ = manager_.update(snapshot, age_s, dt_s);
    if (sink_) {
        sink_(last_output_);
    }
    return last_output_;
}

void ControlLoop::run(const std::atomic<bool>& stop) {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(period_s_));

    {
        RunningScope running(manager_);
        auto next = clock::now();
        while (!stop.load()) {
            const auto start = clock::now();
            tick(monotonic_seconds());
            const auto now = clock::now();

            const double cycle_s = std::chrono::duration<double>(now - start).count();
            ++timing_.cycles;
            timing_.total_cycle_s += cycle_s;
            timing_.max_cycle_s = std::max(timing_.max_cycle_s, cycle_s);

            if (manager_.mode() == ControlMode::EMERGENCY) {
                break;
            }
            next += period;
            if (next < now) {
                // Overran, restart the schedule instead of bursting
                ++timing_.overruns;
                next = now;
            }
            std::this_thread::sleep_until(next);
        }
    }

    last_output_ = manager_.neutral();
    if (sink_) {
        sink_(last_output_);
    }
}

} // namespace kestrel
