#include "kestrel/logger.hpp"

#include <iomanip>

namespace kestrel {

// Output stream constructor
CsvLogger::CsvLogger(std::ostream& os)
    : os_(os) {}

void CsvLogger::write_header() {
    os_ << "t,mode,phase,"
        << "x,y,z,"
        << "vx,vy,vz,"
        << "roll,pitch,yaw,battery,"
        << "x_ref,y_ref,z_ref,vz_ref,"
        << "cmd_roll,cmd_pitch,cmd_yaw_rate,cmd_thrust,"
        << "ex,ey,ez,"
        << "dist_x,dist_y,dist_z,"
        << "sat_events,stale_subs,divergences,frozen\n";
}

void CsvLogger::log(const TelemetryRecord& r) {
    if (!header_written_) {
        write_header();
        header_written_ = true;
    }

    os_ << std::setprecision(6) << std::fixed;

    os_ << r.timestamp_s << ","
        << control_mode_to_int(r.mode) << ","
        << r.phase_index << ",";

    // VehicleState
    os_ << r.state.position.x() << ","
        << r.state.position.y() << ","
        << r.state.position.z() << ","
        << r.state.velocity.x() << ","
        << r.state.velocity.y() << ","
        << r.state.velocity.z() << ","
        << r.state.attitude.roll << ","
        << r.state.attitude.pitch << ","
        << r.state.attitude.yaw << ","
        << r.state.battery_fraction << ",";

    // Target
    os_ << r.target.position.x() << ","
        << r.target.position.y() << ","
        << r.target.position.z() << ","
        << r.target.velocity.z() << ",";

    // Command
    os_ << r.command.roll << ","
        << r.command.pitch << ","
        << r.command.yaw_rate << ","
        << r.command.thrust << ",";

    // Controller diagnostics
    os_ << r.status.last_position_error.x() << ","
        << r.status.last_position_error.y() << ","
        << r.status.last_position_error.z() << ","
        << r.status.disturbance_estimate.x() << ","
        << r.status.disturbance_estimate.y() << ","
        << r.status.disturbance_estimate.z() << ","
        << r.status.count(HealthEvent::SATURATION) << ","
        << r.status.count(HealthEvent::STALE_SENSOR) << ","
        << r.status.count(HealthEvent::OBSERVER_DIVERGENCE) << ","
        << (r.status.adaptation_frozen ? 1 : 0) << "\n";
}

} // namespace kestrel
