#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "kestrel/adrc.hpp"
#include "kestrel/config.hpp"
#include "kestrel/descent.hpp"
#include "kestrel/estimator.hpp"
#include "kestrel/logger.hpp"
#include "kestrel/loop.hpp"
#include "kestrel/modes.hpp"
#include "kestrel/pid.hpp"
#include "kestrel/sensors.hpp"
#include "kestrel/state.hpp"
#include "kestrel/ude.hpp"

namespace {

std::atomic<bool> g_stop{false};

void handle_sigint(int) {
   g_stop.store(true);
}

struct CsvRow {
   double t_s{};
   double tof_m{};
   double baro_m{};
   double roll_rad{};
   double pitch_rad{};
   double yaw_rad{};
   double imu_ax{};
   double imu_ay{};
   double imu_az{};
   double vx{};
   double vy{};
   double vz{};
   double battery{1.0};
};


struct Args {
   bool stream = false; // if true: read telemetry from stdin, write cmds to stdout
   std::string controller = "pid";
   std::string input_log_path = "logs/telemetry.csv";
   std::string output_log_path = "logs/fsw_output.csv";
   kestrel::ConfigPaths config = kestrel::default_config_paths();
};


// -------- Helpers --------

static Args parse_args(int argc, char** argv) {
   Args a{};
   for (int i = 1; i < argc; ++i) {
       const std::string s = argv[i];
       if (s == "--stream") {
           a.stream = true;
       } else if (s == "--controller" && (i + 1) < argc) {
           a.controller = argv[++i];
       } else if (s == "--input" && (i + 1) < argc) {
           a.input_log_path = argv[++i];
       } else if (s == "--output" && (i + 1) < argc) {
           a.output_log_path = argv[++i];
       } else if (s == "--gains" && (i + 1) < argc) {
           a.config.controller_gains = argv[++i];
       } else if (s == "--safety" && (i + 1) < argc) {
           a.config.safety = argv[++i];
       } else if (s == "--experiment" && (i + 1) < argc) {
           a.config.experiment = argv[++i];
       } else if (s == "--help" || s == "-h") {
           std::cerr
               << "Usage:\n"
               << "  kestrel_fsw [--controller pid|ude|adrc] [--input logs/telemetry.csv] [--output logs/fsw_output.csv]\n"
               << "  kestrel_fsw --stream [--controller pid|ude|adrc] [--output logs/fsw_output.csv]\n"
               << "  config overrides: --gains FILE --safety FILE --experiment FILE\n";
           std::exit(0);
       } else {
           std::cerr << "Unknown arg: " << s << "\n";
           std::exit(1);
       }
   }
   return a;
}

static std::vector<std::string> split_csv(const std::string& line) {
   std::vector<std::string> out;
   std::stringstream ss(line);
   std::string field;
   while (std::getline(ss, field, ',')) out.push_back(field);
   return out;
}

static bool to_double(const std::string& s, double& v) {
   try {
       v = std::stod(s);
       return true;
   } catch (const std::invalid_argument&) {
       return false;
   } catch (const std::out_of_range&) {
       return false;
   }
}

struct ColumnMap {
   int t_s = -1;

   int tof_m = -1;
   int baro_m = -1;

   int roll_rad = -1;
   int pitch_rad = -1;
   int yaw_rad = -1;

   int imu_ax = -1;
   int imu_ay = -1;
   int imu_az = -1;

   int vx = -1;
   int vy = -1;
   int vz = -1;

   int battery = -1;
};

static ColumnMap parse_header_map(const std::string& header_line) {
   ColumnMap m;
   auto cols = split_csv(header_line);

   auto find = [&](std::initializer_list<const char*> names) -> int {
       for (size_t i = 0; i < cols.size(); ++i) {
           for (auto* n : names) {
               if (cols[i] == n) return static_cast<int>(i);
           }
       }
       return -1;
   };

   m.t_s       = find({"t_s", "t"});

   m.tof_m     = find({"tof_m", "tof"});
   m.baro_m    = find({"baro_m", "baro", "height_m"});

   m.roll_rad  = find({"roll_rad", "roll"});
   m.pitch_rad = find({"pitch_rad", "pitch"});
   m.yaw_rad   = find({"yaw_rad", "yaw"});

   m.imu_ax    = find({"imu_ax_mps2", "imu_ax", "agx"});
   m.imu_ay    = find({"imu_ay_mps2", "imu_ay", "agy"});
   m.imu_az    = find({"imu_az_mps2", "imu_az", "agz"});

   m.vx        = find({"vx_mps", "vx"});
   m.vy        = find({"vy_mps", "vy"});
   m.vz        = find({"vz_mps", "vz"});

   m.battery   = find({"battery", "bat"});

   return m;
}

static bool require_columns(const ColumnMap& m) {
   // time and at least one height source
   return m.t_s >= 0 && (m.tof_m >= 0 || m.baro_m >= 0);
}

// Returns true if the needed baseline fields were parsed.
static bool parse_log_line(const std::string& line, const ColumnMap& m, CsvRow& row) {
   if (line.empty()) return false;

   auto fields = split_csv(line);

   auto get = [&](int idx, double& out) -> bool {
       if (idx < 0) return false;
       if (static_cast<size_t>(idx) >= fields.size()) return false;
       return to_double(fields[idx], out);
   };

   if (!get(m.t_s, row.t_s)) return false;

   const bool has_tof  = get(m.tof_m, row.tof_m);
   const bool has_baro = get(m.baro_m, row.baro_m);
   if (!has_tof && !has_baro) return false;

   // the rest is optional, missing fields keep their defaults
   get(m.roll_rad, row.roll_rad);
   get(m.pitch_rad, row.pitch_rad);
   get(m.yaw_rad, row.yaw_rad);

   if (!get(m.imu_az, row.imu_az)) row.imu_az = kestrel::GRAVITY_MPS2;
   get(m.imu_ax, row.imu_ax);
   get(m.imu_ay, row.imu_ay);

   get(m.vx, row.vx);
   get(m.vy, row.vy);
   get(m.vz, row.vz);

   get(m.battery, row.battery);
   return true;
}

// Feeds one telemetry row through the estimator.
static kestrel::VehicleState fuse_row(kestrel::KalmanEstimator& estimator, const CsvRow& row, double dt_s) {
   using namespace kestrel;

   ImuMeasurement imu{};
   imu.timestamp_s = row.t_s;
   imu.accel_mps2  = {row.imu_ax, row.imu_ay, row.imu_az};
   imu.euler_rad   = {row.roll_rad, row.pitch_rad, row.yaw_rad};

   RangeMeasurement range{};
   range.timestamp_s   = row.t_s;
   range.tof_height_m  = row.tof_m;
   range.baro_height_m = row.baro_m;

   VelocityMeasurement vel{};
   vel.timestamp_s  = row.t_s;
   vel.velocity_mps = {row.vx, row.vy, row.vz};

   BatteryMeasurement bat{};
   bat.timestamp_s = row.t_s;
   bat.fraction    = row.battery;

   estimator.predict(dt_s, imu);
   estimator.update_range(range);
   estimator.update_velocity(vel);
   estimator.update_battery(bat);
   return estimator.get_state();
}

static std::unique_ptr<kestrel::Controller> make_controller(const std::string& kind,
                                                            const kestrel::ConfigPaths& paths) {
   using namespace kestrel;
   std::unique_ptr<Controller> c;
   std::string section;
   if (kind == "pid") {
       c = std::make_unique<PidController>();
       section = "pid_gain";
   } else if (kind == "ude") {
       c = std::make_unique<UdeController>();
       section = "ude_gain";
   } else if (kind == "adrc") {
       c = std::make_unique<AdrcController>();
       section = "ameso_gain";
   } else {
       throw ConfigError("unknown controller '" + kind + "' (expected pid, ude or adrc)");
   }
   c->initialize(Config::load_yaml(paths.controller_gains, section));
   return c;
}

} // namespace


int main(int argc, char** argv) {
   using namespace kestrel;
   const Args args = parse_args(argc, argv);
   if (args.stream) {
       // std::cin keeps its own buffer, so in_avail() sees lines already read from the fd
       std::ios::sync_with_stdio(false);
   }

   // IMPORTANT: anything printed to stdout in --stream mode is read by the upstream driver as a command. Use stderr for diagnostics.
   std::cerr << "Kestrel FSW starting (" << args.controller << ").\n";

   std::unique_ptr<ControllerManager> manager;
   EstimatorConfig est_cfg{};
   DescentConfig descent_cfg{};
   try {
       manager = std::make_unique<ControllerManager>(
           ManagerConfig::from_config(Config::load_yaml(args.config.safety, "manager")));
       manager->register_controller("position", make_controller(args.controller, args.config));
       est_cfg = EstimatorConfig::from_config(Config::load_yaml(args.config.experiment, "estimator"));
       descent_cfg = DescentConfig::from_config(Config::load_yaml(args.config.experiment, "experiment"));
   } catch (const ConfigError& e) {
       std::cerr << "ERROR: configuration: " << e.what() << "\n";
       return 2;
   }

   // Output log
   std::ofstream output_file(args.output_log_path);
   if (!output_file) {
       std::cerr << "ERROR: failed to open output log: " << args.output_log_path << "\n";
       return 1;
   }
   CsvLogger logger(output_file);

   // Input: file OR stdin
   std::ifstream input_file;
   std::istream* in = nullptr;

   if (args.stream) {
       in = &std::cin;
   } else {
       input_file.open(args.input_log_path);
       if (!input_file) {
           std::cerr << "ERROR: failed to open input log: " << args.input_log_path << "\n";
           return 1;
       }
       in = &input_file;
   }

   std::string header_line;
   if (!std::getline(*in, header_line)) {
       std::cerr << "ERROR: empty telemetry input stream\n";
       return 1;
   }
   const ColumnMap colmap = parse_header_map(header_line);
   if (!require_columns(colmap)) {
       std::cerr << "ERROR: telemetry header needs t_s and tof_m or baro_m\n";
       return 1;
   }

   KalmanEstimator estimator(est_cfg);
   DescentScript script(descent_cfg);
   SnapshotSlot slot;

   // In stream mode, emit an output header ONCE
   if (args.stream) {
       std::cout << "t_s,cmd_roll,cmd_pitch,cmd_yaw_rate,cmd_thrust\n";
       std::cout.flush();
   }

   double tick_time_s = 0.0;
   double t0_s = -1.0;
   double last_print_s = -1.0;
   VehicleState tick_state{};

   // Sequencing and logging hooks, both run on the loop thread
   auto sink = [&](const ControlOutput& cmd) {
       const Controller* active = manager->active_controller();
       TelemetryRecord rec{};
       rec.timestamp_s = tick_time_s - t0_s;
       rec.mode        = manager->mode();
       rec.phase_index = static_cast<int>(script.phase());
       rec.state       = tick_state;
       rec.target      = script.target();
       rec.command     = cmd;
       if (active != nullptr) {
           rec.status = active->status();
       }
       logger.log(rec);

       if (args.stream) {
           std::cout << rec.timestamp_s << ","
                     << cmd.roll << ","
                     << cmd.pitch << ","
                     << cmd.yaw_rate << ","
                     << cmd.thrust << "\n";
           std::cout.flush();
       }

       // Console status every ~2 s
       if (active != nullptr && (last_print_s < 0.0 || tick_time_s - last_print_s >= 2.0)) {
           last_print_s = tick_time_s;
           std::cerr << "[" << to_string(script.phase()) << "] "
                     << format_status(rec.status) << "\n";
       }
   };

   ControlLoop loop(*manager, slot, sink);
   loop.set_tick_hook([&](double now_s, const VehicleState& state) {
       if (t0_s < 0.0) t0_s = now_s;
       tick_time_s = now_s;
       tick_state = state;

       const DescentPhase before = script.phase();
       script.update(now_s - t0_s, state);
       if (script.phase() != before) {
           std::cerr << "Phase " << to_string(before) << " -> " << to_string(script.phase()) << "\n";
       }
       if (script.phase() == DescentPhase::LANDED) {
           manager->request_mode(ControlMode::MANUAL);
           g_stop.store(true);
           return;
       }
       manager->set_target(script.target());
       if (manager->mode() == ControlMode::MANUAL) {
           manager->request_mode(ControlMode::POSITION);
       }
   });

   if (args.stream) {
       std::signal(SIGINT, handle_sigint);

       // Reader thread: telemetry -> estimator -> slot
       std::thread reader([&]() {
           std::string line;
           double last_t = -1.0;
           while (!g_stop.load()) {
               // Only block in getline once input is pending, so a stop is noticed
               if (in->rdbuf()->in_avail() <= 0 && !wait_readable(STDIN_FILENO, g_stop)) {
                   break;
               }
               if (!std::getline(*in, line)) {
                   break;
               }
               CsvRow row{};
               if (!parse_log_line(line, colmap, row)) {
                   std::cerr << "Skipping malformed line: " << line << "\n";
                   continue;
               }
               const double dt_s = (last_t < 0.0) ? loop.period_s() : row.t_s - last_t;
               last_t = row.t_s;
               slot.publish(fuse_row(estimator, row, dt_s), monotonic_seconds());
           }
           g_stop.store(true);
       });

       loop.run(g_stop);
       g_stop.store(true);
       reader.join();
   } else {
       // Replay: one tick per telemetry row, timed by the row timestamps
       double last_t = -1.0;
       std::string line;
       while (!g_stop.load() && std::getline(*in, line)) {
           CsvRow row{};
           if (!parse_log_line(line, colmap, row)) {
               std::cerr << "Skipping malformed line: " << line << "\n";
               continue;
           }
           const double dt_s = (last_t < 0.0) ? loop.period_s() : row.t_s - last_t;
           last_t = row.t_s;
           slot.publish(fuse_row(estimator, row, dt_s), row.t_s);
           loop.tick(row.t_s);
           if (manager->mode() == ControlMode::EMERGENCY) {
               break;
           }
       }
   }

   const ManagerStatus st = manager->status();
   std::cerr << "Kestrel FSW exiting: mode " << to_string(st.mode)
             << ", ticks " << st.ticks
             << ", stale " << st.stale_ticks;
   if (!st.emergency_reason.empty()) {
       std::cerr << ", emergency: " << st.emergency_reason;
   }
   std::cerr << std::endl;

   const LoopTiming& timing = loop.timing();
   if (timing.cycles > 0) {
       std::cerr << "Loop: cycles " << timing.cycles
                 << ", avg " << timing.average_cycle_s() * 1e3 << " ms"
                 << ", max " << timing.max_cycle_s * 1e3 << " ms"
                 << ", overruns " << timing.overruns << std::endl;
   }
   return 0;
}
