#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <omnikin/drive.hpp>
#include <omnikin/geometry.hpp>
#include <omnikin/sim.hpp>

namespace omnikin {

// Physical description of one robot layout.
struct RobotPreset {
  std::string key;           // e.g., "tri"
  std::size_t wheel_count;   // 3 or 4
  double wheel_radius_m;
  double wheel_width_m;
  double center_distance_m;
  double phase_deg;          // mount angle of wheel 0
};

// Built-in catalog: "tri" (3 wheels) and "quad" (4 wheels).
const std::vector<RobotPreset>& preset_catalog();

std::optional<RobotPreset> preset_by_key(const std::string& key);
std::optional<RobotPreset> preset_by_key_in(const std::vector<RobotPreset>& cat,
                                            const std::string& key);
// First preset with the requested wheel count.
std::optional<RobotPreset> preset_for_wheels(const std::vector<RobotPreset>& cat,
                                             std::size_t wheel_count);

// CSV columns: key,wheel_count,wheel_radius_m,wheel_width_m,center_distance_m,phase_deg
// Optional header row; '#' lines and blank lines ignored; invalid rows skipped.
std::vector<RobotPreset> preset_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<RobotPreset>> load_preset_catalog_csv(const std::string& path);

// Throws InvalidConfiguration on bad constants.
GeometryModel make_geometry(const RobotPreset& p);

// Startup options of the viewer application.
struct AppConfig {
  std::size_t wheel_count = 3;
  double omega = 0.0;        // rad/s
  bool both = false;         // 3-wheel and 4-wheel side by side
  double vx = 0.0;
  double vy = 0.0;
  DriveMode mode = DriveMode::Sweep;
  IntegrationFrame frame = IntegrationFrame::World;
  double dt = 0.05;          // seconds per tick
  std::string preset_csv{};  // empty -> built-in catalog
  bool show_help = false;
};

// Parses --wheels N --omega W --both --vx V --vy V --mode constant|sweep
// --frame world|body --dt S --presets PATH --help.
// Throws InvalidConfiguration on unknown flags or malformed values.
AppConfig parse_args(int argc, const char* const* argv);

// Throws InvalidConfiguration if the options cannot start a simulation.
void validate(const AppConfig& cfg);

// Wheel counts to instantiate: {n} or {3, 4} when cfg.both.
std::vector<std::size_t> configured_wheel_counts(const AppConfig& cfg);

const char* usage();

} // namespace omnikin
