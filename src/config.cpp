#include <omnikin/config.hpp>
#include <omnikin/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace omnikin {

static std::string strip_blanks(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(first, last - first + 1);
}

// A preset row is six plain comma-separated fields; quoting is not supported.
static std::vector<std::string> preset_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::size_t from = 0;
  for (;;) {
    const auto comma = line.find(',', from);
    fields.push_back(strip_blanks(line.substr(from, comma - from)));
    if (comma == std::string::npos) break;
    from = comma + 1;
  }
  return fields;
}

static constexpr std::size_t kPresetFields = 6;

// The column-name row starts with "key" in any case.
static bool is_column_names(const std::vector<std::string>& fields) {
  if (fields.size() < kPresetFields) return false;
  std::string first = fields[0];
  std::transform(first.begin(), first.end(), first.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return first == "key";
}

// Whole-field decimal (metres, degrees or rad/s); trailing junk is rejected.
static std::optional<double> number_field(const std::string& s) {
  try {
    std::size_t used = 0;
    const double v = std::stod(s, &used);
    if (used != s.size()) return std::nullopt;
    return v;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

// Wheel counts are plain unsigned integers: no sign, no exponent.
static std::optional<std::size_t> count_field(const std::string& s) {
  if (s.empty()) return std::nullopt;
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); })) {
    return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoul(s));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

// key,wheel_count,wheel_radius_m,wheel_width_m,center_distance_m,phase_deg
// Rows a GeometryModel would reject are dropped, so every catalog entry builds.
static std::optional<RobotPreset> parse_preset_row(const std::vector<std::string>& f) {
  if (f.size() < kPresetFields || f[0].empty()) return std::nullopt;
  const auto n = count_field(f[1]);
  const auto r = number_field(f[2]);
  const auto w = number_field(f[3]);
  const auto L = number_field(f[4]);
  const auto phase = number_field(f[5]);
  if (!n || !r || !w || !L || !phase) return std::nullopt;

  if (*n < GeometryModel::kMinWheels || *n > GeometryModel::kMaxWheels) return std::nullopt;
  if (!(*r > 0.0) || !(*L > 0.0) || *w < 0.0) return std::nullopt;

  return RobotPreset{f[0], *n, *r, *w, *L, *phase};
}

static std::vector<RobotPreset> make_catalog_builtin() {
  return {
    {"tri",  3, 0.148, 0.044, 0.195, 60.0},
    {"quad", 4, 0.148, 0.044, 0.195, 45.0},
  };
}

const std::vector<RobotPreset>& preset_catalog() {
  static const std::vector<RobotPreset> cat = make_catalog_builtin();
  return cat;
}

std::optional<RobotPreset> preset_by_key(const std::string& key) {
  return preset_by_key_in(preset_catalog(), key);
}

std::optional<RobotPreset> preset_by_key_in(const std::vector<RobotPreset>& cat,
                                            const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const RobotPreset& p){ return p.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::optional<RobotPreset> preset_for_wheels(const std::vector<RobotPreset>& cat,
                                             std::size_t wheel_count) {
  auto it = std::find_if(cat.begin(), cat.end(),
                         [&](const RobotPreset& p){ return p.wheel_count == wheel_count; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<RobotPreset> preset_catalog_from_csv_stream(std::istream& in) {
  std::vector<RobotPreset> presets;
  bool seen_names = false;
  for (std::string line; std::getline(in, line);) {
    const std::string row = strip_blanks(line);
    if (row.empty() || row.front() == '#') continue;

    const auto fields = preset_fields(row);
    // Only the first column-name row is skipped; a later one is just invalid.
    if (!seen_names && is_column_names(fields)) {
      seen_names = true;
      continue;
    }
    if (auto preset = parse_preset_row(fields)) presets.push_back(std::move(*preset));
  }
  return presets;
}

std::optional<std::vector<RobotPreset>> load_preset_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return preset_catalog_from_csv_stream(f);
}

GeometryModel make_geometry(const RobotPreset& p) {
  return GeometryModel::evenly_spaced(p.wheel_count,
                                      p.wheel_radius_m,
                                      p.center_distance_m,
                                      p.phase_deg * kDegToRad,
                                      p.wheel_width_m);
}

// ---- command line ----

static double parse_number_arg(const std::string& flag, const std::string& value) {
  const auto v = number_field(strip_blanks(value));
  if (!v || !std::isfinite(*v)) {
    throw InvalidConfiguration("invalid number for " + flag + ": '" + value + "'");
  }
  return *v;
}

AppConfig parse_args(int argc, const char* const* argv) {
  AppConfig cfg{};
  auto next_value = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) throw InvalidConfiguration("missing value for " + flag);
    return std::string(argv[++i]);
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
    } else if (arg == "--both") {
      cfg.both = true;
    } else if (arg == "--wheels") {
      const std::string v = next_value(i, arg);
      const auto n = count_field(strip_blanks(v));
      if (!n) throw InvalidConfiguration("invalid wheel count: '" + v + "'");
      cfg.wheel_count = *n;
    } else if (arg == "--omega") {
      cfg.omega = parse_number_arg(arg, next_value(i, arg));
    } else if (arg == "--vx") {
      cfg.vx = parse_number_arg(arg, next_value(i, arg));
    } else if (arg == "--vy") {
      cfg.vy = parse_number_arg(arg, next_value(i, arg));
    } else if (arg == "--dt") {
      cfg.dt = parse_number_arg(arg, next_value(i, arg));
    } else if (arg == "--mode") {
      const std::string v = next_value(i, arg);
      if (v == "constant")   cfg.mode = DriveMode::Constant;
      else if (v == "sweep") cfg.mode = DriveMode::Sweep;
      else throw InvalidConfiguration("unknown drive mode '" + v + "' (constant|sweep)");
    } else if (arg == "--frame") {
      const std::string v = next_value(i, arg);
      if (v == "world")     cfg.frame = IntegrationFrame::World;
      else if (v == "body") cfg.frame = IntegrationFrame::Body;
      else throw InvalidConfiguration("unknown integration frame '" + v + "' (world|body)");
    } else if (arg == "--presets") {
      cfg.preset_csv = next_value(i, arg);
    } else {
      throw InvalidConfiguration("unknown option '" + arg + "'");
    }
  }
  return cfg;
}

void validate(const AppConfig& cfg) {
  if (!cfg.both && (cfg.wheel_count < GeometryModel::kMinWheels ||
                    cfg.wheel_count > GeometryModel::kMaxWheels)) {
    throw InvalidConfiguration("unsupported wheel count " + std::to_string(cfg.wheel_count) +
                               " (expected 3 or 4)");
  }
  if (!std::isfinite(cfg.dt) || cfg.dt <= 0.0) {
    throw InvalidConfiguration("timestep must be > 0, got " + std::to_string(cfg.dt));
  }
  if (!std::isfinite(cfg.omega) || !std::isfinite(cfg.vx) || !std::isfinite(cfg.vy)) {
    throw InvalidConfiguration("velocity components must be finite");
  }
}

std::vector<std::size_t> configured_wheel_counts(const AppConfig& cfg) {
  if (cfg.both) return {3, 4};
  return {cfg.wheel_count};
}

const char* usage() {
  return
    "usage: omnikin_viewer [options]\n"
    "  --wheels N            3 or 4 (default 3)\n"
    "  --both                show 3-wheel and 4-wheel robots side by side\n"
    "  --omega W             angular velocity, rad/s (default 0)\n"
    "  --vx V, --vy V        body velocity for constant mode, m/s\n"
    "  --mode constant|sweep drive program (default sweep)\n"
    "  --frame world|body    integration frame (default world)\n"
    "  --dt S                seconds per tick (default 0.05)\n"
    "  --presets PATH        robot preset CSV\n"
    "  --help                this text\n";
}

} // namespace omnikin
