#include <raylib.h>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <omnikin/config.hpp>
#include <omnikin/errors.hpp>
#include <omnikin/sim_runner.hpp>
#include <omnikin/viewer/app.hpp>

using namespace omnikin;

static std::vector<RobotPreset> resolve_catalog(const AppConfig& cfg) {
  if (cfg.preset_csv.empty()) return preset_catalog();
  auto loaded = load_preset_catalog_csv(cfg.preset_csv);
  if (!loaded) {
    throw InvalidConfiguration("cannot open preset file '" + cfg.preset_csv + "'");
  }
  TraceLog(LOG_INFO, "omnikin: loaded %d preset(s) from %s",
           (int)loaded->size(), cfg.preset_csv.c_str());
  return *loaded;
}

int main(int argc, char** argv) {
  std::vector<std::unique_ptr<SimRunner>> sims;
  try {
    const AppConfig cfg = parse_args(argc, argv);
    if (cfg.show_help) {
      std::fputs(usage(), stdout);
      return 0;
    }
    validate(cfg);

    const auto catalog = resolve_catalog(cfg);
    const RunnerOptions opts = runner_options(cfg);
    for (std::size_t n : configured_wheel_counts(cfg)) {
      auto preset = preset_for_wheels(catalog, n);
      if (!preset) {
        throw InvalidConfiguration("no robot preset with " + std::to_string(n) + " wheels");
      }
      sims.push_back(std::make_unique<SimRunner>(*preset, opts));
      TraceLog(LOG_INFO, "omnikin: %s preset=%s r=%.3f L=%.3f phase=%.1f deg",
               sims.back()->label().c_str(), preset->key.c_str(),
               preset->wheel_radius_m, preset->center_distance_m, preset->phase_deg);
    }
    TraceLog(LOG_INFO, "omnikin: mode=%s frame=%s dt=%.3f omega=%.2f v=(%.2f, %.2f)",
             drive_mode_name(cfg.mode), frame_name(cfg.frame), cfg.dt,
             cfg.omega, cfg.vx, cfg.vy);
  } catch (const InvalidConfiguration& e) {
    TraceLog(LOG_ERROR, "omnikin: invalid configuration: %s", e.what());
    std::fputs(usage(), stderr);
    return 1;
  }

  std::vector<SimRunner*> views;
  for (auto& s : sims) views.push_back(s.get());

  ViewerApp app(views);
  return app.run();
}
