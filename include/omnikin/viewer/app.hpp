#pragma once
#include <cstddef>
#include <vector>
#include <omnikin/snap.hpp>

namespace omnikin {

class SimRunner;

// RAII application that ticks each runner once per frame and draws the
// resulting snapshots in side-by-side panels.
class ViewerApp {
public:
  explicit ViewerApp(std::vector<SimRunner*> runners);
  int run(); // returns 0 on normal exit

private:
  struct Vec2f { float x; float y; };
  struct Panel {
    float x0, y0, w, h;
    float scale_px_per_m;
  };

  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_grid_(const Panel& p, const RobotSnapshot& s) const;
  void draw_robot_(const Panel& p, const SimRunner& runner, const RobotSnapshot& s) const;
  void draw_info_(const Panel& p, const SimRunner& runner, const RobotSnapshot& s) const;
  void draw_hud_() const;

  // Helpers
  Panel panel_(std::size_t idx) const;
  // Camera follows the robot: world point relative to the pose.
  Vec2f worldToScreen_(const Panel& p, const RobotPose& cam, double x, double y) const;

  // Dependencies (not owned)
  std::vector<SimRunner*> runners_;
  std::vector<RobotSnapshot> snaps_;

  // UI state
  float zoom_{1.0f};
  double omega_step_{0.1};
};

} // namespace omnikin
