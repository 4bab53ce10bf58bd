#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <omnikin/viewer/app.hpp>
#include <omnikin/sim_runner.hpp>
#include <omnikin/geometry.hpp> // kPI, kRadToDeg

namespace omnikin {

namespace {

// Visible world window around the robot center (meters).
static constexpr double kViewSpanM    = 0.9;
static constexpr double kGridStepM    = 0.1;
// Wheel arrow normalization: arrows reach full length at this speed (rad/s).
static constexpr double kMaxWheelVel  = 6.0;
static constexpr double kMinWheelVel  = 0.1;
static constexpr double kMinBodySpeed = 0.01;

static constexpr int kHUD_H = 64;

static const char* warpLabel(double w) {
  if (w == 0.0)  return "Frozen";
  if (w == 0.25) return "0.25x";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  return "custom";
}

static Vector2 toV(float x, float y) { return Vector2{x, y}; }

// raylib culls triangles with the wrong winding; order so the screen-space
// cross product is positive.
static void draw_triangle_any(Vector2 a, Vector2 b, Vector2 c, Color col) {
  const float cross = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
  if (cross > 0.0f) DrawTriangle(a, b, c, col);
  else              DrawTriangle(a, c, b, col);
}

static void draw_arrow(Vector2 from, Vector2 to, float thick, float head, Color col) {
  const float dx = to.x - from.x, dy = to.y - from.y;
  const float len = std::sqrt(dx*dx + dy*dy);
  if (len < 1.0f) return;
  const float ux = dx / len, uy = dy / len;
  const Vector2 base = { to.x - ux * head, to.y - uy * head };
  DrawLineEx(from, base, thick, col);
  const Vector2 l = { base.x - uy * head * 0.6f, base.y + ux * head * 0.6f };
  const Vector2 r = { base.x + uy * head * 0.6f, base.y - ux * head * 0.6f };
  draw_triangle_any(to, l, r, col);
}

static std::string wheel_list(const RobotSnapshot& s) {
  std::string out;
  char buf[32];
  for (std::size_t i = 0; i < s.wheels.size(); ++i) {
    std::snprintf(buf, sizeof(buf), "%s%.1f", i ? ", " : "", s.wheels[i].velocity);
    out += buf;
  }
  return out;
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(std::vector<SimRunner*> runners)
  : runners_(std::move(runners)) {
  snaps_.reserve(runners_.size());
  for (const auto* r : runners_) snaps_.push_back(r->last_snapshot());
}

ViewerApp::Panel ViewerApp::panel_(std::size_t idx) const {
  const float W = float(GetScreenWidth());
  const float H = float(GetScreenHeight() - kHUD_H);
  const float n = float(std::max<std::size_t>(1, runners_.size()));
  Panel p{};
  p.w  = W / n;
  p.h  = H;
  p.x0 = p.w * float(idx);
  p.y0 = float(kHUD_H);
  p.scale_px_per_m = zoom_ * std::min(p.w, p.h) / float(kViewSpanM);
  return p;
}

ViewerApp::Vec2f ViewerApp::worldToScreen_(const Panel& p, const RobotPose& cam,
                                           double x, double y) const {
  const float cx = p.x0 + p.w * 0.5f;
  const float cy = p.y0 + p.h * 0.5f;
  return { cx + float((x - cam.x) * p.scale_px_per_m),
           cy - float((y - cam.y) * p.scale_px_per_m) };
}

int ViewerApp::run() {
  const int W = runners_.size() > 1 ? 1600 : 800;
  const int H = 800 + kHUD_H;
  InitWindow(W, H, "omnikin - Jacobian Omnidirectional");
  SetTargetFPS(20); // one tick per frame, matches the default 50 ms step

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) {
    for (auto* r : runners_) r->request_pause_toggle();
  }

  // Time scale
  double warp = -1.0;
  if (IsKeyPressed(KEY_ONE))   warp = 0.25;
  if (IsKeyPressed(KEY_TWO))   warp = 0.5;
  if (IsKeyPressed(KEY_THREE)) warp = 1.0;
  if (IsKeyPressed(KEY_FOUR))  warp = 2.0;
  if (IsKeyPressed(KEY_FIVE))  warp = 4.0;
  if (warp >= 0.0) for (auto* r : runners_) r->time_scale = warp;

  // Omega
  double d_omega = 0.0;
  if (IsKeyPressed(KEY_UP))   d_omega += omega_step_;
  if (IsKeyPressed(KEY_DOWN)) d_omega -= omega_step_;
  if (d_omega != 0.0) {
    for (auto* r : runners_) {
      const double w = r->omega() + d_omega;
      r->request_omega(w);
      TraceLog(LOG_INFO, "omnikin: %s omega -> %.2f rad/s", r->label().c_str(), w);
    }
  }

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      zoom_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) zoom_ *= 0.99f;
  zoom_ = std::clamp(zoom_, 0.25f, 4.0f);

  if (IsKeyPressed(KEY_R)) {
    for (auto* r : runners_) r->reset();
    TraceLog(LOG_INFO, "omnikin: reset");
  }
}

void ViewerApp::pump_snapshots_() {
  for (std::size_t i = 0; i < runners_.size(); ++i) {
    const RunState before = snaps_[i].state;
    snaps_[i] = runners_[i]->tick();
    if (snaps_[i].state != before) {
      TraceLog(LOG_INFO, "omnikin: %s %s", runners_[i]->label().c_str(),
               snaps_[i].state == RunState::Paused ? "paused" : "resumed");
    }
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{245, 245, 245, 255});

  for (std::size_t i = 0; i < runners_.size(); ++i) {
    const Panel p = panel_(i);
    BeginScissorMode(int(p.x0), int(p.y0), int(p.w), int(p.h));
    draw_grid_(p, snaps_[i]);
    draw_robot_(p, *runners_[i], snaps_[i]);
    draw_info_(p, *runners_[i], snaps_[i]);
    EndScissorMode();
    if (i > 0) DrawLine(int(p.x0), int(p.y0), int(p.x0), int(p.y0 + p.h), Color{120,120,130,255});
  }

  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_grid_(const Panel& p, const RobotSnapshot& s) const {
  // World-fixed grid; it scrolls as the robot translates.
  const double half_w = 0.5 * p.w / p.scale_px_per_m;
  const double half_h = 0.5 * p.h / p.scale_px_per_m;
  const double x_lo = std::floor((s.pose.x - half_w) / kGridStepM) * kGridStepM;
  const double y_lo = std::floor((s.pose.y - half_h) / kGridStepM) * kGridStepM;
  const Color line = Color{220, 220, 225, 255};

  for (double x = x_lo; x <= s.pose.x + half_w; x += kGridStepM) {
    auto a = worldToScreen_(p, s.pose, x, s.pose.y - half_h);
    auto b = worldToScreen_(p, s.pose, x, s.pose.y + half_h);
    DrawLineV(toV(a.x, a.y), toV(b.x, b.y), line);
  }
  for (double y = y_lo; y <= s.pose.y + half_h; y += kGridStepM) {
    auto a = worldToScreen_(p, s.pose, s.pose.x - half_w, y);
    auto b = worldToScreen_(p, s.pose, s.pose.x + half_w, y);
    DrawLineV(toV(a.x, a.y), toV(b.x, b.y), line);
  }
  // World origin marker
  auto o = worldToScreen_(p, s.pose, 0.0, 0.0);
  DrawCircleV(toV(o.x, o.y), 3.0f, Color{160, 160, 170, 255});
}

void ViewerApp::draw_robot_(const Panel& p, const SimRunner& runner, const RobotSnapshot& s) const {
  const auto& g = runner.core().geometry();
  const float k = p.scale_px_per_m;
  const double L = g.center_distance();
  const double r = g.wheel_radius();
  const double w = g.wheel_width();

  // Body
  auto c = worldToScreen_(p, s.pose, s.pose.x, s.pose.y);
  DrawCircleV(toV(c.x, c.y), float(L) * k, Fade(BLUE, 0.5f));
  DrawCircleLines(int(c.x), int(c.y), float(L) * k, BLACK);

  // Forward marker
  auto f = worldToScreen_(p, s.pose,
                          s.pose.x + L * std::cos(s.pose.heading_rad),
                          s.pose.y + L * std::sin(s.pose.heading_rad));
  DrawCircleV(toV(f.x, f.y), 5.0f, DARKBLUE);

  // Driving direction arrow (scaled by speed, up to 0.9 L at 1 m/s)
  double speed = 0.0, dir_rad = 0.0;
  if (runner.mode() == DriveMode::Sweep) {
    speed = runner.last_drive().speed;
    dir_rad = runner.last_drive().angle_deg * kDegToRad;
  } else {
    speed = std::hypot(s.velocity.vx, s.velocity.vy);
    dir_rad = std::atan2(s.velocity.vy, s.velocity.vx);
    if (runner.core().state().frame() == IntegrationFrame::Body) dir_rad += s.pose.heading_rad;
  }
  if (speed > kMinBodySpeed) {
    const double len = 0.9 * L * std::min(speed, 1.0);
    auto tip = worldToScreen_(p, s.pose,
                              s.pose.x + len * std::cos(dir_rad),
                              s.pose.y + len * std::sin(dir_rad));
    draw_arrow(toV(c.x, c.y), toV(tip.x, tip.y), 4.0f, 0.02f * k, WHITE);
  }

  // Wheels and their velocity arrows
  for (std::size_t i = 0; i < s.wheels.size(); ++i) {
    const auto& wh = s.wheels[i];
    const double a = wh.mount_angle_rad;
    const double tx = std::cos(a + kPI / 2.0), ty = std::sin(a + kPI / 2.0); // rolling direction
    const double rx = std::cos(a), ry = std::sin(a);                         // radial

    auto wc = worldToScreen_(p, s.pose, wh.position.x, wh.position.y);
    Rectangle rec{ wc.x, wc.y, float(r) * k, float(w) * k };
    // Long side along the rolling direction; screen y is flipped.
    const float rot_deg = -float((a + kPI / 2.0) * kRadToDeg);
    DrawRectanglePro(rec, toV(rec.width * 0.5f, rec.height * 0.5f), rot_deg, WHITE);

    const Vector2 corners[4] = {
      toV(wc.x + float(( tx*r/2 + rx*w/2) * k), wc.y - float(( ty*r/2 + ry*w/2) * k)),
      toV(wc.x + float(( tx*r/2 - rx*w/2) * k), wc.y - float(( ty*r/2 - ry*w/2) * k)),
      toV(wc.x + float((-tx*r/2 - rx*w/2) * k), wc.y - float((-ty*r/2 - ry*w/2) * k)),
      toV(wc.x + float((-tx*r/2 + rx*w/2) * k), wc.y - float((-ty*r/2 + ry*w/2) * k)),
    };
    for (int e = 0; e < 4; ++e) DrawLineV(corners[e], corners[(e + 1) % 4], BLACK);

    const double v = wh.velocity;
    if (std::fabs(v) >= kMinWheelVel) {
      // Arrow starts just outside the wheel; positive speed points against the tangent.
      const double off = w / 2.0 + 0.01;
      const double bx = wh.position.x + rx * off;
      const double by = wh.position.y + ry * off;
      const double len = std::min(std::fabs(v) / kMaxWheelVel, 1.0) * r * 0.3;
      const double sgn = v < 0.0 ? 1.0 : -1.0;
      auto from = worldToScreen_(p, s.pose, bx, by);
      auto to   = worldToScreen_(p, s.pose, bx + sgn * tx * len, by + sgn * ty * len);
      draw_arrow(toV(from.x, from.y), toV(to.x, to.y), 2.0f, 0.01f * k, BLUE);
    }

    const char* idx = TextFormat("%d", int(i));
    DrawText(idx, int(wc.x) - MeasureText(idx, 18) / 2, int(wc.y) - 9, 18, BLACK);
  }
}

void ViewerApp::draw_info_(const Panel& p, const SimRunner& runner, const RobotSnapshot& s) const {
  // Title
  const char* title = runner.label().c_str();
  const int tw = MeasureText(title, 22);
  DrawText(title, int(p.x0 + (p.w - tw) * 0.5f), int(p.y0) + 8, 22, BLACK);

  // Info box
  double orient = std::fmod(s.pose.heading_rad * kRadToDeg, 360.0);
  if (orient < 0.0) orient += 360.0;
  double dir_deg = 0.0, speed = 0.0;
  if (runner.mode() == DriveMode::Sweep) {
    dir_deg = runner.last_drive().angle_deg;
    speed = runner.last_drive().speed;
  } else {
    speed = std::hypot(s.velocity.vx, s.velocity.vy);
    dir_deg = std::atan2(s.velocity.vy, s.velocity.vx) * kRadToDeg;
  }
  const std::string wl = wheel_list(s);

  const int x = int(p.x0) + 12, y = int(p.y0) + 40, lh = 18;
  DrawRectangle(x - 6, y - 6, 300, lh * 5 + 12, Color{240, 255, 255, 160});
  DrawText(TextFormat("robot orient. = %.1f deg", orient),        x, y,          16, BLACK);
  DrawText(TextFormat("driving dir = %.1f deg", dir_deg),         x, y + lh,     16, BLACK);
  DrawText(TextFormat("driving speed (m/s) = %.1f", speed),       x, y + lh * 2, 16, BLACK);
  DrawText(TextFormat("omega (rad/s) = [%s]", wl.c_str()),        x, y + lh * 3, 16, BLACK);
  DrawText(TextFormat("pose = (%.2f, %.2f)  %s", s.pose.x, s.pose.y, run_state_name(s.state)),
           x, y + lh * 4, 16, DARKGRAY);
}

void ViewerApp::draw_hud_() const {
  DrawRectangle(0, 0, GetScreenWidth(), kHUD_H, Color{30, 34, 40, 255});
  if (runners_.empty()) return;
  const SimRunner& r0 = *runners_.front();
  DrawText(TextFormat("sim=%.2fs  tick=%llu  omega=%.2f rad/s  mode=%s  warp=%s  %s",
                      r0.sim_time(),
                      (unsigned long long)r0.tick_count(),
                      r0.omega(),
                      drive_mode_name(r0.mode()),
                      warpLabel(r0.time_scale),
                      run_state_name(r0.core().state().state())),
           16, 10, 20, Color{220, 235, 220, 255});
  DrawText("Space: Pause/Resume | Up/Down: omega | 1..5: 0.25x 0.5x 1x 2x 4x | W/S or +/-: Zoom | R: Reset",
           16, 38, 14, Color{190, 205, 190, 255});
}

} // namespace omnikin
