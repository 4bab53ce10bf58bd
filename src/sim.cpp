#include <omnikin/sim.hpp>
#include <cmath>

namespace omnikin {

bool SimulationState::can_step_(double dt_sec) const {
  if (paused()) return false;
  return std::isfinite(dt_sec) && dt_sec > 0.0;
}

void SimulationState::integrate_(double vx_world, double vy_world, double omega, double dt_sec) {
  pose_.x += vx_world * dt_sec;
  pose_.y += vy_world * dt_sec;
  pose_.heading_rad += omega * dt_sec;
}

void SimulationState::advance(double dt_sec) {
  if (!can_step_(dt_sec)) return;

  double vx = velocity_.vx;
  double vy = velocity_.vy;
  if (frame_ == IntegrationFrame::Body) {
    const double c = std::cos(pose_.heading_rad), s = std::sin(pose_.heading_rad);
    vx = velocity_.vx * c - velocity_.vy * s;
    vy = velocity_.vx * s + velocity_.vy * c;
  }
  integrate_(vx, vy, velocity_.omega, dt_sec);
}

void SimulationState::advance(const BodyVelocity& v, double dt_sec) {
  velocity_ = v;
  advance(dt_sec);
}

void SimulationState::advance_world(const BodyVelocity& world_v, double dt_sec) {
  if (!can_step_(dt_sec)) return;
  integrate_(world_v.vx, world_v.vy, world_v.omega, dt_sec);
}

const char* run_state_name(RunState s) {
  switch (s) {
    case RunState::Running: return "Running";
    case RunState::Paused:  return "Paused";
    default: return "Unknown";
  }
}

const char* frame_name(IntegrationFrame f) {
  switch (f) {
    case IntegrationFrame::World: return "world";
    case IntegrationFrame::Body:  return "body";
    default: return "unknown";
  }
}

} // namespace omnikin
