#pragma once
#include <omnikin/kinematics.hpp>

namespace omnikin {

struct RobotPose {
  double x = 0.0;            // world X (m)
  double y = 0.0;            // world Y (m)
  double heading_rad = 0.0;  // accumulated heading (rad), not wrapped
  bool operator==(const RobotPose&) const = default;
};

enum class RunState : int {
  Running = 0,
  Paused = 1
};

// How body velocity is applied to the world-frame position.
//  World: velocity is taken as already world-frame (heading unused for translation).
//  Body:  (vx, vy) is rotated by the current heading before integrating.
enum class IntegrationFrame : int {
  World = 0,
  Body = 1
};

// Mutable state of one robot: pose, commanded velocity and run state.
// Starts Running at the origin with a zero command.
class SimulationState {
public:
  SimulationState() = default;
  explicit SimulationState(IntegrationFrame frame) : frame_(frame) {}
  SimulationState(const BodyVelocity& v, IntegrationFrame frame)
    : velocity_(v), frame_(frame) {}

  // Forward Euler over dt using the stored command. No-op when paused
  // or when dt is not a positive finite number.
  void advance(double dt_sec);
  // Same, with v recorded as the new command first.
  void advance(const BodyVelocity& v, double dt_sec);
  // Moves the pose by a world-frame velocity without touching the stored
  // command; the integration frame is ignored. Same pause and dt rules.
  void advance_world(const BodyVelocity& world_v, double dt_sec);

  RobotPose current_pose() const { return pose_; }
  BodyVelocity velocity() const { return velocity_; }
  void set_velocity(const BodyVelocity& v) { velocity_ = v; }
  void set_omega(double omega) { velocity_.omega = omega; }

  // Running <-> Paused. Velocity updates are accepted in both states.
  void pause() { state_ = RunState::Paused; }
  void resume() { state_ = RunState::Running; }
  void toggle() { state_ = paused() ? RunState::Running : RunState::Paused; }
  RunState state() const { return state_; }
  bool paused() const { return state_ == RunState::Paused; }

  IntegrationFrame frame() const { return frame_; }

  // Back to the origin; keeps command and run state.
  void reset() { pose_ = RobotPose{}; }

private:
  bool can_step_(double dt_sec) const;
  void integrate_(double vx_world, double vy_world, double omega, double dt_sec);

  RobotPose pose_{};
  BodyVelocity velocity_{};
  RunState state_{RunState::Running};
  IntegrationFrame frame_{IntegrationFrame::World};
};

const char* run_state_name(RunState s);
const char* frame_name(IntegrationFrame f);

} // namespace omnikin
