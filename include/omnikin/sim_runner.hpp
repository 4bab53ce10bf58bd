#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <omnikin/config.hpp>
#include <omnikin/drive.hpp>
#include <omnikin/geometry.hpp>
#include <omnikin/jacobian.hpp>
#include <omnikin/sampler.hpp>
#include <omnikin/sim.hpp>
#include <omnikin/snap.hpp>

namespace omnikin {

// One complete, independent kinematic core: geometry, its Jacobian, the
// mutable state and a sampler bound to the first two.
class RobotCore {
public:
  RobotCore(GeometryModel geometry, const BodyVelocity& v, IntegrationFrame frame);
  RobotCore(const RobotCore&) = delete;
  RobotCore& operator=(const RobotCore&) = delete;

  const GeometryModel& geometry() const { return geometry_; }
  const JacobianMatrix& jacobian() const { return jacobian_; }
  SimulationState& state() { return state_; }
  const SimulationState& state() const { return state_; }

  RobotSnapshot sample(std::uint64_t tick, double sim_time) const {
    return sampler_.sample(state_, tick, sim_time);
  }

private:
  // Declaration order matters: sampler_ binds to geometry_ and jacobian_.
  const GeometryModel geometry_;
  const JacobianMatrix jacobian_;
  SimulationState state_;
  FrameSampler sampler_;
};

struct RunnerOptions {
  double base_dt = 0.05;          // seconds per tick at time_scale 1
  DriveMode mode = DriveMode::Sweep;
  IntegrationFrame frame = IntegrationFrame::World;
  BodyVelocity velocity{};        // initial command (omega also feeds the sweep)
};

RunnerOptions runner_options(const AppConfig& cfg);

// Drives one RobotCore at a fixed cadence. The caller (viewer loop) calls
// tick() once per frame; control requests are queued and applied at the
// start of the next tick.
class SimRunner {
public:
  SimRunner(const RobotPreset& preset, const RunnerOptions& opts);
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  RobotSnapshot tick();
  void reset();

  // Control surface
  void request_pause_toggle() { pending_toggle_ = !pending_toggle_; }
  void request_omega(double omega) { pending_omega_ = omega; }
  // In Sweep mode the program replaces (vx, vy) every tick, so only
  // v.omega takes effect.
  void request_velocity(const BodyVelocity& v) { pending_velocity_ = v; }
  double time_scale = 1.0; // 0.0 = frozen, state stays Running

  const RobotCore& core() const { return core_; }
  const RobotSnapshot& last_snapshot() const { return last_; }
  const DriveCommand& last_drive() const { return last_drive_; }
  const std::string& label() const { return label_; }
  DriveMode mode() const { return opts_.mode; }
  double omega() const { return core_.state().velocity().omega; }
  double sim_time() const { return sim_time_; }
  std::uint64_t tick_count() const { return tick_; }

private:
  void apply_pending_();

  std::string label_;
  RunnerOptions opts_;
  RobotCore core_;
  SweepProgram sweep_{};

  double sim_time_{0.0};
  std::uint64_t tick_{0};
  std::uint64_t frame_{0};   // sweep frame, advances only while running
  DriveCommand last_drive_{};
  RobotSnapshot last_{};

  bool pending_toggle_{false};
  std::optional<double> pending_omega_{};
  std::optional<BodyVelocity> pending_velocity_{};
};

} // namespace omnikin
