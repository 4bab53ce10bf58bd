#include <omnikin/sim_runner.hpp>
#include <algorithm>
#include <utility>

namespace omnikin {

RobotCore::RobotCore(GeometryModel geometry, const BodyVelocity& v, IntegrationFrame frame)
  : geometry_(std::move(geometry)),
    jacobian_(build_jacobian(geometry_)),
    state_(v, frame),
    sampler_(geometry_, jacobian_) {}

RunnerOptions runner_options(const AppConfig& cfg) {
  RunnerOptions o{};
  o.base_dt = cfg.dt;
  o.mode = cfg.mode;
  o.frame = cfg.frame;
  o.velocity = BodyVelocity{cfg.vx, cfg.vy, cfg.omega};
  return o;
}

static std::string make_label_(const RobotPreset& p) {
  return "Jacobian Omnidirectional - " + std::to_string(p.wheel_count) + " Wheels";
}

SimRunner::SimRunner(const RobotPreset& preset, const RunnerOptions& opts)
  : label_(make_label_(preset)),
    opts_(opts),
    core_(make_geometry(preset), opts.velocity, opts.frame) {
  last_ = core_.sample(tick_, sim_time_);
}

void SimRunner::apply_pending_() {
  auto& st = core_.state();
  if (pending_toggle_) {
    pending_toggle_ = false;
    st.toggle();
  }
  if (pending_velocity_) {
    // Sweep owns translation; only the spin rate carries over.
    if (opts_.mode == DriveMode::Sweep) st.set_omega(pending_velocity_->omega);
    else st.set_velocity(*pending_velocity_);
    pending_velocity_.reset();
  }
  if (pending_omega_) {
    st.set_omega(*pending_omega_);
    pending_omega_.reset();
  }
}

RobotSnapshot SimRunner::tick() {
  apply_pending_();

  auto& st = core_.state();
  if (!st.paused()) {
    const double dt_eff = opts_.base_dt * std::max(0.0, time_scale);
    if (opts_.mode == DriveMode::Sweep) {
      const double orient_deg = st.current_pose().heading_rad * kRadToDeg;
      last_drive_ = sweep_.command(frame_, st.velocity().omega, orient_deg);
      // Wheels see the Jacobian-convention command; the pose follows the
      // driving direction in world terms.
      st.set_velocity(last_drive_.body);
      if (dt_eff > 0.0) st.advance_world(last_drive_.motion, dt_eff);
      ++frame_;
    } else if (dt_eff > 0.0) {
      st.advance(dt_eff);
    }
    if (dt_eff > 0.0) sim_time_ += dt_eff;
  }
  ++tick_; // heartbeat even when paused

  last_ = core_.sample(tick_, sim_time_);
  return last_;
}

void SimRunner::reset() {
  auto& st = core_.state();
  st.reset();
  st.set_velocity(opts_.velocity);
  sim_time_ = 0.0;
  tick_ = 0;
  frame_ = 0;
  last_drive_ = DriveCommand{};
  pending_toggle_ = false;
  pending_omega_.reset();
  pending_velocity_.reset();
  last_ = core_.sample(tick_, sim_time_);
}

} // namespace omnikin
