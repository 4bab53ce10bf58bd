#include <omnikin/sampler.hpp>
#include <omnikin/kinematics.hpp>

namespace omnikin {

RobotSnapshot FrameSampler::sample(const SimulationState& state,
                                   std::uint64_t tick,
                                   double sim_time) const {
  RobotSnapshot s{};
  s.sim_time = sim_time;
  s.tick = tick;
  s.state = state.state();
  s.pose = state.current_pose();
  s.velocity = state.velocity();

  // Recomputed each tick; the command may have changed since the last one.
  const WheelVelocities omega = solve(jacobian_, s.velocity);
  const auto offsets = geometry_.wheel_positions();
  const auto& angles = geometry_.wheel_angles();

  s.wheels.reserve(offsets.size());
  for (std::size_t i = 0; i < offsets.size(); ++i) {
    const Vec2 r = rotate(offsets[i], s.pose.heading_rad);
    WheelSample w{};
    w.position = { s.pose.x + r.x, s.pose.y + r.y };
    w.mount_angle_rad = angles[i] + s.pose.heading_rad;
    w.velocity = omega(static_cast<Eigen::Index>(i));
    s.wheels.push_back(w);
  }
  return s;
}

} // namespace omnikin
