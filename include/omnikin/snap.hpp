#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include <omnikin/geometry.hpp>
#include <omnikin/sim.hpp>

namespace omnikin {

struct WheelSample {
  Vec2 position{};          // world frame (m)
  double mount_angle_rad{}; // wheel mount angle + body heading
  double velocity{};        // angular speed (rad/s)
};

// Single immutable sample of one robot for the renderer.
struct RobotSnapshot {
  double sim_time{};
  std::uint64_t tick{};
  RunState state{RunState::Running};

  RobotPose pose{};
  BodyVelocity velocity{};

  std::vector<WheelSample> wheels{};

  std::size_t wheel_count() const { return wheels.size(); }
};

} // namespace omnikin
