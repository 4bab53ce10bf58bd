#pragma once
#include <cstdint>
#include <omnikin/geometry.hpp>
#include <omnikin/jacobian.hpp>
#include <omnikin/sim.hpp>
#include <omnikin/snap.hpp>

namespace omnikin {

// Per-tick bridge between the core and the renderer.
// Holds read-only references; geometry and jacobian must outlive the sampler.
class FrameSampler {
public:
  FrameSampler(const GeometryModel& geometry, const JacobianMatrix& jacobian)
    : geometry_(geometry), jacobian_(jacobian) {}

  RobotSnapshot sample(const SimulationState& state,
                       std::uint64_t tick = 0,
                       double sim_time = 0.0) const;

private:
  const GeometryModel& geometry_;
  const JacobianMatrix& jacobian_;
};

} // namespace omnikin
