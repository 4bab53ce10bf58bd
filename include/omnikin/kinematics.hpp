#pragma once
#include <Eigen/Dense>
#include <omnikin/geometry.hpp>
#include <omnikin/jacobian.hpp>

namespace omnikin {

// Commanded body-frame velocity (m/s, m/s, rad/s).
struct BodyVelocity {
  double vx = 0.0;
  double vy = 0.0;
  double omega = 0.0;

  Eigen::Vector3d as_vector() const { return Eigen::Vector3d{vx, vy, omega}; }
  bool operator==(const BodyVelocity&) const = default;
};

// Wheel angular speeds (rad/s), same order as GeometryModel::wheel_angles().
using WheelVelocities = Eigen::VectorXd;

// Forward kinematics: Omega = J * [vx, vy, omega]^T.
// Throws DimensionError if J does not have 3 columns.
WheelVelocities solve(const JacobianMatrix& j, const BodyVelocity& v);

// Generic form; throws DimensionError if v.size() != j.cols().
WheelVelocities solve(const JacobianMatrix& j, const Eigen::VectorXd& v);

// Convenience: build the Jacobian for geometry and solve in one call.
WheelVelocities wheel_velocities(const GeometryModel& geometry, const BodyVelocity& v);

} // namespace omnikin
