#pragma once
#include <Eigen/Dense>
#include <omnikin/geometry.hpp>

namespace omnikin {

// One row per wheel, columns map (vx, vy, omega) to wheel angular speed (rad/s).
using JacobianMatrix = Eigen::Matrix<double, Eigen::Dynamic, 3>;

// Row i = [cos(theta_i)/r, sin(theta_i)/r, L/r]: body velocity projected on
// the wheel's rolling direction plus the tangential term from omega, over r.
// Pure function of the geometry.
JacobianMatrix build_jacobian(const GeometryModel& geometry);

} // namespace omnikin
