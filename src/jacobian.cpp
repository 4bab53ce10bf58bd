#include <omnikin/jacobian.hpp>
#include <cmath>

namespace omnikin {

JacobianMatrix build_jacobian(const GeometryModel& geometry) {
  const auto& angles = geometry.wheel_angles();
  const double r = geometry.wheel_radius();
  const double L = geometry.center_distance();

  JacobianMatrix j(static_cast<Eigen::Index>(angles.size()), 3);
  for (std::size_t i = 0; i < angles.size(); ++i) {
    const auto row = static_cast<Eigen::Index>(i);
    j(row, 0) = std::cos(angles[i]) / r;  // vx
    j(row, 1) = std::sin(angles[i]) / r;  // vy
    j(row, 2) = L / r;                    // omega
  }
  return j;
}

} // namespace omnikin
