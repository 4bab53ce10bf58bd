#include <omnikin/kinematics.hpp>
#include <omnikin/errors.hpp>
#include <string>

namespace omnikin {

WheelVelocities solve(const JacobianMatrix& j, const Eigen::VectorXd& v) {
  if (j.cols() != 3 || v.size() != j.cols()) {
    throw DimensionError("jacobian is " + std::to_string(j.rows()) + "x" +
                         std::to_string(j.cols()) + " but velocity has " +
                         std::to_string(v.size()) + " components");
  }
  return j * v;
}

WheelVelocities solve(const JacobianMatrix& j, const BodyVelocity& v) {
  const Eigen::VectorXd body = v.as_vector();
  return solve(j, body);
}

WheelVelocities wheel_velocities(const GeometryModel& geometry, const BodyVelocity& v) {
  return solve(build_jacobian(geometry), v);
}

} // namespace omnikin
