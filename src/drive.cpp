#include <omnikin/drive.hpp>
#include <omnikin/geometry.hpp>
#include <cmath>

namespace omnikin {

BodyVelocity body_velocity_from_drive(double speed,
                                      double angle_deg,
                                      double orientation_deg,
                                      double omega) {
  const double rel = (angle_deg - orientation_deg) * kDegToRad;
  const double forward = speed * std::cos(rel);
  const double lateral = speed * std::sin(rel);
  return BodyVelocity{ -lateral, forward, omega };
}

BodyVelocity world_motion_from_drive(double speed, double angle_deg, double omega) {
  const double a = angle_deg * kDegToRad;
  return BodyVelocity{ speed * std::cos(a), speed * std::sin(a), omega };
}

DriveCommand SweepProgram::command(std::uint64_t frame, double omega, double orientation_deg) const {
  const double f = static_cast<double>(frame);
  DriveCommand c{};
  c.speed = 0.5 * (1.0 + std::sin(f * kDegToRad));
  c.angle_deg = std::fmod(f, 360.0);
  double orient = std::fmod(orientation_deg, 360.0);
  if (orient < 0.0) orient += 360.0;
  c.orientation_deg = orient;
  c.body = body_velocity_from_drive(c.speed, c.angle_deg, c.orientation_deg, omega);
  c.motion = world_motion_from_drive(c.speed, c.angle_deg, omega);
  return c;
}

const char* drive_mode_name(DriveMode m) {
  switch (m) {
    case DriveMode::Constant: return "constant";
    case DriveMode::Sweep:    return "sweep";
    default: return "unknown";
  }
}

} // namespace omnikin
