#pragma once
#include <cstdint>
#include <omnikin/kinematics.hpp>

namespace omnikin {

enum class DriveMode : int {
  Constant = 0, // keep the configured body velocity
  Sweep = 1     // replace the command every tick from SweepProgram
};

// Speed / driving direction / orientation form of a command.
//  body:   input to the Jacobian (wheel speeds), in its rotated row convention.
//  motion: where the robot actually goes, world frame, speed along angle_deg.
struct DriveCommand {
  double speed = 0.0;            // m/s
  double angle_deg = 0.0;        // driving direction, world frame
  double orientation_deg = 0.0;  // robot orientation
  BodyVelocity body{};
  BodyVelocity motion{};
};

// Driving direction relative to orientation, then rotated 90 deg so that
// "forward" is the body +y axis: vx = -speed*sin(a-o), vy = speed*cos(a-o).
BodyVelocity body_velocity_from_drive(double speed,
                                      double angle_deg,
                                      double orientation_deg,
                                      double omega);

// World-frame translation for a drive command: speed along angle_deg.
// Independent of orientation, since (a - o) + o = a.
BodyVelocity world_motion_from_drive(double speed, double angle_deg, double omega);

// Demo program: speed oscillates in [0, 1] m/s and the driving direction
// sweeps one degree per frame. orientation_deg is the robot's current
// orientation, normalized into [0, 360).
struct SweepProgram {
  DriveCommand command(std::uint64_t frame, double omega, double orientation_deg) const;
};

const char* drive_mode_name(DriveMode m);

} // namespace omnikin
