#include <omnikin/geometry.hpp>
#include <omnikin/errors.hpp>
#include <string>
#include <utility>

namespace omnikin {

static bool positive_finite(double v) {
  return std::isfinite(v) && v > 0.0;
}

GeometryModel::GeometryModel(double wheel_radius,
                             double center_distance,
                             std::vector<double> wheel_angles_rad,
                             double wheel_width)
  : wheel_radius_(wheel_radius),
    center_distance_(center_distance),
    wheel_width_(wheel_width),
    angles_(std::move(wheel_angles_rad)) {
  const std::size_t n = angles_.size();
  if (n < kMinWheels || n > kMaxWheels) {
    throw InvalidConfiguration("unsupported wheel count " + std::to_string(n) +
                               " (expected 3 or 4)");
  }
  if (!positive_finite(wheel_radius_)) {
    throw InvalidConfiguration("wheel radius must be > 0, got " + std::to_string(wheel_radius_));
  }
  if (!positive_finite(center_distance_)) {
    throw InvalidConfiguration("center distance must be > 0, got " + std::to_string(center_distance_));
  }
  if (!std::isfinite(wheel_width_) || wheel_width_ < 0.0) {
    throw InvalidConfiguration("wheel width must be >= 0, got " + std::to_string(wheel_width_));
  }
  for (double a : angles_) {
    if (!std::isfinite(a)) throw InvalidConfiguration("wheel angle is not finite");
  }
}

GeometryModel GeometryModel::evenly_spaced(std::size_t wheel_count,
                                           double wheel_radius,
                                           double center_distance,
                                           double phase_rad,
                                           double wheel_width) {
  if (wheel_count < kMinWheels || wheel_count > kMaxWheels) {
    throw InvalidConfiguration("unsupported wheel count " + std::to_string(wheel_count) +
                               " (expected 3 or 4)");
  }
  std::vector<double> angles;
  angles.reserve(wheel_count);
  const double step = kTAU / double(wheel_count);
  for (std::size_t i = 0; i < wheel_count; ++i) {
    angles.push_back(phase_rad + step * double(i));
  }
  return GeometryModel(wheel_radius, center_distance, std::move(angles), wheel_width);
}

double GeometryModel::default_phase_rad(std::size_t wheel_count) {
  return (wheel_count == 4 ? 45.0 : 60.0) * kDegToRad;
}

std::vector<Vec2> GeometryModel::wheel_positions() const {
  std::vector<Vec2> out;
  out.reserve(angles_.size());
  for (double a : angles_) {
    out.push_back({ center_distance_ * std::cos(a), center_distance_ * std::sin(a) });
  }
  return out;
}

} // namespace omnikin
