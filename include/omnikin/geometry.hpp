#pragma once
#include <cmath>
#include <cstddef>
#include <numbers>
#include <vector>

namespace omnikin {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;
inline constexpr double kDegToRad = kPI / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPI;

struct Vec2 {
  double x{};
  double y{};
};

// Rotate v counter-clockwise by angle_rad.
inline Vec2 rotate(const Vec2& v, double angle_rad) {
  const double c = std::cos(angle_rad), s = std::sin(angle_rad);
  return Vec2{ v.x * c - v.y * s, v.x * s + v.y * c };
}

// Physical constants of an omni-wheel platform (meters, radians).
// Immutable once built; every constructor validates and throws
// InvalidConfiguration instead of leaving a half-built model.
class GeometryModel {
public:
  static constexpr std::size_t kMinWheels = 3;
  static constexpr std::size_t kMaxWheels = 4;

  GeometryModel(double wheel_radius,
                double center_distance,
                std::vector<double> wheel_angles_rad,
                double wheel_width = 0.0);

  // Wheels at phase + i * 360/n degrees (120 deg for 3, 90 deg for 4).
  static GeometryModel evenly_spaced(std::size_t wheel_count,
                                     double wheel_radius,
                                     double center_distance,
                                     double phase_rad,
                                     double wheel_width = 0.0);

  // Mount phase used by the reference robot: 60 deg (3 wheels), 45 deg (4 wheels).
  static double default_phase_rad(std::size_t wheel_count);

  double wheel_radius() const { return wheel_radius_; }
  double center_distance() const { return center_distance_; }
  double wheel_width() const { return wheel_width_; }
  std::size_t wheel_count() const { return angles_.size(); }
  const std::vector<double>& wheel_angles() const { return angles_; }

  // Offset of each wheel from the robot center, body frame.
  std::vector<Vec2> wheel_positions() const;

private:
  double wheel_radius_;
  double center_distance_;
  double wheel_width_;
  std::vector<double> angles_;
};

} // namespace omnikin
