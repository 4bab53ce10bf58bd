#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <vector>

#include <omnikin/geometry.hpp>
#include <omnikin/errors.hpp>

using Catch::Approx;
using namespace omnikin;

static double wrap_tau(double a) {
  a = std::fmod(a, kTAU);
  if (a < 0.0) a += kTAU;
  return a;
}

TEST_CASE("wheel positions are equidistant and evenly spaced") {
  const std::vector<double> phases = {0.0, 0.3, -1.2, kPI / 2.0};
  for (std::size_t n : {std::size_t{3}, std::size_t{4}}) {
    for (double phase : phases) {
      const auto g = GeometryModel::evenly_spaced(n, 0.148, 0.195, phase);
      const auto pts = g.wheel_positions();
      REQUIRE(pts.size() == n);

      for (const auto& p : pts) {
        REQUIRE(std::hypot(p.x, p.y) == Approx(0.195).margin(1e-12));
      }
      const double step = kTAU / double(n);
      for (std::size_t i = 0; i < n; ++i) {
        const auto& a = pts[i];
        const auto& b = pts[(i + 1) % n];
        const double d = wrap_tau(std::atan2(b.y, b.x) - std::atan2(a.y, a.x));
        REQUIRE(d == Approx(step).margin(1e-9));
      }
    }
  }
}

TEST_CASE("default mount phases match the reference robot") {
  SECTION("3 wheels at 60, 180, 300 deg") {
    const auto g = GeometryModel::evenly_spaced(3, 0.148, 0.195, GeometryModel::default_phase_rad(3));
    REQUIRE(g.wheel_angles()[0] * kRadToDeg == Approx(60.0));
    REQUIRE(g.wheel_angles()[1] * kRadToDeg == Approx(180.0));
    REQUIRE(g.wheel_angles()[2] * kRadToDeg == Approx(300.0));
  }

  SECTION("4 wheels at 45, 135, 225, 315 deg") {
    const auto g = GeometryModel::evenly_spaced(4, 0.148, 0.195, GeometryModel::default_phase_rad(4));
    REQUIRE(g.wheel_count() == 4);
    REQUIRE(g.wheel_angles()[0] * kRadToDeg == Approx(45.0));
    REQUIRE(g.wheel_angles()[3] * kRadToDeg == Approx(315.0));
  }
}

TEST_CASE("explicit angles keep their order") {
  const GeometryModel g(0.05, 0.2, {kPI / 2.0, 7.0 * kPI / 6.0, 11.0 * kPI / 6.0}, 0.02);
  REQUIRE(g.wheel_count() == 3);
  REQUIRE(g.wheel_radius() == 0.05);
  REQUIRE(g.center_distance() == 0.2);
  REQUIRE(g.wheel_width() == 0.02);

  const auto pts = g.wheel_positions();
  REQUIRE(pts[0].x == Approx(0.0).margin(1e-12));
  REQUIRE(pts[0].y == Approx(0.2));
  REQUIRE(pts[1].x == Approx(-0.2 * std::sqrt(3.0) / 2.0));
  REQUIRE(pts[1].y == Approx(-0.1));
}

TEST_CASE("invalid geometry is rejected") {
  const double nan = std::numeric_limits<double>::quiet_NaN();

  SECTION("unsupported wheel counts") {
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(2, 0.1, 0.2, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(5, 0.1, 0.2, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel(0.1, 0.2, {}), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel(0.1, 0.2, {0.0, 1.0, 2.0, 3.0, 4.0}), InvalidConfiguration);
  }

  SECTION("non-positive constants") {
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(3, 0.0, 0.2, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(3, -0.1, 0.2, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(4, 0.1, 0.0, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(4, 0.1, -3.0, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(3, 0.1, 0.2, 0.0, -0.01), InvalidConfiguration);
  }

  SECTION("non-finite values") {
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(3, nan, 0.2, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel::evenly_spaced(3, 0.1, nan, 0.0), InvalidConfiguration);
    REQUIRE_THROWS_AS(GeometryModel(0.1, 0.2, {0.0, nan, 2.0}), InvalidConfiguration);
  }
}

TEST_CASE("rotate turns vectors counter-clockwise") {
  const Vec2 v = rotate(Vec2{1.0, 0.0}, kPI / 2.0);
  REQUIRE(v.x == Approx(0.0).margin(1e-12));
  REQUIRE(v.y == Approx(1.0));
}
