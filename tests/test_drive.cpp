#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <omnikin/drive.hpp>

using Catch::Approx;
using namespace omnikin;

TEST_CASE("body_velocity_from_drive rotates the drive direction by 90 deg") {
  SECTION("driving along the orientation is +y in the body") {
    const auto v = body_velocity_from_drive(1.0, 0.0, 0.0, 0.0);
    REQUIRE(v.vx == Approx(0.0).margin(1e-12));
    REQUIRE(v.vy == Approx(1.0));
  }

  SECTION("driving 90 deg left of the orientation is -x in the body") {
    const auto v = body_velocity_from_drive(2.0, 90.0, 0.0, 0.0);
    REQUIRE(v.vx == Approx(-2.0));
    REQUIRE(v.vy == Approx(0.0).margin(1e-12));
  }

  SECTION("only the relative angle matters") {
    const auto a = body_velocity_from_drive(0.8, 130.0, 40.0, 0.0);
    const auto b = body_velocity_from_drive(0.8, 90.0, 0.0, 0.0);
    REQUIRE(a.vx == Approx(b.vx));
    REQUIRE(a.vy == Approx(b.vy).margin(1e-12));
  }

  SECTION("omega passes through unchanged") {
    REQUIRE(body_velocity_from_drive(1.0, 33.0, 12.0, -0.75).omega == -0.75);
  }
}

TEST_CASE("SweepProgram oscillates speed and sweeps direction") {
  SweepProgram sweep;

  SECTION("frame 0") {
    const auto c = sweep.command(0, 0.0, 0.0);
    REQUIRE(c.speed == Approx(0.5));
    REQUIRE(c.angle_deg == Approx(0.0));
    REQUIRE(c.body.vy == Approx(0.5));
  }

  SECTION("frame 90 is full speed") {
    const auto c = sweep.command(90, 0.0, 0.0);
    REQUIRE(c.speed == Approx(1.0));
    REQUIRE(c.angle_deg == Approx(90.0));
  }

  SECTION("frame 270 stops") {
    const auto c = sweep.command(270, 0.0, 0.0);
    REQUIRE(c.speed == Approx(0.0).margin(1e-12));
  }

  SECTION("direction wraps after a full turn") {
    const auto c = sweep.command(450, 0.0, 0.0);
    REQUIRE(c.angle_deg == Approx(90.0));
    REQUIRE(c.speed == Approx(1.0));
  }

  SECTION("orientation is normalized into [0, 360)") {
    REQUIRE(sweep.command(0, 0.0, -30.0).orientation_deg == Approx(330.0));
    REQUIRE(sweep.command(0, 0.0, 725.0).orientation_deg == Approx(5.0));
  }

  SECTION("motion points along the driving direction") {
    const auto c = sweep.command(90, 0.3, 40.0);
    REQUIRE(c.motion.vx == Approx(0.0).margin(1e-12));
    REQUIRE(c.motion.vy == Approx(1.0));
    REQUIRE(c.motion.omega == 0.3);
  }

  SECTION("omega is carried into the body command") {
    REQUIRE(sweep.command(12, 1.25, 0.0).body.omega == 1.25);
  }
}
