#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <string>

#include <omnikin/config.hpp>
#include <omnikin/sim_runner.hpp>

using Catch::Approx;
using namespace omnikin;

static const RobotPreset kKiwi{"kiwi", 3, 0.05, 0.02, 0.2, 90.0};

static RunnerOptions constant_opts(const BodyVelocity& v, double dt = 0.1) {
  RunnerOptions o{};
  o.base_dt = dt;
  o.mode = DriveMode::Constant;
  o.velocity = v;
  return o;
}

TEST_CASE("SimRunner integrates a constant command once per tick") {
  SimRunner sim(kKiwi, constant_opts({1.0, 0.0, 0.0}));
  RobotSnapshot s{};
  for (int i = 0; i < 10; ++i) s = sim.tick();

  REQUIRE(s.tick == 10);
  REQUIRE(s.sim_time == Approx(1.0));
  REQUIRE(s.pose.x == Approx(1.0));
  REQUIRE(s.pose.y == Approx(0.0).margin(1e-12));
  REQUIRE(s.wheel_count() == 3);
  // wheel 0 at 90 deg does not roll for pure vx
  REQUIRE(s.wheels[0].velocity == Approx(0.0).margin(1e-9));
  REQUIRE(sim.last_snapshot().tick == s.tick);
}

TEST_CASE("SimRunner applies a pause request on the next tick") {
  SimRunner sim(kKiwi, constant_opts({0.5, 0.5, 0.2}));
  sim.tick();
  sim.tick();
  const auto before = sim.last_snapshot();

  sim.request_pause_toggle();
  REQUIRE_FALSE(sim.core().state().paused()); // queued, not yet applied

  for (int i = 0; i < 5; ++i) sim.tick();
  const auto& paused = sim.last_snapshot();
  REQUIRE(paused.state == RunState::Paused);
  REQUIRE(paused.pose == before.pose);
  REQUIRE(paused.sim_time == before.sim_time);
  REQUIRE(paused.tick == before.tick + 5); // heartbeats keep counting

  sim.request_pause_toggle();
  sim.tick();
  REQUIRE(sim.last_snapshot().state == RunState::Running);
  REQUIRE(sim.last_snapshot().pose.x > before.pose.x);
}

TEST_CASE("SimRunner omega and velocity requests are accepted while paused") {
  SimRunner sim(kKiwi, constant_opts({0.0, 0.0, 0.0}));
  sim.request_pause_toggle();
  sim.tick();
  sim.request_omega(1.0);
  sim.tick();
  REQUIRE(sim.omega() == 1.0);
  REQUIRE(sim.core().state().paused());
  // L/r * omega = 0.2/0.05 * 1
  for (const auto& w : sim.last_snapshot().wheels) REQUIRE(w.velocity == Approx(4.0));

  sim.request_velocity({0.3, 0.0, 0.0});
  sim.tick();
  REQUIRE(sim.core().state().velocity() == BodyVelocity{0.3, 0.0, 0.0});
  REQUIRE(sim.last_snapshot().pose == RobotPose{});
}

TEST_CASE("SimRunner time scale stretches each tick") {
  SimRunner a(kKiwi, constant_opts({1.0, 0.0, 0.0}));
  SimRunner b(kKiwi, constant_opts({1.0, 0.0, 0.0}));
  b.time_scale = 2.0;
  a.tick();
  b.tick();
  REQUIRE(b.last_snapshot().pose.x == Approx(2.0 * a.last_snapshot().pose.x));

  SimRunner frozen(kKiwi, constant_opts({1.0, 0.0, 0.0}));
  frozen.time_scale = 0.0;
  frozen.tick();
  REQUIRE(frozen.last_snapshot().pose.x == 0.0);
  REQUIRE(frozen.last_snapshot().state == RunState::Running);
}

TEST_CASE("SimRunner sweep mode drives the reference animation program") {
  RunnerOptions o{};
  o.base_dt = 0.05;
  o.mode = DriveMode::Sweep;
  SimRunner sim(kKiwi, o);

  sim.tick();
  // frame 0: speed 0.5 at 0 deg; the Jacobian command is body +y,
  // the robot itself moves along world +x
  REQUIRE(sim.last_drive().speed == Approx(0.5));
  REQUIRE(sim.last_drive().angle_deg == Approx(0.0));
  REQUIRE(sim.last_snapshot().velocity.vy == Approx(0.5));
  REQUIRE(sim.last_snapshot().pose.x == Approx(0.5 * 0.05));
  REQUIRE(sim.last_snapshot().pose.y == Approx(0.0).margin(1e-12));

  for (int i = 0; i < 89; ++i) sim.tick();
  // frame 89 -> speed 0.5 * (1 + sin 89 deg)
  REQUIRE(sim.last_drive().angle_deg == Approx(89.0));
  REQUIRE(sim.last_drive().speed == Approx(0.5 * (1.0 + std::sin(89.0 * kDegToRad))));
}

TEST_CASE("SimRunner sweep moves the robot along the driving direction") {
  const auto tri = preset_by_key("tri");
  REQUIRE(tri.has_value());

  auto check_ticks = [](SimRunner& sim) {
    for (int i = 0; i < 10; ++i) {
      const auto before = sim.last_snapshot().pose;
      sim.tick();
      const auto after = sim.last_snapshot().pose;
      const double dir = std::atan2(after.y - before.y, after.x - before.x);
      REQUIRE(dir == Approx(sim.last_drive().angle_deg * kDegToRad).margin(1e-9));
    }
  };

  SECTION("no spin") {
    RunnerOptions o{};
    SimRunner sim(*tri, o);
    check_ticks(sim);
  }

  SECTION("spinning robot does not drift off the direction") {
    RunnerOptions o{};
    o.velocity = BodyVelocity{0.0, 0.0, 0.8};
    SimRunner sim(*tri, o);
    for (int i = 0; i < 20; ++i) sim.tick();
    REQUIRE(sim.last_snapshot().pose.heading_rad > 0.5);
    check_ticks(sim);
  }

  SECTION("body integration frame gives the same path") {
    RunnerOptions o{};
    o.frame = IntegrationFrame::Body;
    o.velocity = BodyVelocity{0.0, 0.0, 0.8};
    SimRunner sim(*tri, o);
    check_ticks(sim);
  }
}

TEST_CASE("SimRunner sweep keeps only omega from a velocity request") {
  RunnerOptions o{};
  SimRunner sim(kKiwi, o);
  sim.request_velocity({3.0, -3.0, 0.4});
  sim.tick();
  REQUIRE(sim.omega() == 0.4);
  REQUIRE(sim.last_drive().speed == Approx(0.5));
  REQUIRE(sim.last_snapshot().velocity.vx == Approx(0.0).margin(1e-12));
  REQUIRE(sim.last_snapshot().velocity.vy == Approx(0.5));
}

TEST_CASE("two runners are independent") {
  const auto tri = preset_by_key("tri");
  const auto quad = preset_by_key("quad");
  REQUIRE(tri.has_value());
  REQUIRE(quad.has_value());

  SimRunner left(*tri, constant_opts({0.2, 0.0, 0.1}));
  SimRunner right(*quad, constant_opts({0.2, 0.0, 0.1}));
  REQUIRE(left.label().find("3 Wheels") != std::string::npos);
  REQUIRE(right.label().find("4 Wheels") != std::string::npos);

  left.request_pause_toggle();
  for (int i = 0; i < 3; ++i) { left.tick(); right.tick(); }

  REQUIRE(left.last_snapshot().pose == RobotPose{});
  REQUIRE(right.last_snapshot().pose.x == Approx(0.06));
  REQUIRE(left.last_snapshot().wheel_count() == 3);
  REQUIRE(right.last_snapshot().wheel_count() == 4);
}

TEST_CASE("SimRunner reset restores the initial command and origin") {
  SimRunner sim(kKiwi, constant_opts({1.0, 0.0, 0.5}));
  sim.request_omega(2.0);
  for (int i = 0; i < 4; ++i) sim.tick();
  sim.reset();

  REQUIRE(sim.tick_count() == 0);
  REQUIRE(sim.sim_time() == 0.0);
  REQUIRE(sim.last_snapshot().pose == RobotPose{});
  REQUIRE(sim.omega() == 0.5);
}

TEST_CASE("runner_options mirrors the application config") {
  AppConfig cfg{};
  cfg.dt = 0.02;
  cfg.mode = DriveMode::Constant;
  cfg.frame = IntegrationFrame::Body;
  cfg.vx = 0.1; cfg.vy = -0.2; cfg.omega = 0.3;
  const auto o = runner_options(cfg);
  REQUIRE(o.base_dt == 0.02);
  REQUIRE(o.mode == DriveMode::Constant);
  REQUIRE(o.frame == IntegrationFrame::Body);
  REQUIRE(o.velocity == BodyVelocity{0.1, -0.2, 0.3});
}

TEST_CASE("SimRunner snapshot state reflects only applied pause toggles") {
  SimRunner sim(kKiwi, constant_opts({0.1, 0.0, 0.0}));
  const RunState start = sim.last_snapshot().state;

  sim.request_pause_toggle();
  sim.request_pause_toggle();
  sim.tick();
  REQUIRE(sim.last_snapshot().state == start);

  sim.request_pause_toggle();
  const RunState before = sim.last_snapshot().state;
  sim.tick();
  REQUIRE(before == RunState::Running);
  REQUIRE(sim.last_snapshot().state == RunState::Paused);
}
