#include "motion_solver.hpp"

#include <Eigen/Core>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>

#include "scene.hpp"
#include "scene_test_helper.hpp"

namespace glide {

using Catch::Matchers::WithinAbs;

namespace {

// Center height of a default capsule resting skin_width above y = 0.
constexpr float REST_Y = 0.92f;

CapsuleMotionSolver make_solver(const CapsuleConfig& config = {}) {
  auto solver = CapsuleMotionSolver::try_make(config);
  REQUIRE(solver);
  return *solver;
}

MoveRequest make_request(const Eigen::Vector3f& position,
                         const Eigen::Vector3f& velocity, float dt) {
  MoveRequest r;
  r.position = position;
  r.desired_velocity = velocity;
  r.dt = dt;
  return r;
}

}  // namespace

TEST_CASE("solver rejects invalid config", "[solver]") {
  CapsuleConfig config;
  config.radius = 1.0f;
  CHECK_FALSE(CapsuleMotionSolver::try_make(config));
}

TEST_CASE("rest is idempotent", "[solver]") {
  Scene scene;
  add_test_floor(scene);
  auto solver = make_solver();

  Eigen::Vector3f start{0.0f, REST_Y, 0.0f};
  CollisionResult r1;
  REQUIRE(solver.resolve(scene, make_request(start, Eigen::Vector3f::Zero(),
                                             1.0f / 60.0f),
                         r1));
  CHECK(r1.position == start);
  CHECK(r1.grounded);
  CHECK_FALSE(r1.hit_wall);

  CollisionResult r2;
  REQUIRE(solver.resolve(
      scene, make_request(r1.position, Eigen::Vector3f::Zero(), 1.0f / 60.0f),
      r2));
  CHECK(r2.position == r1.position);
  CHECK(r2.grounded == r1.grounded);
}

TEST_CASE("free flight applies the full displacement", "[solver]") {
  Scene scene;
  auto solver = make_solver();

  Eigen::Vector3f start{0.0f, 5.0f, 0.0f};
  Eigen::Vector3f velocity{1.0f, 2.0f, -3.0f};
  CollisionResult r;
  REQUIRE(solver.resolve(scene, make_request(start, velocity, 0.5f), r));

  CHECK_THAT(r.position(0), WithinAbs(0.5f, 1e-4f));
  CHECK_THAT(r.position(1), WithinAbs(6.0f, 1e-4f));
  CHECK_THAT(r.position(2), WithinAbs(-1.5f, 1e-4f));
  CHECK_THAT(r.velocity(0), WithinAbs(1.0f, 1e-3f));
  CHECK_THAT(r.velocity(1), WithinAbs(2.0f, 1e-3f));
  CHECK_THAT(r.velocity(2), WithinAbs(-3.0f, 1e-3f));
  CHECK_FALSE(r.grounded);
  CHECK_FALSE(r.hit_wall);
  CHECK_FALSE(r.can_step);
}

TEST_CASE("walking on flat ground", "[solver]") {
  Scene scene;
  add_test_floor(scene);
  auto solver = make_solver();

  CollisionResult r;
  REQUIRE(solver.resolve(
      scene, make_request({0.0f, 1.0f, 0.0f}, {5.0f, 0.0f, 0.0f}, 0.1f), r));

  CHECK_THAT(r.position(0), WithinAbs(0.5f, 1e-4f));
  CHECK_THAT(r.position(1), WithinAbs(1.0f, 1e-5f));
  CHECK(r.grounded);
  CHECK(r.ground_normal.isApprox(Eigen::Vector3f::UnitY()));
  CHECK_FALSE(r.hit_wall);
}

TEST_CASE("head-on wall stops short by skin width", "[solver]") {
  Scene scene;
  add_test_floor(scene);
  // Solid for x >= 1.
  add_test_plane(scene, vec3(-1.0f, 0.0f, 0.0f), -1.0f);
  auto solver = make_solver();

  CollisionResult r;
  REQUIRE(solver.resolve(
      scene, make_request({0.0f, REST_Y, 0.0f}, {5.0f, 0.0f, 0.0f}, 1.0f), r));

  CHECK_THAT(r.position(0), WithinAbs(0.58f, 1e-3f));
  CHECK(r.hit_wall);
  CHECK(r.wall_normal.isApprox(Eigen::Vector3f(-1.0f, 0.0f, 0.0f)));
  CHECK_THAT(r.velocity(0), WithinAbs(0.0f, 1e-3f));
  CHECK_FALSE(r.can_step);
  CHECK(r.grounded);
}

TEST_CASE("oblique wall hit slides along the wall", "[solver]") {
  Scene scene;
  add_test_floor(scene);
  add_test_plane(scene, vec3(-1.0f, 0.0f, 0.0f), -1.0f);
  auto solver = make_solver();

  CollisionResult r;
  REQUIRE(solver.resolve(
      scene, make_request({0.0f, REST_Y, 0.0f}, {5.0f, 0.0f, 5.0f}, 1.0f), r));

  // Never closer to the wall than the radius.
  CHECK(r.position(0) + 0.4f <= 1.0f + 1e-4f);
  // The skin is kept along the diagonal travel direction.
  CHECK_THAT(r.position(0),
             WithinAbs(1.0f - 0.4f - 0.02f * std::sqrt(0.5f), 1e-3f));
  CHECK(r.position(2) > 4.0f);
  CHECK(r.hit_wall);
  CHECK_THAT(r.velocity(0), WithinAbs(0.0f, 1e-3f));
  CHECK(r.velocity(2) > 4.0f);
}

TEST_CASE("walking up a walkable ramp keeps the achieved velocity",
          "[solver]") {
  Scene scene;
  // 30 degree ramp through the origin rising towards +X, solid below it.
  float a = 30.0f * static_cast<float>(EIGEN_PI) / 180.0f;
  add_test_plane(scene, vec3(-std::sin(a), std::cos(a), 0.0f), 0.0f);
  auto solver = make_solver();

  // Lowest capsule point skin_width above the ramp along its normal.
  float support = 0.4f + 0.5f * std::cos(a);
  Eigen::Vector3f start{0.0f, (support + 0.02f) / std::cos(a), 0.0f};
  float dt = 0.5f;

  CollisionResult r;
  REQUIRE(solver.resolve(scene, make_request(start, {2.0f, 0.0f, 0.0f}, dt),
                         r));
  float dx = r.position(0) - start(0);
  CHECK(dx > 0.5f);
  CHECK(r.position(1) > start(1));
  CHECK_THAT(r.velocity(0), WithinAbs(dx / dt, 1e-4f));
  CHECK(r.grounded);

  // The resolved velocity carries the actor on the next tick.
  CollisionResult next;
  REQUIRE(solver.resolve(scene, make_request(r.position, r.velocity, dt),
                         next));
  CHECK(next.position(0) - r.position(0) > 0.3f);
}

TEST_CASE("landing clamps the vertical velocity", "[solver]") {
  Scene scene;
  add_test_floor(scene);
  auto solver = make_solver();

  SECTION("falling onto the floor") {
    CollisionResult r;
    REQUIRE(solver.resolve(
        scene, make_request({0.0f, 2.0f, 0.0f}, {0.0f, -10.0f, 0.0f}, 0.5f),
        r));
    CHECK_THAT(r.position(1), WithinAbs(REST_Y, 1e-4f));
    CHECK(r.velocity(1) == 0.0f);
    CHECK(r.grounded);
  }

  SECTION("jumping into a ceiling") {
    add_test_box(scene, vec3(0.0f, 3.0f, 0.0f), vec3(5.0f, 0.5f, 5.0f));
    CollisionResult r;
    REQUIRE(solver.resolve(
        scene, make_request({0.0f, REST_Y, 0.0f}, {0.0f, 10.0f, 0.0f}, 0.2f),
        r));
    // Capsule top stops skin_width under the ceiling at y = 2.5.
    CHECK_THAT(r.position(1), WithinAbs(2.5f - 0.9f - 0.02f, 1e-4f));
    CHECK(r.velocity(1) == 0.0f);
    CHECK_FALSE(r.grounded);
  }
}

TEST_CASE("steep slope is not ground", "[solver]") {
  Scene scene;
  float a = 60.0f * static_cast<float>(EIGEN_PI) / 180.0f;
  add_test_plane(scene, vec3(std::sin(a), std::cos(a), 0.0f), 0.0f);
  auto solver = make_solver();

  CollisionResult r;
  REQUIRE(solver.resolve(
      scene, make_request({0.0f, 0.95f, 0.0f}, Eigen::Vector3f::Zero(), 0.1f),
      r));
  CHECK_FALSE(r.grounded);

  // Same surface becomes ground once the limit allows it.
  REQUIRE(solver.set_slope_limit(65.0f));
  REQUIRE(solver.resolve(
      scene, make_request({0.0f, 0.95f, 0.0f}, Eigen::Vector3f::Zero(), 0.1f),
      r));
  CHECK(r.grounded);
}

TEST_CASE("steep wall does not lift the capsule", "[solver]") {
  Scene scene;
  // 60 degree ramp rising towards +X, solid below it.
  float a = 60.0f * static_cast<float>(EIGEN_PI) / 180.0f;
  add_test_plane(scene, vec3(-std::sin(a), std::cos(a), 0.0f),
                 -std::sin(a) * 1.0f);
  auto solver = make_solver();

  Eigen::Vector3f start{0.0f, 1.0f, 0.0f};
  CollisionResult r;
  REQUIRE(solver.resolve(scene, make_request(start, {3.0f, 0.0f, 0.0f}, 1.0f),
                         r));
  CHECK(r.hit_wall);
  CHECK(r.position(1) <= start(1) + 1e-5f);
}

TEST_CASE("slide loop terminates in a narrowing corner", "[solver]") {
  Scene scene;
  // Two walls meeting at x = 3 with a 40 degree opening towards -X.
  float a = 20.0f * static_cast<float>(EIGEN_PI) / 180.0f;
  Eigen::Vector3f n1{-std::sin(a), 0.0f, -std::cos(a)};
  Eigen::Vector3f n2{-std::sin(a), 0.0f, std::cos(a)};
  float offset = -3.0f * std::sin(a);
  add_test_plane(scene, vec3(n1(0), n1(1), n1(2)), offset);
  add_test_plane(scene, vec3(n2(0), n2(1), n2(2)), offset);

  auto check_clearance = [&](const Eigen::Vector3f& p) {
    CHECK(n1.dot(p) - offset >= 0.4f - 1e-4f);
    CHECK(n2.dot(p) - offset >= 0.4f - 1e-4f);
  };

  SECTION("default bounce cap") {
    auto solver = make_solver();
    CollisionResult r;
    int bounce_num = 0;
    REQUIRE(solver.slide_horizontal(scene, QueryFilter{}, {10.0f, 0.0f, 0.0f},
                                    r, bounce_num));
    CHECK(bounce_num >= 1);
    CHECK(bounce_num <= 4);
    CHECK(r.hit_wall);
    CHECK(r.position.allFinite());
    check_clearance(r.position);
  }

  SECTION("single bounce") {
    CapsuleConfig config;
    config.max_bounces = 1;
    auto solver = make_solver(config);
    CollisionResult r;
    int bounce_num = 0;
    REQUIRE(solver.slide_horizontal(scene, QueryFilter{}, {10.0f, 0.0f, 0.0f},
                                    r, bounce_num));
    CHECK(bounce_num == 1);
    check_clearance(r.position);
  }

  SECTION("full resolve") {
    auto solver = make_solver();
    CollisionResult r;
    REQUIRE(solver.resolve(
        scene, make_request({0.0f, 0.0f, 0.0f}, {10.0f, 0.0f, 0.0f}, 1.0f),
        r));
    check_clearance(r.position);
  }
}

TEST_CASE("step climbing", "[solver]") {
  Scene scene;
  add_test_floor(scene);
  Eigen::Vector3f start{0.0f, REST_Y, 0.0f};
  Eigen::Vector3f forward{2.0f, 0.0f, 0.0f};

  SECTION("ledge of 0.2 is climbed") {
    add_test_ledge(scene, 1.0f, 10.0f, 0.2f);
    auto solver = make_solver();

    CollisionResult r;
    REQUIRE(solver.resolve(scene, make_request(start, forward, 1.0f), r));
    CHECK(r.can_step);
    CHECK_FALSE(r.hit_wall);
    CHECK(r.wall_normal.isZero());
    CHECK_THAT(r.position(1) - start(1), WithinAbs(0.2f, 1e-3f));
    CHECK(r.position(0) > 1.9f);
    CHECK_THAT(r.velocity(0), WithinAbs(2.0f, 1e-5f));
    CHECK(r.grounded);
  }

  SECTION("obstacle just below step height is climbed") {
    add_test_ledge(scene, 1.0f, 10.0f, 0.25f);
    auto solver = make_solver();

    CollisionResult r;
    REQUIRE(solver.resolve(scene, make_request(start, forward, 1.0f), r));
    CHECK(r.can_step);
    CHECK_THAT(r.position(1) - start(1), WithinAbs(0.25f, 1e-3f));
  }

  SECTION("obstacle a hair below step height is climbed") {
    add_test_ledge(scene, 1.0f, 10.0f, 0.295f);
    auto solver = make_solver();

    CollisionResult r;
    REQUIRE(solver.resolve(scene, make_request(start, forward, 1.0f), r));
    CHECK(r.can_step);
    CHECK_FALSE(r.hit_wall);
    CHECK_THAT(r.position(1) - start(1), WithinAbs(0.295f, 1e-3f));
  }

  SECTION("obstacle a hair above step height blocks") {
    for (float height : {0.305f, 0.31f}) {
      CAPTURE(height);
      Scene ledge_scene;
      add_test_floor(ledge_scene);
      add_test_ledge(ledge_scene, 1.0f, 10.0f, height);
      auto solver = make_solver();

      CollisionResult r;
      REQUIRE(
          solver.resolve(ledge_scene, make_request(start, forward, 1.0f), r));
      CHECK_FALSE(r.can_step);
      CHECK(r.hit_wall);
      CHECK_THAT(r.position(1), WithinAbs(start(1), 1e-4f));
      CHECK(r.position(0) < 1.0f);
    }
  }

  SECTION("obstacle well above step height blocks") {
    add_test_ledge(scene, 1.0f, 10.0f, 0.35f);
    auto solver = make_solver();

    CollisionResult r;
    REQUIRE(solver.resolve(scene, make_request(start, forward, 1.0f), r));
    CHECK_FALSE(r.can_step);
    CHECK(r.hit_wall);
    CHECK_THAT(r.position(1), WithinAbs(start(1), 1e-4f));
    CHECK(r.position(0) < 1.0f);
  }

  SECTION("zero step height disables climbing") {
    add_test_ledge(scene, 1.0f, 10.0f, 0.2f);
    auto solver = make_solver();
    REQUIRE(solver.set_step_height(0.0f));

    CollisionResult r;
    REQUIRE(solver.resolve(scene, make_request(start, forward, 1.0f), r));
    CHECK_FALSE(r.can_step);
    CHECK(r.hit_wall);
  }

  SECTION("low ceiling blocks the hop") {
    add_test_ledge(scene, 1.0f, 10.0f, 0.2f);
    add_test_box(scene, vec3(0.0f, 2.4f, 0.0f), vec3(5.0f, 0.5f, 5.0f));
    auto solver = make_solver();

    CollisionResult r;
    REQUIRE(solver.resolve(scene, make_request(start, forward, 1.0f), r));
    CHECK_FALSE(r.can_step);
    CHECK(r.hit_wall);
    CHECK_THAT(r.position(1), WithinAbs(start(1), 1e-4f));
  }
}

TEST_CASE("invalid request leaves the result untouched", "[solver]") {
  Scene scene;
  auto solver = make_solver();

  CollisionResult r;
  r.position = {7.0f, 7.0f, 7.0f};

  Result status = solver.resolve(
      scene, make_request(Eigen::Vector3f::Zero(), {1.0f, 0.0f, 0.0f}, 0.0f),
      r);
  CHECK_FALSE(status);
  CHECK(status.code == ErrorCode::InvalidConfig);
  CHECK(r.position == Eigen::Vector3f(7.0f, 7.0f, 7.0f));

  float nan = std::numeric_limits<float>::quiet_NaN();
  status = solver.resolve(
      scene, make_request(Eigen::Vector3f::Zero(), {nan, 0.0f, 0.0f}, 0.1f),
      r);
  CHECK(status.code == ErrorCode::InvalidConfig);
  CHECK(r.position == Eigen::Vector3f(7.0f, 7.0f, 7.0f));
}

TEST_CASE("query failure keeps the partial result", "[solver]") {
  Scene scene;
  auto solver = make_solver();
  Eigen::Vector3f start{0.0f, 5.0f, 0.0f};

  SECTION("first query fails") {
    FlakyQuery flaky{scene, 0};
    CollisionResult r;
    Result status = solver.resolve(
        flaky, make_request(start, {1.0f, 0.0f, 0.0f}, 1.0f), r);
    CHECK(status.code == ErrorCode::QueryFail);
    CHECK(r.position == start);
  }

  SECTION("vertical sweep fails after the horizontal phase") {
    FlakyQuery flaky{scene, 1};
    CollisionResult r;
    Result status = solver.resolve(
        flaky, make_request(start, {1.0f, -1.0f, 0.0f}, 1.0f), r);
    CHECK(status.code == ErrorCode::QueryFail);
    CHECK_THAT(r.position(0), WithinAbs(1.0f, 1e-5f));
    CHECK_THAT(r.position(1), WithinAbs(start(1), 1e-6f));
    CHECK(flaky.query_num() == 2);
  }

  SECTION("failure at rest") {
    FlakyQuery flaky{scene, 0};
    CollisionResult r;
    Result status = solver.resolve(
        flaky, make_request(start, Eigen::Vector3f::Zero(), 1.0f), r);
    CHECK(status.code == ErrorCode::QueryFail);
    CHECK(r.position == start);
    CHECK_FALSE(r.grounded);
  }
}

TEST_CASE("solver config mutators", "[solver]") {
  auto solver = make_solver();

  CHECK(solver.set_step_height(0.5f));
  CHECK_THAT(solver.config().step_height, WithinAbs(0.5f, 1e-6f));

  Result r = solver.set_step_height(-0.1f);
  CHECK(r.code == ErrorCode::InvalidConfig);
  CHECK_THAT(solver.config().step_height, WithinAbs(0.5f, 1e-6f));

  CHECK_FALSE(solver.set_slope_limit(90.0f));
  CHECK_THAT(solver.config().slope_limit_deg, WithinAbs(45.0f, 1e-6f));

  CHECK_FALSE(solver.set_skin_width(0.3f));
  CHECK(solver.set_skin_width(0.05f));
  CHECK_THAT(solver.config().skin_width, WithinAbs(0.05f, 1e-6f));
}

}  // namespace glide
