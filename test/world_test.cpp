#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <glide/glide.hpp>

namespace glide {

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float REST_Y = 0.92f;

uint32_t add_floor(World& world) {
  uint32_t handle = 0;
  REQUIRE(world.add_plane({}, PlaneConfig{}, handle));
  return handle;
}

uint32_t add_character(World& world, Vec3 position,
                       CollisionConfig collision = {}) {
  uint32_t handle = 0;
  REQUIRE(world.add_character({}, collision, position, handle));
  return handle;
}

}  // namespace

TEST_CASE("world collider api", "[world]") {
  World world;

  SECTION("shape validation") {
    uint32_t handle = 0;
    BoxConfig box;
    box.half_extent = {1.0f, -1.0f, 1.0f};
    Result r = world.add_box({}, box, handle);
    CHECK(r.code == ErrorCode::InvalidShape);

    SphereConfig sphere;
    sphere.radius = 0.0f;
    CHECK(world.add_sphere({}, sphere, handle).code == ErrorCode::InvalidShape);

    PlaneConfig plane;
    plane.normal = {0.0f, 0.0f, 0.0f};
    CHECK(world.add_plane({}, plane, handle).code == ErrorCode::InvalidShape);

    CapsuleShapeConfig capsule;
    capsule.height = 0.5f;
    CHECK(world.add_capsule({}, capsule, handle).code ==
          ErrorCode::InvalidShape);
  }

  SECTION("handles become stale after removal") {
    uint32_t handle = 0;
    REQUIRE(world.add_sphere({}, SphereConfig{}, handle));
    CHECK(world.set_collider_position(handle, {1.0f, 2.0f, 3.0f}));
    CHECK(world.remove_collider(handle));
    CHECK(world.remove_collider(handle).code == ErrorCode::InvalidHandle);
    CHECK(world.set_collider_position(handle, {0.0f, 0.0f, 0.0f}).code ==
          ErrorCode::InvalidHandle);
  }

  SECTION("ray cast") {
    add_floor(world);

    RayHit hit;
    bool is_hit = false;
    REQUIRE(world.cast_ray({0.0f, 5.0f, 0.0f}, {0.0f, -2.0f, 0.0f}, 10.0f, 0,
                           hit, is_hit));
    REQUIRE(is_hit);
    CHECK_THAT(hit.distance, WithinAbs(5.0f, 1e-5f));
    CHECK_THAT(hit.normal.y, WithinAbs(1.0f, 1e-6f));
    CHECK_THAT(hit.point.y, WithinAbs(0.0f, 1e-5f));

    REQUIRE(world.cast_ray({0.0f, 5.0f, 0.0f}, {0.0f, -1.0f, 0.0f}, 10.0f, 1,
                           hit, is_hit));
    CHECK_FALSE(is_hit);

    Result r = world.cast_ray({0.0f, 5.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, 10.0f,
                              0, hit, is_hit);
    CHECK(r.code == ErrorCode::QueryFail);
  }
}

TEST_CASE("world character api", "[world]") {
  World world;
  add_floor(world);

  SECTION("invalid config is reported") {
    CapsuleConfig config;
    config.height = 0.5f;
    uint32_t handle = 0;
    Result r = world.add_character(config, {}, {0.0f, 1.0f, 0.0f}, handle);
    CHECK(r.code == ErrorCode::InvalidConfig);
    CHECK_THAT(r.detail,
               ContainsSubstring("height must be greater than 2 * radius"));
  }

  SECTION("character does not collide with itself") {
    uint32_t h = add_character(world, {0.0f, REST_Y, 0.0f});

    MoveResult result;
    REQUIRE(world.move_character(h, {5.0f, 0.0f, 0.0f}, 0.1f, result));
    CHECK_THAT(result.position.x, WithinAbs(0.5f, 1e-4f));
    CHECK(result.grounded);
    CHECK_FALSE(result.hit_wall);

    Vec3 position;
    REQUIRE(world.get_character_position(h, position));
    CHECK_THAT(position.x, WithinAbs(0.5f, 1e-4f));
  }

  SECTION("characters block each other") {
    uint32_t a = add_character(world, {0.0f, REST_Y, 0.0f});
    add_character(world, {2.0f, REST_Y, 0.0f});

    MoveResult result;
    REQUIRE(world.move_character(a, {5.0f, 0.0f, 0.0f}, 1.0f, result));
    CHECK(result.hit_wall);
    CHECK_THAT(result.position.x, WithinAbs(2.0f - 0.8f - 0.02f, 1e-3f));
    CHECK_THAT(result.velocity.x, WithinAbs(0.0f, 1e-3f));
  }

  SECTION("collision groups separate characters") {
    CollisionConfig ghost;
    ghost.group = 1;
    uint32_t a = add_character(world, {0.0f, REST_Y, 0.0f});
    add_character(world, {2.0f, REST_Y, 0.0f}, ghost);

    MoveResult result;
    REQUIRE(world.move_character(a, {5.0f, 0.0f, 0.0f}, 1.0f, result));
    CHECK_FALSE(result.hit_wall);
    CHECK_THAT(result.position.x, WithinAbs(5.0f, 1e-4f));
  }

  SECTION("moved collider changes the outcome") {
    uint32_t h = add_character(world, {0.0f, REST_Y, 0.0f});
    uint32_t wall = 0;
    BoxConfig box;
    box.center = {3.0f, 1.0f, 0.0f};
    box.half_extent = {0.5f, 1.0f, 5.0f};
    REQUIRE(world.add_box({}, box, wall));

    MoveResult result;
    REQUIRE(world.move_character(h, {5.0f, 0.0f, 0.0f}, 1.0f, result));
    CHECK(result.hit_wall);
    CHECK_FALSE(result.can_step);
    CHECK_THAT(result.position.x, WithinAbs(2.5f - 0.4f - 0.02f, 1e-3f));

    REQUIRE(world.set_collider_position(wall, {10.0f, 1.0f, 0.0f}));
    REQUIRE(world.move_character(h, {5.0f, 0.0f, 0.0f}, 1.0f, result));
    CHECK_FALSE(result.hit_wall);
    CHECK_THAT(result.position.x, WithinAbs(7.08f, 1e-3f));
  }

  SECTION("invalid dt keeps the character in place") {
    uint32_t h = add_character(world, {0.0f, REST_Y, 0.0f});

    MoveResult result;
    Result r = world.move_character(h, {5.0f, 0.0f, 0.0f}, 0.0f, result);
    CHECK(r.code == ErrorCode::InvalidConfig);

    Vec3 position;
    REQUIRE(world.get_character_position(h, position));
    CHECK(position.x == 0.0f);
  }

  SECTION("config mutators") {
    uint32_t h = add_character(world, {0.0f, REST_Y, 0.0f});

    CHECK(world.set_character_step_height(h, -1.0f).code ==
          ErrorCode::InvalidConfig);
    CHECK(world.set_character_slope_limit(h, 95.0f).code ==
          ErrorCode::InvalidConfig);
    REQUIRE(world.set_character_step_height(h, 0.4f));
    REQUIRE(world.set_character_skin_width(h, 0.01f));

    CapsuleConfig config;
    REQUIRE(world.get_character_config(h, config));
    CHECK_THAT(config.step_height, WithinAbs(0.4f, 1e-6f));
    CHECK_THAT(config.skin_width, WithinAbs(0.01f, 1e-6f));
    CHECK_THAT(config.slope_limit_deg, WithinAbs(45.0f, 1e-6f));
  }

  SECTION("teleport and removal") {
    uint32_t h = add_character(world, {0.0f, REST_Y, 0.0f});
    REQUIRE(world.set_character_position(h, {4.0f, 3.0f, 0.0f}));

    Vec3 position;
    REQUIRE(world.get_character_position(h, position));
    CHECK(position.x == 4.0f);
    CHECK(position.y == 3.0f);

    REQUIRE(world.remove_character(h));
    CHECK(world.remove_character(h).code == ErrorCode::InvalidHandle);
    MoveResult result;
    CHECK(world.move_character(h, {1.0f, 0.0f, 0.0f}, 0.1f, result).code ==
          ErrorCode::InvalidHandle);
  }

  SECTION("clear drops every resource") {
    uint32_t h = add_character(world, {0.0f, REST_Y, 0.0f});
    world.clear();

    Vec3 position;
    CHECK(world.get_character_position(h, position).code ==
          ErrorCode::InvalidHandle);

    RayHit hit;
    bool is_hit = true;
    REQUIRE(world.cast_ray({0.0f, 5.0f, 0.0f}, {0.0f, -1.0f, 0.0f}, 10.0f, 0,
                           hit, is_hit));
    CHECK_FALSE(is_hit);
  }
}

}  // namespace glide
