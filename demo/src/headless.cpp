#include "headless.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <glide/glide.hpp>
#include <string>

namespace {

glide::Vec3 to_vec3(const std::array<float, 3>& v) { return {v[0], v[1], v[2]}; }

glide::CollisionConfig to_collision_config(const config::Collision& collision) {
  glide::CollisionConfig cfg;
  cfg.is_collision_on = collision.enabled;
  cfg.group = collision.group;
  return cfg;
}

glide::Result add_collider(glide::World& world, const config::Collider& c,
                           uint32_t& handle) {
  glide::CollisionConfig collision = to_collision_config(c.collision);
  switch (c.type) {
    case config::ColliderType::Box: {
      glide::BoxConfig box;
      box.center = to_vec3(c.center);
      box.half_extent = to_vec3(c.half_extent);
      return world.add_box(collision, box, handle);
    }
    case config::ColliderType::Sphere: {
      glide::SphereConfig sphere;
      sphere.center = to_vec3(c.center);
      sphere.radius = c.radius;
      return world.add_sphere(collision, sphere, handle);
    }
    case config::ColliderType::Plane: {
      glide::PlaneConfig plane;
      plane.normal = to_vec3(c.normal);
      plane.offset = c.offset;
      return world.add_plane(collision, plane, handle);
    }
    case config::ColliderType::Capsule: {
      glide::CapsuleShapeConfig capsule;
      capsule.center = to_vec3(c.center);
      capsule.height = c.height;
      capsule.radius = c.radius;
      return world.add_capsule(collision, capsule, handle);
    }
  }
  return glide::Result::error(glide::ErrorCode::Unknown, "unknown collider type");
}

}  // namespace

bool headless_run(const ScenarioConfig& config, const std::string& out_path) {
  glide::World world;

  int collider_num = 0;
  for (const auto& collider : config.colliders) {
    uint32_t handle = 0;
    glide::Result r = add_collider(world, collider, handle);
    if (!r) {
      spdlog::error("Failed to add collider '{}'; skipping. Error: {}",
                    collider.name, r.to_string());
      continue;
    }
    ++collider_num;
  }

  const config::Character& character = config.character;
  uint32_t handle = 0;
  glide::Result r =
      world.add_character(character.capsule,
                          to_collision_config(character.collision),
                          to_vec3(character.position), handle);
  if (!r) {
    spdlog::error("Headless run aborted: cannot add character. Error: {}",
                  r.to_string());
    return false;
  }

  std::ofstream out(out_path);
  if (!out) {
    spdlog::error("Cannot open output file '{}'.", out_path);
    return false;
  }
  out << "tick,time,x,y,z,vx,vy,vz,grounded,hit_wall,can_step\n";

  const config::Global& global = config.global;
  spdlog::info("Headless run start. {} colliders. Total time {}s. Total ticks {}",
               collider_num, global.ticks * global.dt, global.ticks);

  glide::MoveResult result;
  float vy = character.velocity[1];
  bool grounded = false;
  for (int tick = 0; tick < global.ticks; ++tick) {
    bool is_jump = std::find(character.jump_at.begin(), character.jump_at.end(),
                             tick) != character.jump_at.end();
    if (grounded && is_jump) {
      vy = character.jump_speed;
      spdlog::debug("Jump at tick {}.", tick);
    }
    vy += global.gravity * global.dt;

    glide::Vec3 desired = {character.velocity[0], vy, character.velocity[2]};
    r = world.move_character(handle, desired, global.dt, result);
    if (!r) {
      spdlog::error("Move at tick {} failed. Error: {}", tick, r.to_string());
      return false;
    }

    vy = result.velocity.y;
    grounded = result.grounded;
    // Grounded characters do not accumulate gravity.
    if (grounded && vy < 0.0f) {
      vy = 0.0f;
    }

    float time = (tick + 1) * global.dt;
    out << fmt::format("{},{},{},{},{},{},{},{},{:d},{:d},{:d}\n", tick, time,
                       result.position.x, result.position.y, result.position.z,
                       result.velocity.x, result.velocity.y, result.velocity.z,
                       result.grounded, result.hit_wall, result.can_step);
    spdlog::debug("Finish tick {}. Position ({}, {}, {})", tick,
                  result.position.x, result.position.y, result.position.z);
  }

  spdlog::info("Headless run exported to '{}'. Final position ({}, {}, {})",
               out_path, result.position.x, result.position.y,
               result.position.z);
  return true;
}
