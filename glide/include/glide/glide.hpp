#pragma once

#include <cstdint>
#include <memory>

#include "glide/result.hpp"

namespace glide {

struct Vec3 {
  float x = 0.0f;
  float y = 0.0f;
  float z = 0.0f;
};

/**
 * @brief Tunables of a vertical capsule character.
 *
 * Constraints checked on creation and by the mutators:
 * - every value finite,
 * - radius > 0 and height > 2 * radius,
 * - step_height >= 0,
 * - slope_limit_deg in [0, 90),
 * - skin_width > 0 and skin_width < radius / 2,
 * - max_bounces >= 1.
 */
struct CapsuleConfig {
  // Total height including both hemispherical caps.
  float height = 1.8f;
  float radius = 0.4f;
  // Tallest obstacle the character hops onto instead of being blocked by.
  float step_height = 0.3f;
  // Steepest walkable surface, measured from the up axis.
  float slope_limit_deg = 45.0f;
  // Clearance kept between the capsule surface and geometry.
  float skin_width = 0.02f;
  // Iteration cap of the slide-and-bounce loop.
  int max_bounces = 4;
};

struct CollisionConfig {
  bool is_collision_on = true;
  // Queries only see colliders of the same group.
  int group = 0;
};

// Axis aligned box.
struct BoxConfig {
  Vec3 center;
  Vec3 half_extent = {0.5f, 0.5f, 0.5f};
};

struct SphereConfig {
  Vec3 center;
  float radius = 0.5f;
};

// Solid half space {p : dot(normal, p) <= offset}. The normal does not need to
// be unit length.
struct PlaneConfig {
  Vec3 normal = {0.0f, 1.0f, 0.0f};
  float offset = 0.0f;
};

// Vertical capsule obstacle, e.g. an actor driven outside of glide.
struct CapsuleShapeConfig {
  Vec3 center;
  float height = 1.8f;
  float radius = 0.4f;
};

/**
 * @brief Outcome of one character move.
 *
 * `velocity` is the velocity actually achieved. Blocked motion shows up as a
 * reduced velocity so callers can feed it into the next tick.
 */
struct MoveResult {
  Vec3 position;
  Vec3 velocity;
  bool grounded = false;
  Vec3 ground_normal = {0.0f, 1.0f, 0.0f};
  bool hit_wall = false;
  Vec3 wall_normal;
  // The horizontal move was blocked by an obstacle shorter than step_height
  // and the character stepped onto it.
  bool can_step = false;
};

struct RayHit {
  float distance = 0.0f;
  Vec3 normal;
  Vec3 point;
};

class World {
  class WorldImpl;
  std::unique_ptr<WorldImpl> impl_;

 public:
  World();
  ~World();
  World(World&) = delete;
  World& operator=(World&) = delete;
  World(World&&);
  World& operator=(World&&);

  // Global API
  void clear();
  [[nodiscard]] Result cast_ray(Vec3 origin, Vec3 direction,
                                float max_distance, int group, RayHit& hit,
                                bool& is_hit) const;

  // Collider API
  [[nodiscard]] Result add_box(CollisionConfig collision_config,
                               BoxConfig box_config, uint32_t& handle);
  [[nodiscard]] Result add_sphere(CollisionConfig collision_config,
                                  SphereConfig sphere_config,
                                  uint32_t& handle);
  [[nodiscard]] Result add_plane(CollisionConfig collision_config,
                                 PlaneConfig plane_config, uint32_t& handle);
  [[nodiscard]] Result add_capsule(CollisionConfig collision_config,
                                   CapsuleShapeConfig capsule_config,
                                   uint32_t& handle);
  [[nodiscard]] Result remove_collider(uint32_t handle);
  [[nodiscard]] Result set_collider_position(uint32_t handle, Vec3 center);

  // Character API
  [[nodiscard]] Result add_character(CapsuleConfig capsule_config,
                                     CollisionConfig collision_config,
                                     Vec3 position, uint32_t& handle);
  [[nodiscard]] Result remove_character(uint32_t handle);
  [[nodiscard]] Result move_character(uint32_t handle, Vec3 desired_velocity,
                                      float dt, MoveResult& result);
  [[nodiscard]] Result get_character_position(uint32_t handle,
                                              Vec3& position) const;
  [[nodiscard]] Result set_character_position(uint32_t handle, Vec3 position);
  [[nodiscard]] Result get_character_config(uint32_t handle,
                                            CapsuleConfig& config) const;
  [[nodiscard]] Result set_character_step_height(uint32_t handle,
                                                 float step_height);
  [[nodiscard]] Result set_character_slope_limit(uint32_t handle,
                                                 float slope_limit_deg);
  [[nodiscard]] Result set_character_skin_width(uint32_t handle,
                                                float skin_width);
};

}  // namespace glide
