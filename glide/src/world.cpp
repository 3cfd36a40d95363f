#include <Eigen/Core>
#include <glide/glide.hpp>
#include <glide/result.hpp>
#include <optional>
#include <utility>

#include "capsule_config.hpp"
#include "collider_utils.hpp"
#include "logger.hpp"
#include "manager.hpp"
#include "motion_solver.hpp"
#include "scene.hpp"
#include "vec3_utils.hpp"

namespace glide {

namespace {

struct Character {
  // Capsule collider mirroring the character in the scene.
  Handle collider;
  CollisionConfig collision;
  CapsuleMotionSolver solver;
  Eigen::Vector3f position;
};

MoveResult to_move_result(const CollisionResult& r) {
  MoveResult m;
  m.position = to_vec3(r.position);
  m.velocity = to_vec3(r.velocity);
  m.grounded = r.grounded;
  m.ground_normal = to_vec3(r.ground_normal);
  m.hit_wall = r.hit_wall;
  m.wall_normal = to_vec3(r.wall_normal);
  m.can_step = r.can_step;
  return m;
}

}  // namespace

class World::WorldImpl {
 private:
  Scene scene_;
  Manager<Character> characters_;

  bool is_character_collider(Handle handle) const {
    for (const Character& c : characters_.data()) {
      if (c.collider == handle) {
        return true;
      }
    }
    return false;
  }

  Result add_collider(std::optional<Collider> collider, uint32_t& handle) {
    if (!collider) {
      return Result::error(ErrorCode::InvalidShape);
    }

    Handle h = scene_.add_collider(std::move(*collider));
    if (h.is_empty()) {
      return Result::error(ErrorCode::TooManyBody);
    }

    handle = h.value;
    return Result::ok();
  }

  QueryFilter character_filter(const Character& c) const {
    QueryFilter f;
    f.exclude = c.collider;
    f.group = (c.collision.is_collision_on) ? c.collision.group : -1;
    return f;
  }

 public:
  // Global API
  void clear() {
    characters_.clear();
    scene_.clear();
  }

  Result cast_ray(Vec3 origin, Vec3 direction, float max_distance, int group,
                  RayHit& hit, bool& is_hit) const {
    is_hit = false;

    Eigen::Vector3f d = to_eigen(direction);
    float norm = d.norm();
    if (!d.allFinite() || norm < 1e-6f) {
      return Result::error(ErrorCode::QueryFail,
                           "ray direction must be finite and non-zero");
    }

    QueryFilter filter;
    filter.group = group;
    std::optional<ShapeHit> h;
    Result r = scene_.cast_ray(to_eigen(origin), d / norm, max_distance,
                               filter, h);
    if (!r) {
      return r;
    }

    if (h) {
      is_hit = true;
      hit.distance = h->distance;
      hit.normal = to_vec3(h->normal);
      hit.point = to_vec3(h->point);
    }
    return Result::ok();
  }

  // Collider API
  Result add_box(CollisionConfig collision_config, BoxConfig box_config,
                 uint32_t& handle) {
    return add_collider(try_make_box_collider(collision_config, box_config),
                        handle);
  }

  Result add_sphere(CollisionConfig collision_config,
                    SphereConfig sphere_config, uint32_t& handle) {
    return add_collider(
        try_make_sphere_collider(collision_config, sphere_config), handle);
  }

  Result add_plane(CollisionConfig collision_config, PlaneConfig plane_config,
                   uint32_t& handle) {
    return add_collider(try_make_plane_collider(collision_config, plane_config),
                        handle);
  }

  Result add_capsule(CollisionConfig collision_config,
                     CapsuleShapeConfig capsule_config, uint32_t& handle) {
    return add_collider(
        try_make_capsule_collider(collision_config, capsule_config), handle);
  }

  Result remove_collider(uint32_t handle) {
    // Character colliders are owned by their character.
    if (is_character_collider(handle)) {
      return Result::error(ErrorCode::InvalidHandle,
                           "collider belongs to a character");
    }
    if (!scene_.remove_collider(handle)) {
      return Result::error(ErrorCode::InvalidHandle);
    }
    return Result::ok();
  }

  Result set_collider_position(uint32_t handle, Vec3 center) {
    Eigen::Vector3f c = to_eigen(center);
    if (!is_finite(c)) {
      return Result::error(ErrorCode::InvalidShape, "non-finite position");
    }
    if (is_character_collider(handle)) {
      return Result::error(ErrorCode::InvalidHandle,
                           "collider belongs to a character");
    }
    if (!scene_.set_collider_position(handle, c)) {
      return Result::error(ErrorCode::InvalidHandle);
    }
    return Result::ok();
  }

  // Character API
  Result add_character(CapsuleConfig capsule_config,
                       CollisionConfig collision_config, Vec3 position,
                       uint32_t& handle) {
    Result r = validate_capsule_config(capsule_config);
    if (!r) {
      spdlog::error("Reject character. {}", r.to_string());
      return r;
    }

    Eigen::Vector3f p = to_eigen(position);
    if (!is_finite(p)) {
      return Result::error(ErrorCode::InvalidConfig, "non-finite position");
    }

    auto solver = CapsuleMotionSolver::try_make(capsule_config);
    if (!solver) {
      return Result::error(ErrorCode::InvalidConfig);
    }

    CapsuleShapeConfig shape;
    shape.center = position;
    shape.height = capsule_config.height;
    shape.radius = capsule_config.radius;
    auto collider = try_make_capsule_collider(collision_config, shape);
    if (!collider) {
      return Result::error(ErrorCode::InvalidShape);
    }

    Handle collider_handle = scene_.add_collider(std::move(*collider));
    if (collider_handle.is_empty()) {
      return Result::error(ErrorCode::TooManyBody);
    }

    Handle h = characters_.add(
        Character{collider_handle, collision_config, std::move(*solver), p});
    if (h.is_empty()) {
      scene_.remove_collider(collider_handle);
      return Result::error(ErrorCode::TooManyBody);
    }

    handle = h.value;
    return Result::ok();
  }

  Result remove_character(uint32_t handle) {
    Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }

    scene_.remove_collider(c->collider);
    characters_.remove(handle);
    return Result::ok();
  }

  Result move_character(uint32_t handle, Vec3 desired_velocity, float dt,
                        MoveResult& result) {
    Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }

    MoveRequest request;
    request.position = c->position;
    request.desired_velocity = to_eigen(desired_velocity);
    request.dt = dt;
    request.filter = character_filter(*c);

    CollisionResult resolved;
    Result r = c->solver.resolve(scene_, request, resolved);
    // A query failure still carries the partial result, commit it.
    if (!r && r.code != ErrorCode::QueryFail) {
      return r;
    }

    c->position = resolved.position;
    scene_.set_collider_position(c->collider, c->position);
    result = to_move_result(resolved);
    return r;
  }

  Result get_character_position(uint32_t handle, Vec3& position) const {
    const Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }

    position = to_vec3(c->position);
    return Result::ok();
  }

  Result set_character_position(uint32_t handle, Vec3 position) {
    Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }

    Eigen::Vector3f p = to_eigen(position);
    if (!is_finite(p)) {
      return Result::error(ErrorCode::InvalidConfig, "non-finite position");
    }

    c->position = p;
    scene_.set_collider_position(c->collider, p);
    return Result::ok();
  }

  Result get_character_config(uint32_t handle, CapsuleConfig& config) const {
    const Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }

    config = c->solver.config();
    return Result::ok();
  }

  Result set_character_step_height(uint32_t handle, float step_height) {
    Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }
    return c->solver.set_step_height(step_height);
  }

  Result set_character_slope_limit(uint32_t handle, float slope_limit_deg) {
    Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }
    return c->solver.set_slope_limit(slope_limit_deg);
  }

  Result set_character_skin_width(uint32_t handle, float skin_width) {
    Character* c = characters_.get(handle);
    if (!c) {
      return Result::error(ErrorCode::InvalidHandle);
    }
    return c->solver.set_skin_width(skin_width);
  }
};

World::World() : impl_(new WorldImpl) {}
World::~World() = default;
World::World(World&&) = default;
World& World::operator=(World&&) = default;

void World::clear() { impl_->clear(); }
Result World::cast_ray(Vec3 origin, Vec3 direction, float max_distance,
                       int group, RayHit& hit, bool& is_hit) const {
  return impl_->cast_ray(origin, direction, max_distance, group, hit, is_hit);
}
Result World::add_box(CollisionConfig collision_config, BoxConfig box_config,
                      uint32_t& handle) {
  return impl_->add_box(collision_config, box_config, handle);
}
Result World::add_sphere(CollisionConfig collision_config,
                         SphereConfig sphere_config, uint32_t& handle) {
  return impl_->add_sphere(collision_config, sphere_config, handle);
}
Result World::add_plane(CollisionConfig collision_config,
                        PlaneConfig plane_config, uint32_t& handle) {
  return impl_->add_plane(collision_config, plane_config, handle);
}
Result World::add_capsule(CollisionConfig collision_config,
                          CapsuleShapeConfig capsule_config, uint32_t& handle) {
  return impl_->add_capsule(collision_config, capsule_config, handle);
}
Result World::remove_collider(uint32_t handle) {
  return impl_->remove_collider(handle);
}
Result World::set_collider_position(uint32_t handle, Vec3 center) {
  return impl_->set_collider_position(handle, center);
}
Result World::add_character(CapsuleConfig capsule_config,
                            CollisionConfig collision_config, Vec3 position,
                            uint32_t& handle) {
  return impl_->add_character(capsule_config, collision_config, position,
                              handle);
}
Result World::remove_character(uint32_t handle) {
  return impl_->remove_character(handle);
}
Result World::move_character(uint32_t handle, Vec3 desired_velocity, float dt,
                             MoveResult& result) {
  return impl_->move_character(handle, desired_velocity, dt, result);
}
Result World::get_character_position(uint32_t handle, Vec3& position) const {
  return impl_->get_character_position(handle, position);
}
Result World::set_character_position(uint32_t handle, Vec3 position) {
  return impl_->set_character_position(handle, position);
}
Result World::get_character_config(uint32_t handle,
                                   CapsuleConfig& config) const {
  return impl_->get_character_config(handle, config);
}
Result World::set_character_step_height(uint32_t handle, float step_height) {
  return impl_->set_character_step_height(handle, step_height);
}
Result World::set_character_slope_limit(uint32_t handle,
                                        float slope_limit_deg) {
  return impl_->set_character_slope_limit(handle, slope_limit_deg);
}
Result World::set_character_skin_width(uint32_t handle, float skin_width) {
  return impl_->set_character_skin_width(handle, skin_width);
}

}  // namespace glide
