#include "step_climber.hpp"

#include <optional>

#include "capsule_config.hpp"
#include "logger.hpp"

namespace glide {

Result try_step_up(const IShapeQuery& query, const CapsuleConfig& config,
                   const QueryFilter& filter,
                   const Eigen::Vector3f& horizontal_displacement,
                   CollisionResult& result, bool& is_stepped) {
  is_stepped = false;

  float length = horizontal_displacement.norm();
  if (!result.hit_wall || length <= MIN_MOVE || config.step_height <= 0.0f) {
    return Result::ok();
  }

  CapsuleShape shape = capsule_shape(config);
  Eigen::Vector3f up = Eigen::Vector3f::UnitY();
  std::optional<ShapeHit> hit;

  // Headroom.
  Result r = query.sweep_capsule(result.position, up, config.step_height,
                                 shape, filter, hit);
  if (!r) {
    return r;
  }
  if (hit) {
    SPDLOG_DEBUG("step: no headroom, blocked at {}", hit->distance);
    return Result::ok();
  }
  Eigen::Vector3f raised = result.position + config.step_height * up;

  // Clear path above the obstacle.
  Eigen::Vector3f direction = horizontal_displacement / length;
  r = query.sweep_capsule(raised, direction, length, shape, filter, hit);
  if (!r) {
    return r;
  }
  if (hit) {
    SPDLOG_DEBUG("step: obstacle taller than step height");
    return Result::ok();
  }
  Eigen::Vector3f forward = raised + horizontal_displacement;

  // Landing.
  r = query.sweep_capsule(forward, -up, config.step_height + config.skin_width,
                          shape, filter, hit);
  if (!r) {
    return r;
  }
  if (!hit || hit->distance > config.step_height) {
    SPDLOG_DEBUG("step: no landing surface within step height");
    return Result::ok();
  }
  // The climb is measured from the current center, which already floats
  // skin_width or more above the surface it stands on.
  float landing_y = forward(1) - (hit->distance - config.skin_width);
  float climb = landing_y - result.position(1);
  if (climb > config.step_height) {
    SPDLOG_DEBUG("step: climb {} exceeds step height", climb);
    return Result::ok();
  }

  result.position = forward;
  result.position(1) = landing_y;
  result.can_step = true;
  result.hit_wall = false;
  result.wall_normal = Eigen::Vector3f::Zero();
  is_stepped = true;

  SPDLOG_DEBUG("step: climbed to {}", result.position);
  return Result::ok();
}

}  // namespace glide
