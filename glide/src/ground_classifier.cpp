#include "ground_classifier.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "capsule_config.hpp"
#include "logger.hpp"

namespace glide {

bool is_walkable(const Eigen::Vector3f& normal, float slope_limit_deg) {
  float cos_angle = std::clamp(normal(1), -1.0f, 1.0f);
  float angle_deg = std::acos(cos_angle) * RAD_TO_DEG;
  return angle_deg <= slope_limit_deg;
}

Result classify_ground(const IShapeQuery& query, const CapsuleConfig& config,
                       const Eigen::Vector3f& position,
                       const QueryFilter& filter, GroundInfo& ground) {
  ground = GroundInfo{};

  float spread = GROUND_SAMPLE_SPREAD * config.radius;
  std::array<Eigen::Vector3f, 5> offsets = {
      Eigen::Vector3f{0.0f, 0.0f, 0.0f}, Eigen::Vector3f{spread, 0.0f, 0.0f},
      Eigen::Vector3f{-spread, 0.0f, 0.0f}, Eigen::Vector3f{0.0f, 0.0f, spread},
      Eigen::Vector3f{0.0f, 0.0f, -spread}};

  Eigen::Vector3f bottom = position;
  bottom(1) -= 0.5f * config.height;
  float probe_distance = config.skin_width + GROUND_PROBE_MARGIN;
  Eigen::Vector3f down = -Eigen::Vector3f::UnitY();

  for (const Eigen::Vector3f& offset : offsets) {
    std::optional<ShapeHit> hit;
    Result r = query.cast_ray(bottom + offset, down, probe_distance, filter, hit);
    if (!r) {
      return r;
    }
    if (!hit) {
      continue;
    }
    if (is_walkable(hit->normal, config.slope_limit_deg)) {
      ground.grounded = true;
      ground.normal = hit->normal;
      return Result::ok();
    }
    SPDLOG_DEBUG("ground: sample {} hit steep surface {}", offset, hit->normal);
  }

  return Result::ok();
}

}  // namespace glide
