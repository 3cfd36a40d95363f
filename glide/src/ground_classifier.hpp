#pragma once

#include <Eigen/Core>

#include "glide/glide.hpp"
#include "glide/result.hpp"
#include "shape_query.hpp"

namespace glide {

struct GroundInfo {
  bool grounded = false;
  Eigen::Vector3f normal = Eigen::Vector3f::UnitY();
};

// True if the angle between `normal` and up does not exceed the limit.
bool is_walkable(const Eigen::Vector3f& normal, float slope_limit_deg);

/**
 * @brief Decide whether a capsule at `position` stands on walkable ground.
 *
 * Five rays are cast straight down from the capsule bottom: one under the
 * center, then GROUND_SAMPLE_SPREAD * radius towards +X, -X, +Z and -Z. The
 * first ray hitting a walkable surface within skin_width +
 * GROUND_PROBE_MARGIN decides the result. Steep hits do not stop sampling.
 *
 * @return ok, or the provider error. `ground` is reset before sampling so it
 * always holds a consistent value.
 */
Result classify_ground(const IShapeQuery& query, const CapsuleConfig& config,
                       const Eigen::Vector3f& position,
                       const QueryFilter& filter, GroundInfo& ground);

}  // namespace glide
