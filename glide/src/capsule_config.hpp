#pragma once

#include <Eigen/Core>

#include "glide/glide.hpp"
#include "glide/result.hpp"
#include "shape_query.hpp"

namespace glide {

constexpr float DEG_TO_RAD = static_cast<float>(EIGEN_PI) / 180.0f;
constexpr float RAD_TO_DEG = 180.0f / static_cast<float>(EIGEN_PI);

// Displacements shorter than this are treated as no motion.
constexpr float MIN_MOVE = 1e-3f;
// Remaining slide length is scaled by this after every bounce.
constexpr float SLIDE_DAMPING = 0.98f;
// Ground rays travel skin_width plus this margin below the capsule bottom.
constexpr float GROUND_PROBE_MARGIN = 0.1f;
// Horizontal offset of the four outer ground rays, as a fraction of radius.
constexpr float GROUND_SAMPLE_SPREAD = 0.7f;

/**
 * @brief Check every constraint of a capsule config.
 *
 * @return ok, or ErrorCode::InvalidConfig whose detail names the first
 * violated constraint. Values are never clamped.
 */
Result validate_capsule_config(const CapsuleConfig& config);

// Query shape matching the character capsule.
CapsuleShape capsule_shape(const CapsuleConfig& config);

}  // namespace glide
