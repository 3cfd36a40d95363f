#pragma once

#include <Eigen/Core>

#include "glide/glide.hpp"
#include "glide/result.hpp"
#include "motion_types.hpp"
#include "shape_query.hpp"

namespace glide {

/**
 * @brief Try to hop a blocked horizontal move onto a low obstacle.
 *
 * Runs three probes from `result.position`: up by step_height, forward by
 * `horizontal_displacement`, then down by step_height + skin_width. The step
 * is committed only if the first two probes are clear and the landing center
 * sits at most step_height above the current center. On commit the capsule
 * rests skin_width above the landing surface, `can_step` is set and the wall
 * contact is cleared.
 *
 * Does nothing unless `result.hit_wall` is set and the displacement is longer
 * than MIN_MOVE. A failed probe leaves `result` untouched.
 *
 * @param is_stepped Set to true if the step was committed.
 * @return ok, or the provider error.
 */
Result try_step_up(const IShapeQuery& query, const CapsuleConfig& config,
                   const QueryFilter& filter,
                   const Eigen::Vector3f& horizontal_displacement,
                   CollisionResult& result, bool& is_stepped);

}  // namespace glide
