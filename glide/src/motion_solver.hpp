#pragma once

#include <Eigen/Core>
#include <optional>

#include "glide/glide.hpp"
#include "glide/result.hpp"
#include "motion_types.hpp"
#include "shape_query.hpp"

namespace glide {

/**
 * @brief Collide-and-slide solver for one vertical capsule.
 *
 * A resolve runs, in order:
 * 1. horizontal phase: sweep the XZ displacement, stop skin_width short of the
 *    first hit and slide along the contact plane, up to max_bounces times,
 * 2. vertical phase: one sweep along the Y displacement,
 * 3. ground classification at the resolved position,
 * 4. step climbing, only if the horizontal phase ended against a wall.
 *
 * The solver keeps no state between calls other than its config.
 */
class CapsuleMotionSolver {
 private:
  CapsuleConfig config_;

  explicit CapsuleMotionSolver(const CapsuleConfig& config);

  Result apply_config(const CapsuleConfig& config);

 public:
  // Returns std::nullopt and logs the reason if the config is invalid.
  static std::optional<CapsuleMotionSolver> try_make(
      const CapsuleConfig& config);

  const CapsuleConfig& config() const;

  // Mutators validate the whole updated config and leave it unchanged on
  // error.
  Result set_step_height(float step_height);
  Result set_slope_limit(float slope_limit_deg);
  Result set_skin_width(float skin_width);

  /**
   * @brief Resolve one move against `query`.
   *
   * @return
   * - ErrorCode::InvalidConfig if dt is not positive and finite or the
   *   request holds non-finite values. `result` is left unmodified.
   * - ErrorCode::QueryFail if the provider failed. `result` holds the best
   *   state reached before the failure, at least the request position.
   */
  Result resolve(const IShapeQuery& query, const MoveRequest& request,
                 CollisionResult& result) const;

  /**
   * @brief Horizontal slide-and-bounce loop.
   *
   * Moves `result.position` by `displacement`, sliding along every contact
   * and updating `hit_wall` and `wall_normal`. Velocity is not touched.
   *
   * @param bounce_num Number of sweeps performed, at most max_bounces.
   */
  Result slide_horizontal(const IShapeQuery& query, const QueryFilter& filter,
                          const Eigen::Vector3f& displacement,
                          CollisionResult& result, int& bounce_num) const;

  // Single sweep along Y by `dy`. Clamps the vertical velocity on contact.
  Result move_vertical(const IShapeQuery& query, const QueryFilter& filter,
                       float dy, CollisionResult& result) const;
};

}  // namespace glide
