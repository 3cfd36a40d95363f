/**
 * @file shape_cast.hpp
 * @brief Analytic casts of a vertical capsule against scene primitives.
 *
 * A capsule moving along a straight line hits a convex obstacle exactly when
 * its center ray enters the Minkowski sum of the obstacle and the capsule.
 * Since the query capsule is always vertical, those sums stay simple:
 *
 * - box + capsule   = box grown by the half height along Y, rounded by the
 *                     radius (union of three grown boxes, twelve edge
 *                     cylinders and eight corner spheres),
 * - capsule + capsule (or sphere) = a taller, wider vertical capsule,
 * - plane + capsule = the plane shifted by the capsule support distance.
 *
 * A capsule with zero radius and zero half height turns every kernel into a
 * plain ray cast.
 *
 * When the query starts inside the sum, a hit at distance 0 is reported only
 * if the direction points into the obstacle, so a body can always move out of
 * a shallow overlap.
 */
#pragma once

#include <Eigen/Core>
#include <optional>

#include "collider.hpp"
#include "shape_query.hpp"

namespace glide {

std::optional<ShapeHit> cast_against_plane(const Eigen::Vector3f& origin,
                                           const Eigen::Vector3f& direction,
                                           float max_distance,
                                           const CapsuleShape& shape,
                                           const Eigen::Vector3f& normal,
                                           float offset);

std::optional<ShapeHit> cast_against_box(const Eigen::Vector3f& origin,
                                         const Eigen::Vector3f& direction,
                                         float max_distance,
                                         const CapsuleShape& shape,
                                         const Eigen::Vector3f& center,
                                         const Eigen::Vector3f& half_extent);

// Vertical capsule obstacle. A sphere is a capsule with zero half height.
std::optional<ShapeHit> cast_against_capsule(const Eigen::Vector3f& origin,
                                             const Eigen::Vector3f& direction,
                                             float max_distance,
                                             const CapsuleShape& shape,
                                             const Eigen::Vector3f& center,
                                             float radius, float half_height);

std::optional<ShapeHit> cast_against_collider(const Eigen::Vector3f& origin,
                                              const Eigen::Vector3f& direction,
                                              float max_distance,
                                              const CapsuleShape& shape,
                                              const Collider& collider);

}  // namespace glide
