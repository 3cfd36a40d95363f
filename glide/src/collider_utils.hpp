#pragma once

#include <Eigen/Core>
#include <optional>

#include "collider.hpp"
#include "glide/glide.hpp"

namespace glide {

/**
 * @brief Validate shape configs and build colliders.
 *
 * Every factory rejects non-finite values and non-positive sizes and returns
 * std::nullopt in that case. The returned collider has an empty `self`
 * handle; the Scene assigns it on insertion.
 */
std::optional<Collider> try_make_box_collider(const CollisionConfig& collision,
                                              const BoxConfig& box);
std::optional<Collider> try_make_sphere_collider(
    const CollisionConfig& collision, const SphereConfig& sphere);
std::optional<Collider> try_make_plane_collider(
    const CollisionConfig& collision, const PlaneConfig& plane);
std::optional<Collider> try_make_capsule_collider(
    const CollisionConfig& collision, const CapsuleShapeConfig& capsule);

// Recompute the bbox after the collider center moved.
void update_collider_bbox(Collider& collider);

// Move a collider so that its center is at `center`. Planes are shifted so
// that they pass through `center`.
void set_collider_center(Collider& collider, const Eigen::Vector3f& center);

}  // namespace glide
