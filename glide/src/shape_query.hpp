#pragma once

#include <Eigen/Core>
#include <optional>

#include "glide/result.hpp"
#include "handle.hpp"

namespace glide {

struct ShapeHit {
  // Travel distance along the query direction until first contact.
  float distance;
  // Unit contact normal, pointing from the obstacle towards the query shape.
  Eigen::Vector3f normal;
  // Contact point on the obstacle surface.
  Eigen::Vector3f point;
};

// Vertical capsule used as query shape. A capsule with zero radius and zero
// half height degenerates to a thin ray.
struct CapsuleShape {
  float radius = 0.0f;
  // Half length of the inner segment, i.e. height / 2 - radius.
  float half_height = 0.0f;
};

struct QueryFilter {
  // Collider never reported by the query, usually the caller's own body.
  Handle exclude;
  // Only colliders of the same group are reported. -1 matches nothing.
  int group = 0;
};

/**
 * @brief Geometric oracle the motion solver runs against.
 *
 * Both queries return an error Result only when the provider itself fails.
 * "Nothing hit" is a success with an empty `hit`. Implementations must not
 * report obstacles the query starts inside of while moving away from them.
 */
class IShapeQuery {
 public:
  virtual ~IShapeQuery() = default;

  // Sweep a capsule centered at `origin` along unit `direction`.
  virtual Result sweep_capsule(const Eigen::Vector3f& origin,
                               const Eigen::Vector3f& direction,
                               float max_distance, const CapsuleShape& capsule,
                               const QueryFilter& filter,
                               std::optional<ShapeHit>& hit) const = 0;

  virtual Result cast_ray(const Eigen::Vector3f& origin,
                          const Eigen::Vector3f& direction, float max_distance,
                          const QueryFilter& filter,
                          std::optional<ShapeHit>& hit) const = 0;
};

}  // namespace glide
