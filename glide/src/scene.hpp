#pragma once

#include <Eigen/Core>
#include <optional>

#include "collider.hpp"
#include "handle.hpp"
#include "manager.hpp"
#include "shape_query.hpp"

namespace glide {

/**
 * @brief Built-in shape-query provider over analytic colliders.
 *
 * Colliders live in a generational slot map. Queries run a bbox broadphase
 * against the swept query volume, then the analytic narrowphase of
 * shape_cast.hpp, and return the nearest hit.
 */
class Scene : public IShapeQuery {
 private:
  Manager<Collider> colliders_;

  Result check_query(const Eigen::Vector3f& origin,
                     const Eigen::Vector3f& direction,
                     float max_distance) const;

 public:
  // Returns empty handle when the scene is full.
  Handle add_collider(Collider collider);
  bool remove_collider(Handle handle);
  const Collider* get(Handle handle) const;
  bool set_collider_position(Handle handle, const Eigen::Vector3f& center);
  void clear();
  uint32_t collider_num() const;

  Result sweep_capsule(const Eigen::Vector3f& origin,
                       const Eigen::Vector3f& direction, float max_distance,
                       const CapsuleShape& capsule, const QueryFilter& filter,
                       std::optional<ShapeHit>& hit) const override;

  Result cast_ray(const Eigen::Vector3f& origin,
                  const Eigen::Vector3f& direction, float max_distance,
                  const QueryFilter& filter,
                  std::optional<ShapeHit>& hit) const override;
};

}  // namespace glide
