#include "collider_utils.hpp"

#include <cmath>

#include "logger.hpp"
#include "vec3_utils.hpp"

namespace glide {

namespace {

int collider_group(const CollisionConfig& c) {
  // Note: group == -1 disables this collider in every query.
  return (c.is_collision_on) ? c.group : -1;
}

}  // namespace

void update_collider_bbox(Collider& collider) {
  Collider& c = collider;
  switch (c.type) {
    case ColliderType::Plane: {
      // Unbounded, always reaches the narrowphase.
      break;
    }
    case ColliderType::Box: {
      c.bbox = Bbox{c.center - c.half_extent, c.center + c.half_extent};
      break;
    }
    case ColliderType::Sphere:
    case ColliderType::Capsule: {
      Eigen::Vector3f extent{c.radius, c.half_height + c.radius, c.radius};
      c.bbox = Bbox{c.center - extent, c.center + extent};
      break;
    }
  }
}

void set_collider_center(Collider& collider, const Eigen::Vector3f& center) {
  if (collider.type == ColliderType::Plane) {
    collider.offset = collider.normal.dot(center);
    return;
  }

  collider.center = center;
  update_collider_bbox(collider);
}

std::optional<Collider> try_make_box_collider(const CollisionConfig& collision,
                                              const BoxConfig& box) {
  Eigen::Vector3f center = to_eigen(box.center);
  Eigen::Vector3f half_extent = to_eigen(box.half_extent);
  if (!is_finite(center) || !is_finite(half_extent)) {
    spdlog::error("Reject box collider. Reason: non-finite parameter");
    return std::nullopt;
  }
  if ((half_extent.array() <= 0.0f).any()) {
    spdlog::error("Reject box collider. Reason: half extent {} not positive",
                  half_extent);
    return std::nullopt;
  }

  Collider c;
  c.type = ColliderType::Box;
  c.center = center;
  c.half_extent = half_extent;
  c.group = collider_group(collision);
  update_collider_bbox(c);
  return c;
}

std::optional<Collider> try_make_sphere_collider(
    const CollisionConfig& collision, const SphereConfig& sphere) {
  Eigen::Vector3f center = to_eigen(sphere.center);
  if (!is_finite(center) || !std::isfinite(sphere.radius) ||
      sphere.radius <= 0.0f) {
    spdlog::error("Reject sphere collider. Reason: invalid center or radius");
    return std::nullopt;
  }

  Collider c;
  c.type = ColliderType::Sphere;
  c.center = center;
  c.radius = sphere.radius;
  c.half_height = 0.0f;
  c.group = collider_group(collision);
  update_collider_bbox(c);
  return c;
}

std::optional<Collider> try_make_plane_collider(
    const CollisionConfig& collision, const PlaneConfig& plane) {
  Eigen::Vector3f normal = to_eigen(plane.normal);
  if (!is_finite(normal) || !std::isfinite(plane.offset)) {
    spdlog::error("Reject plane collider. Reason: non-finite parameter");
    return std::nullopt;
  }

  float norm = normal.norm();
  if (norm < 1e-6f) {
    spdlog::error("Reject plane collider. Reason: zero length normal");
    return std::nullopt;
  }

  Collider c;
  c.type = ColliderType::Plane;
  c.normal = normal / norm;
  c.offset = plane.offset / norm;
  c.group = collider_group(collision);
  return c;
}

std::optional<Collider> try_make_capsule_collider(
    const CollisionConfig& collision, const CapsuleShapeConfig& capsule) {
  Eigen::Vector3f center = to_eigen(capsule.center);
  if (!is_finite(center) || !std::isfinite(capsule.radius) ||
      !std::isfinite(capsule.height)) {
    spdlog::error("Reject capsule collider. Reason: non-finite parameter");
    return std::nullopt;
  }
  if (capsule.radius <= 0.0f || capsule.height < 2.0f * capsule.radius) {
    spdlog::error(
        "Reject capsule collider. Reason: radius {} and height {} do not form "
        "a capsule",
        capsule.radius, capsule.height);
    return std::nullopt;
  }

  Collider c;
  c.type = ColliderType::Capsule;
  c.center = center;
  c.radius = capsule.radius;
  c.half_height = 0.5f * capsule.height - capsule.radius;
  c.group = collider_group(collision);
  update_collider_bbox(c);
  return c;
}

}  // namespace glide
