#pragma once

#include <Eigen/Core>

#include "bbox.hpp"
#include "handle.hpp"

namespace glide {

enum class ColliderType { Plane, Box, Sphere, Capsule };

// Static or kinematic scene geometry. Only the fields of the active type are
// meaningful.
struct Collider {
  Handle self;
  ColliderType type;

  // Box, sphere and capsule center.
  Eigen::Vector3f center = Eigen::Vector3f::Zero();
  // Box half extent.
  Eigen::Vector3f half_extent = Eigen::Vector3f::Zero();
  // Plane: solid half space {p : dot(normal, p) <= offset}, unit normal.
  Eigen::Vector3f normal = Eigen::Vector3f::UnitY();
  float offset = 0.0f;
  // Sphere and capsule radius.
  float radius = 0.0f;
  // Capsule segment half length. A sphere is a capsule with zero half height.
  float half_height = 0.0f;

  // If group = -1, collision is disabled. The default group should be 0.
  int group = 0;
  // Unused for planes, which are unbounded.
  Bbox bbox;
};

}  // namespace glide
