#pragma once

#include <Eigen/Core>

#include "shape_query.hpp"

namespace glide {

struct MoveRequest {
  // Capsule center.
  Eigen::Vector3f position = Eigen::Vector3f::Zero();
  Eigen::Vector3f desired_velocity = Eigen::Vector3f::Zero();
  float dt = 0.0f;
  QueryFilter filter;
};

// Internal counterpart of MoveResult.
struct CollisionResult {
  Eigen::Vector3f position = Eigen::Vector3f::Zero();
  Eigen::Vector3f velocity = Eigen::Vector3f::Zero();
  bool grounded = false;
  Eigen::Vector3f ground_normal = Eigen::Vector3f::UnitY();
  bool hit_wall = false;
  Eigen::Vector3f wall_normal = Eigen::Vector3f::Zero();
  bool can_step = false;
};

}  // namespace glide
