#pragma once

#include <Eigen/Core>

#include "glide/glide.hpp"

namespace glide {

inline Eigen::Vector3f to_eigen(const Vec3& v) { return {v.x, v.y, v.z}; }

inline Vec3 to_vec3(const Eigen::Vector3f& v) { return {v(0), v(1), v(2)}; }

inline bool is_finite(const Eigen::Vector3f& v) { return v.allFinite(); }

}  // namespace glide
