#include "bbox.hpp"

#include <Eigen/Core>
#include <cassert>

namespace glide {

Bbox Bbox::merge(const Bbox& a, const Bbox& b) {
  return {a.min.cwiseMin(b.min), a.max.cwiseMax(b.max)};
}

Bbox Bbox::pad(const Bbox& bbox, float padding) {
  assert((padding >= 0));
  return {bbox.min.array() - padding, bbox.max.array() + padding};
}

bool Bbox::is_disjoint(const Bbox& a, const Bbox& b) {
  Eigen::Vector3f max_min = a.min.cwiseMax(b.min);
  Eigen::Vector3f min_max = a.max.cwiseMin(b.max);
  return (max_min.array() > min_max.array()).any();
}

Bbox Bbox::swept_capsule(const Eigen::Vector3f& center,
                         const Eigen::Vector3f& direction, float distance,
                         float radius, float half_height) {
  Eigen::Vector3f extent{radius, half_height + radius, radius};
  Bbox start{center - extent, center + extent};
  Eigen::Vector3f end_center = center + distance * direction;
  Bbox end{end_center - extent, end_center + extent};
  return merge(start, end);
}

void Bbox::pad_inplace(float padding) {
  assert((padding >= 0));

  min = min.array() - padding;
  max = max.array() + padding;
}

}  // namespace glide
