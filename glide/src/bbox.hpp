#pragma once

#include <Eigen/Core>

namespace glide {

struct Bbox {
  Eigen::Vector3f min;
  Eigen::Vector3f max;

  static Bbox merge(const Bbox& a, const Bbox& b);
  static Bbox pad(const Bbox& bbox, float padding);
  static bool is_disjoint(const Bbox& a, const Bbox& b);

  // Bbox covering a vertical capsule centered at `center` while it travels
  // `distance` along `direction`.
  static Bbox swept_capsule(const Eigen::Vector3f& center,
                            const Eigen::Vector3f& direction, float distance,
                            float radius, float half_height);

  void pad_inplace(float padding);
};

}  // namespace glide
