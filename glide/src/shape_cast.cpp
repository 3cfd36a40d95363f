#include "shape_cast.hpp"

#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <limits>

namespace glide {

namespace {

constexpr float PARALLEL_EPS = 1e-8f;

// Point of the query capsule touching the obstacle when the capsule center is
// at `center` and the contact normal is `normal`.
Eigen::Vector3f support_point(const Eigen::Vector3f& center,
                              const Eigen::Vector3f& normal,
                              const CapsuleShape& shape) {
  Eigen::Vector3f p = center - shape.radius * normal;
  if (normal(1) > 1e-6f) {
    p(1) -= shape.half_height;
  } else if (normal(1) < -1e-6f) {
    p(1) += shape.half_height;
  }
  return p;
}

ShapeHit make_hit(const Eigen::Vector3f& origin,
                  const Eigen::Vector3f& direction, float distance,
                  const Eigen::Vector3f& normal, const CapsuleShape& shape) {
  Eigen::Vector3f center = origin + distance * direction;
  return ShapeHit{distance, normal, support_point(center, normal, shape)};
}

// Keeps the earliest candidate within the max distance.
class NearestEntry {
 public:
  explicit NearestEntry(float max_distance) : max_distance_(max_distance) {}

  void consider(float t, const Eigen::Vector3f& normal) {
    if (t > max_distance_) {
      return;
    }
    if (!is_hit_ || t < t_) {
      is_hit_ = true;
      t_ = t;
      normal_ = normal;
    }
  }

  bool is_hit() const { return is_hit_; }
  float t() const { return t_; }
  const Eigen::Vector3f& normal() const { return normal_; }

 private:
  float max_distance_;
  bool is_hit_ = false;
  float t_ = 0.0f;
  Eigen::Vector3f normal_ = Eigen::Vector3f::Zero();
};

// Entry parameter of a ray into a sphere centered at the origin.
// `p` is the ray origin relative to the sphere center.
std::optional<float> ray_sphere_entry(const Eigen::Vector3f& p,
                                      const Eigen::Vector3f& d, float r) {
  float b = p.dot(d);
  float c = p.squaredNorm() - r * r;
  // Outside and moving away.
  if (c > 0.0f && b > 0.0f) {
    return std::nullopt;
  }
  float disc = b * b - c;
  if (disc < 0.0f) {
    return std::nullopt;
  }
  return std::max(0.0f, -b - std::sqrt(disc));
}

// Entry parameter of a ray into an infinite cylinder of radius r. The cylinder
// axis is parallel to coordinate `axis` and passes through `base`.
std::optional<float> ray_cylinder_entry(const Eigen::Vector3f& p,
                                        const Eigen::Vector3f& d, int axis,
                                        const Eigen::Vector3f& base, float r) {
  int i = (axis + 1) % 3;
  int j = (axis + 2) % 3;
  float pi = p(i) - base(i);
  float pj = p(j) - base(j);

  float a = d(i) * d(i) + d(j) * d(j);
  // Parallel to the axis, the ray can only enter through the caps.
  if (a < PARALLEL_EPS) {
    return std::nullopt;
  }
  float b = pi * d(i) + pj * d(j);
  float c = pi * pi + pj * pj - r * r;
  if (c > 0.0f && b > 0.0f) {
    return std::nullopt;
  }
  float disc = b * b - a * c;
  if (disc < 0.0f) {
    return std::nullopt;
  }
  return std::max(0.0f, (-b - std::sqrt(disc)) / a);
}

struct SlabEntry {
  float t;
  int axis;
};

// Slab test against a box of half extent `half` centered at the origin.
std::optional<SlabEntry> ray_aabb_entry(const Eigen::Vector3f& p,
                                        const Eigen::Vector3f& d,
                                        const Eigen::Vector3f& half) {
  float t_min = -std::numeric_limits<float>::infinity();
  float t_max = std::numeric_limits<float>::infinity();
  int entry_axis = -1;

  for (int i = 0; i < 3; ++i) {
    if (std::abs(d(i)) < PARALLEL_EPS) {
      if (p(i) < -half(i) || p(i) > half(i)) {
        return std::nullopt;
      }
      continue;
    }

    float inv = 1.0f / d(i);
    float t1 = (-half(i) - p(i)) * inv;
    float t2 = (half(i) - p(i)) * inv;
    if (t1 > t2) {
      std::swap(t1, t2);
    }
    if (t1 > t_min) {
      t_min = t1;
      entry_axis = i;
    }
    t_max = std::min(t_max, t2);
    if (t_min > t_max) {
      return std::nullopt;
    }
  }

  if (entry_axis == -1 || t_max < 0.0f) {
    return std::nullopt;
  }
  return SlabEntry{std::max(0.0f, t_min), entry_axis};
}

// Signed distance from local point p to a box of half extent e rounded by r.
// Also writes the outward normal at the closest surface point.
float rounded_box_distance(const Eigen::Vector3f& p, const Eigen::Vector3f& e,
                           float r, Eigen::Vector3f& normal) {
  Eigen::Vector3f q = p.cwiseAbs() - e;
  Eigen::Vector3f outside = q.cwiseMax(0.0f);
  float outside_norm = outside.norm();
  if (outside_norm > 0.0f) {
    Eigen::Vector3f sign =
        p.unaryExpr([](float v) { return (v >= 0.0f) ? 1.0f : -1.0f; });
    normal = outside.cwiseProduct(sign) / outside_norm;
    return outside_norm - r;
  }

  // Inside the core box, leave through the closest face.
  int axis;
  float depth = q.maxCoeff(&axis);
  normal = Eigen::Vector3f::Zero();
  normal(axis) = (p(axis) >= 0.0f) ? 1.0f : -1.0f;
  return depth - r;
}

}  // namespace

std::optional<ShapeHit> cast_against_plane(const Eigen::Vector3f& origin,
                                           const Eigen::Vector3f& direction,
                                           float max_distance,
                                           const CapsuleShape& shape,
                                           const Eigen::Vector3f& normal,
                                           float offset) {
  // Lowest point of the capsule along the normal sits this far below its
  // center.
  float support = shape.radius + shape.half_height * std::abs(normal(1));
  float separation = normal.dot(origin) - offset - support;
  float approach = normal.dot(direction);

  if (separation <= 0.0f) {
    if (approach < 0.0f) {
      return make_hit(origin, direction, 0.0f, normal, shape);
    }
    return std::nullopt;
  }

  if (approach >= -PARALLEL_EPS) {
    return std::nullopt;
  }
  float t = separation / -approach;
  if (t > max_distance) {
    return std::nullopt;
  }
  return make_hit(origin, direction, t, normal, shape);
}

std::optional<ShapeHit> cast_against_box(const Eigen::Vector3f& origin,
                                         const Eigen::Vector3f& direction,
                                         float max_distance,
                                         const CapsuleShape& shape,
                                         const Eigen::Vector3f& center,
                                         const Eigen::Vector3f& half_extent) {
  const Eigen::Vector3f& d = direction;
  Eigen::Vector3f p = origin - center;
  float r = shape.radius;
  // Core of the Minkowski sum, the capsule segment stretches it along Y.
  Eigen::Vector3f e = half_extent;
  e(1) += shape.half_height;

  Eigen::Vector3f overlap_normal;
  if (rounded_box_distance(p, e, r, overlap_normal) <= 0.0f) {
    if (d.dot(overlap_normal) < 0.0f) {
      return make_hit(origin, d, 0.0f, overlap_normal, shape);
    }
    return std::nullopt;
  }

  NearestEntry nearest{max_distance};

  // Faces: the core box grown by r along one axis at a time. Without rounding
  // all three are the core box itself.
  int face_num = (r > 0.0f) ? 3 : 1;
  for (int axis = 0; axis < face_num; ++axis) {
    Eigen::Vector3f grown = e;
    grown(axis) += r;
    auto entry = ray_aabb_entry(p, d, grown);
    if (!entry) {
      continue;
    }
    Eigen::Vector3f n = Eigen::Vector3f::Zero();
    n(entry->axis) = (d(entry->axis) > 0.0f) ? -1.0f : 1.0f;
    nearest.consider(entry->t, n);
  }

  if (r > 0.0f) {
    // Edges. Entering through a cylinder cap means the ray already entered
    // the corner sphere, so caps are skipped.
    for (int axis = 0; axis < 3; ++axis) {
      int i = (axis + 1) % 3;
      int j = (axis + 2) % 3;
      for (float si : {-1.0f, 1.0f}) {
        for (float sj : {-1.0f, 1.0f}) {
          Eigen::Vector3f base = Eigen::Vector3f::Zero();
          base(i) = si * e(i);
          base(j) = sj * e(j);

          auto t = ray_cylinder_entry(p, d, axis, base, r);
          if (!t) {
            continue;
          }
          Eigen::Vector3f hp = p + *t * d;
          if (std::abs(hp(axis)) > e(axis)) {
            continue;
          }
          Eigen::Vector3f n = hp - base;
          n(axis) = 0.0f;
          nearest.consider(*t, n.normalized());
        }
      }
    }

    // Corners.
    for (int k = 0; k < 8; ++k) {
      Eigen::Vector3f corner{(k & 1) ? e(0) : -e(0), (k & 2) ? e(1) : -e(1),
                             (k & 4) ? e(2) : -e(2)};
      auto t = ray_sphere_entry(p - corner, d, r);
      if (!t) {
        continue;
      }
      Eigen::Vector3f n = (p + *t * d - corner).normalized();
      nearest.consider(*t, n);
    }
  }

  if (!nearest.is_hit()) {
    return std::nullopt;
  }
  return make_hit(origin, d, nearest.t(), nearest.normal(), shape);
}

std::optional<ShapeHit> cast_against_capsule(const Eigen::Vector3f& origin,
                                             const Eigen::Vector3f& direction,
                                             float max_distance,
                                             const CapsuleShape& shape,
                                             const Eigen::Vector3f& center,
                                             float radius, float half_height) {
  const Eigen::Vector3f& d = direction;
  Eigen::Vector3f p = origin - center;
  float r = radius + shape.radius;
  float h = half_height + shape.half_height;

  // Closest point on the inner segment.
  Eigen::Vector3f axis_point{0.0f, std::clamp(p(1), -h, h), 0.0f};
  Eigen::Vector3f offset = p - axis_point;
  float offset_norm = offset.norm();
  if (offset_norm <= r) {
    Eigen::Vector3f n = (offset_norm > 1e-6f) ? Eigen::Vector3f(offset / offset_norm)
                                              : Eigen::Vector3f(-d);
    if (d.dot(n) < 0.0f) {
      return make_hit(origin, d, 0.0f, n, shape);
    }
    return std::nullopt;
  }

  NearestEntry nearest{max_distance};

  auto t = ray_cylinder_entry(p, d, 1, Eigen::Vector3f::Zero(), r);
  if (t) {
    Eigen::Vector3f hp = p + *t * d;
    if (std::abs(hp(1)) <= h) {
      Eigen::Vector3f n{hp(0), 0.0f, hp(2)};
      nearest.consider(*t, n.normalized());
    }
  }

  for (float cap : {-h, h}) {
    Eigen::Vector3f cap_center{0.0f, cap, 0.0f};
    auto ts = ray_sphere_entry(p - cap_center, d, r);
    if (!ts) {
      continue;
    }
    Eigen::Vector3f n = (p + *ts * d - cap_center).normalized();
    nearest.consider(*ts, n);
  }

  if (!nearest.is_hit()) {
    return std::nullopt;
  }
  return make_hit(origin, d, nearest.t(), nearest.normal(), shape);
}

std::optional<ShapeHit> cast_against_collider(const Eigen::Vector3f& origin,
                                              const Eigen::Vector3f& direction,
                                              float max_distance,
                                              const CapsuleShape& shape,
                                              const Collider& collider) {
  const Collider& c = collider;
  switch (c.type) {
    case ColliderType::Plane: {
      return cast_against_plane(origin, direction, max_distance, shape,
                                c.normal, c.offset);
    }
    case ColliderType::Box: {
      return cast_against_box(origin, direction, max_distance, shape, c.center,
                              c.half_extent);
    }
    case ColliderType::Sphere:
    case ColliderType::Capsule: {
      return cast_against_capsule(origin, direction, max_distance, shape,
                                  c.center, c.radius, c.half_height);
    }
  }

  return std::nullopt;
}

}  // namespace glide
