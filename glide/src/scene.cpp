#include "scene.hpp"

#include <cmath>

#include "bbox.hpp"
#include "collider_utils.hpp"
#include "logger.hpp"
#include "shape_cast.hpp"

namespace glide {

namespace {

constexpr float UNIT_DIRECTION_TOLERANCE = 1e-3f;
constexpr float BROADPHASE_PADDING = 1e-4f;

bool is_query_visible(const Collider& collider, const QueryFilter& filter) {
  if (!filter.exclude.is_empty() && collider.self == filter.exclude) {
    return false;
  }
  return filter.group >= 0 && collider.group == filter.group;
}

}  // namespace

Result Scene::check_query(const Eigen::Vector3f& origin,
                          const Eigen::Vector3f& direction,
                          float max_distance) const {
  if (!origin.allFinite()) {
    return Result::error(ErrorCode::QueryFail, "non-finite query origin");
  }
  if (!direction.allFinite() ||
      std::abs(direction.norm() - 1.0f) > UNIT_DIRECTION_TOLERANCE) {
    return Result::error(ErrorCode::QueryFail,
                         "query direction is not a unit vector");
  }
  if (!std::isfinite(max_distance) || max_distance < 0.0f) {
    return Result::error(ErrorCode::QueryFail,
                         "query distance is negative or non-finite");
  }
  return Result::ok();
}

Handle Scene::add_collider(Collider collider) {
  Handle h = colliders_.add(std::move(collider));
  if (h.is_empty()) {
    return h;
  }

  Collider* c = colliders_.get(h);
  c->self = h;
  SPDLOG_DEBUG("scene: add collider {}, group {}", h.value, c->group);
  return h;
}

bool Scene::remove_collider(Handle handle) {
  return colliders_.remove(handle);
}

const Collider* Scene::get(Handle handle) const {
  return colliders_.get(handle);
}

bool Scene::set_collider_position(Handle handle,
                                  const Eigen::Vector3f& center) {
  Collider* c = colliders_.get(handle);
  if (!c) {
    return false;
  }

  set_collider_center(*c, center);
  return true;
}

void Scene::clear() { colliders_.clear(); }

uint32_t Scene::collider_num() const { return colliders_.size(); }

Result Scene::sweep_capsule(const Eigen::Vector3f& origin,
                            const Eigen::Vector3f& direction,
                            float max_distance, const CapsuleShape& capsule,
                            const QueryFilter& filter,
                            std::optional<ShapeHit>& hit) const {
  hit.reset();

  Result r = check_query(origin, direction, max_distance);
  if (!r) {
    return r;
  }

  Bbox swept = Bbox::swept_capsule(origin, direction, max_distance,
                                   capsule.radius, capsule.half_height);
  swept.pad_inplace(BROADPHASE_PADDING);

  for (const Collider& c : colliders_.data()) {
    if (!is_query_visible(c, filter)) {
      continue;
    }
    if (c.type != ColliderType::Plane && Bbox::is_disjoint(swept, c.bbox)) {
      continue;
    }

    auto h = cast_against_collider(origin, direction, max_distance, capsule, c);
    if (!h) {
      continue;
    }
    // Ties keep the earlier collider.
    if (!hit || h->distance < hit->distance) {
      hit = h;
    }
  }

  if (hit) {
    SPDLOG_DEBUG("scene: sweep from {} along {} hits at {}, normal {}", origin,
                 direction, hit->distance, hit->normal);
  }
  return Result::ok();
}

Result Scene::cast_ray(const Eigen::Vector3f& origin,
                       const Eigen::Vector3f& direction, float max_distance,
                       const QueryFilter& filter,
                       std::optional<ShapeHit>& hit) const {
  return sweep_capsule(origin, direction, max_distance, CapsuleShape{}, filter,
                       hit);
}

}  // namespace glide
