#include "motion_solver.hpp"

#include <algorithm>
#include <cmath>

#include "capsule_config.hpp"
#include "ground_classifier.hpp"
#include "logger.hpp"
#include "step_climber.hpp"

namespace glide {

namespace {

Result query_fail(const Result& r) {
  spdlog::warn("Capsule resolve aborted, keep partial result. {}",
               r.to_string());
  return r;
}

// Drop the part of a horizontal velocity that pushes into the wall.
Eigen::Vector3f remove_wall_component(const Eigen::Vector3f& velocity,
                                      const Eigen::Vector3f& wall_normal) {
  Eigen::Vector3f n{wall_normal(0), 0.0f, wall_normal(2)};
  float norm = n.norm();
  if (norm < 1e-6f) {
    return velocity;
  }
  n /= norm;

  float into = velocity.dot(n);
  if (into >= 0.0f) {
    return velocity;
  }
  return velocity - into * n;
}

}  // namespace

CapsuleMotionSolver::CapsuleMotionSolver(const CapsuleConfig& config)
    : config_(config) {}

std::optional<CapsuleMotionSolver> CapsuleMotionSolver::try_make(
    const CapsuleConfig& config) {
  Result r = validate_capsule_config(config);
  if (!r) {
    spdlog::error("Reject capsule config. {}", r.to_string());
    return std::nullopt;
  }
  return CapsuleMotionSolver(config);
}

const CapsuleConfig& CapsuleMotionSolver::config() const { return config_; }

Result CapsuleMotionSolver::apply_config(const CapsuleConfig& config) {
  Result r = validate_capsule_config(config);
  if (!r) {
    return r;
  }
  config_ = config;
  return Result::ok();
}

Result CapsuleMotionSolver::set_step_height(float step_height) {
  CapsuleConfig c = config_;
  c.step_height = step_height;
  return apply_config(c);
}

Result CapsuleMotionSolver::set_slope_limit(float slope_limit_deg) {
  CapsuleConfig c = config_;
  c.slope_limit_deg = slope_limit_deg;
  return apply_config(c);
}

Result CapsuleMotionSolver::set_skin_width(float skin_width) {
  CapsuleConfig c = config_;
  c.skin_width = skin_width;
  return apply_config(c);
}

Result CapsuleMotionSolver::slide_horizontal(const IShapeQuery& query,
                                             const QueryFilter& filter,
                                             const Eigen::Vector3f& displacement,
                                             CollisionResult& result,
                                             int& bounce_num) const {
  CapsuleShape shape = capsule_shape(config_);
  float cos_slope_limit = std::cos(config_.slope_limit_deg * DEG_TO_RAD);

  Eigen::Vector3f remaining = displacement;
  bounce_num = 0;
  while (bounce_num < config_.max_bounces) {
    float length = remaining.norm();
    if (length < MIN_MOVE) {
      break;
    }
    ++bounce_num;

    Eigen::Vector3f direction = remaining / length;
    std::optional<ShapeHit> hit;
    Result r = query.sweep_capsule(result.position, direction, length, shape,
                                   filter, hit);
    if (!r) {
      return r;
    }

    if (!hit) {
      result.position += remaining;
      return Result::ok();
    }

    float advance = std::max(0.0f, hit->distance - config_.skin_width);
    result.position += advance * direction;
    result.hit_wall = true;
    result.wall_normal = hit->normal;

    const Eigen::Vector3f& n = hit->normal;
    Eigen::Vector3f slide = direction - direction.dot(n) * n;
    // A steep surface must not lift the capsule.
    if (n(1) > 0.0f && n(1) < cos_slope_limit) {
      slide(1) = std::min(slide(1), 0.0f);
    }

    float unconsumed = length - std::min(hit->distance, length);
    remaining = slide * unconsumed * SLIDE_DAMPING;
  }

  if (bounce_num == config_.max_bounces && remaining.norm() >= MIN_MOVE) {
    SPDLOG_DEBUG("solver: bounce cap {} reached, drop {}",
                 config_.max_bounces, remaining);
  }
  return Result::ok();
}

Result CapsuleMotionSolver::move_vertical(const IShapeQuery& query,
                                          const QueryFilter& filter, float dy,
                                          CollisionResult& result) const {
  Eigen::Vector3f direction = Eigen::Vector3f::UnitY();
  if (dy < 0.0f) {
    direction = -direction;
  }
  float length = std::abs(dy);

  std::optional<ShapeHit> hit;
  Result r = query.sweep_capsule(result.position, direction, length,
                                 capsule_shape(config_), filter, hit);
  if (!r) {
    return r;
  }

  if (!hit) {
    result.position(1) += dy;
    return Result::ok();
  }

  float advance = std::max(0.0f, hit->distance - config_.skin_width);
  result.position += advance * direction;
  if (dy > 0.0f) {
    result.velocity(1) = std::min(result.velocity(1), 0.0f);
  } else {
    result.velocity(1) = std::max(result.velocity(1), 0.0f);
  }
  SPDLOG_DEBUG("solver: vertical sweep blocked after {}", advance);
  return Result::ok();
}

Result CapsuleMotionSolver::resolve(const IShapeQuery& query,
                                    const MoveRequest& request,
                                    CollisionResult& result) const {
  const MoveRequest& q = request;
  if (!std::isfinite(q.dt) || q.dt <= 0.0f) {
    return Result::error(ErrorCode::InvalidConfig,
                         "dt must be positive and finite");
  }
  if (!q.position.allFinite() || !q.desired_velocity.allFinite()) {
    return Result::error(ErrorCode::InvalidConfig,
                         "position and velocity must be finite");
  }

  result = CollisionResult{};
  result.position = q.position;
  result.velocity = q.desired_velocity;

  Result r = Result::ok();
  GroundInfo ground;
  Eigen::Vector3f displacement = q.desired_velocity * q.dt;

  if (displacement.norm() < MIN_MOVE) {
    // At rest only the contact state is refreshed.
    r = classify_ground(query, config_, result.position, q.filter, ground);
    if (!r) {
      return query_fail(r);
    }
    result.grounded = ground.grounded;
    result.ground_normal = ground.normal;
    return Result::ok();
  }

  // Horizontal phase.
  Eigen::Vector3f horizontal{displacement(0), 0.0f, displacement(2)};
  Eigen::Vector3f start = result.position;
  int bounce_num = 0;
  r = slide_horizontal(query, q.filter, horizontal, result, bounce_num);
  if (!r) {
    return query_fail(r);
  }

  Eigen::Vector3f achieved = result.position - start;
  Eigen::Vector3f horizontal_velocity{achieved(0) / q.dt, 0.0f,
                                      achieved(2) / q.dt};
  // Walkable contacts, e.g. a ramp walked up, keep the achieved velocity.
  if (result.hit_wall &&
      !is_walkable(result.wall_normal, config_.slope_limit_deg)) {
    horizontal_velocity =
        remove_wall_component(horizontal_velocity, result.wall_normal);
  }
  result.velocity(0) = horizontal_velocity(0);
  result.velocity(2) = horizontal_velocity(2);

  // Vertical phase.
  float dy = displacement(1);
  if (std::abs(dy) > MIN_MOVE) {
    r = move_vertical(query, q.filter, dy, result);
    if (!r) {
      return query_fail(r);
    }
  }

  r = classify_ground(query, config_, result.position, q.filter, ground);
  if (!r) {
    return query_fail(r);
  }
  result.grounded = ground.grounded;
  result.ground_normal = ground.normal;

  if (result.hit_wall && horizontal.norm() > MIN_MOVE) {
    bool is_stepped = false;
    r = try_step_up(query, config_, q.filter, horizontal, result, is_stepped);
    if (!r) {
      return query_fail(r);
    }

    if (is_stepped) {
      result.velocity(0) = q.desired_velocity(0);
      result.velocity(2) = q.desired_velocity(2);

      r = classify_ground(query, config_, result.position, q.filter, ground);
      if (!r) {
        return query_fail(r);
      }
      result.grounded = ground.grounded;
      result.ground_normal = ground.normal;
    }
  }

  SPDLOG_DEBUG("solver: {} -> {}, bounces {}, grounded {}, wall {}, step {}",
               q.position, result.position, bounce_num, result.grounded,
               result.hit_wall, result.can_step);
  return Result::ok();
}

}  // namespace glide
