#include "capsule_config.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace glide {

Result validate_capsule_config(const CapsuleConfig& config) {
  const CapsuleConfig& c = config;

  if (!std::isfinite(c.height) || !std::isfinite(c.radius) ||
      !std::isfinite(c.step_height) || !std::isfinite(c.slope_limit_deg) ||
      !std::isfinite(c.skin_width)) {
    return Result::error(ErrorCode::InvalidConfig,
                         "every capsule parameter must be finite");
  }
  if (c.radius <= 0.0f) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("radius must be positive, got {}", c.radius));
  }
  if (c.height <= 2.0f * c.radius) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("height must be greater than 2 * radius, got height {} "
                    "and radius {}",
                    c.height, c.radius));
  }
  if (c.step_height < 0.0f) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("step height must not be negative, got {}", c.step_height));
  }
  if (c.slope_limit_deg < 0.0f || c.slope_limit_deg >= 90.0f) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("slope limit must be in [0, 90) degrees, got {}",
                    c.slope_limit_deg));
  }
  if (c.skin_width <= 0.0f || c.skin_width >= 0.5f * c.radius) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("skin width must be in (0, radius / 2), got {}",
                    c.skin_width));
  }
  if (c.max_bounces < 1) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("max bounces must be at least 1, got {}", c.max_bounces));
  }

  return Result::ok();
}

CapsuleShape capsule_shape(const CapsuleConfig& config) {
  return CapsuleShape{config.radius, 0.5f * config.height - config.radius};
}

}  // namespace glide
