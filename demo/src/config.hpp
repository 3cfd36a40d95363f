#pragma once

#include <array>
#include <glide/glide.hpp>
#include <string>
#include <vector>

namespace config {

//********************************/
//*          Global             */
//********************************/
struct Global {
  float dt = 1.0f / 60.0f;
  // Vertical acceleration applied to the character every tick.
  float gravity = -9.81f;
  int ticks = 120;
};

//********************************/
//*          Collision           */
//********************************/
struct Collision {
  bool enabled = true;
  int group = 0;
};

//********************************/
//*          Collider            */
//********************************/
enum class ColliderType { Box, Sphere, Plane, Capsule };

// Only the fields of `type` are read.
struct Collider {
  ColliderType type = ColliderType::Box;
  std::string name;
  Collision collision;
  std::array<float, 3> center{0.0f, 0.0f, 0.0f};
  std::array<float, 3> half_extent{0.5f, 0.5f, 0.5f};
  std::array<float, 3> normal{0.0f, 1.0f, 0.0f};
  float offset = 0.0f;
  float radius = 0.5f;
  float height = 1.8f;
};

//********************************/
//*          Character           */
//********************************/
struct Character {
  glide::CapsuleConfig capsule;
  Collision collision;
  std::array<float, 3> position{0.0f, 0.92f, 0.0f};
  // Horizontal walk velocity, applied every tick.
  std::array<float, 3> velocity{0.0f, 0.0f, 0.0f};
  float jump_speed = 5.0f;
  // Ticks at which a jump is requested. Ignored while airborne.
  std::vector<int> jump_at;
};

}  // namespace config

struct ScenarioConfig {
  config::Global global;
  config::Character character;
  std::vector<config::Collider> colliders;
};
