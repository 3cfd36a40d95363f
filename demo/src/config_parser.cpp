#include "config_parser.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace {

bool get_vec3(const json& j, const char* key, std::array<float, 3>& out,
              std::string& err) {
  if (!j.contains(key)) {
    return true;
  }
  const json& v = j[key];
  if (!v.is_array() || v.size() != 3) {
    err = std::string(key) + " must be [x, y, z]";
    return false;
  }
  for (int i = 0; i < 3; ++i) {
    if (!v[i].is_number()) {
      err = std::string(key) + " must be [x, y, z]";
      return false;
    }
  }
  out = {v[0].get<float>(), v[1].get<float>(), v[2].get<float>()};
  return true;
}

bool get_float(const json& j, const char* key, float& out, std::string& err) {
  if (!j.contains(key)) {
    return true;
  }
  if (!j[key].is_number()) {
    err = std::string(key) + " must be number";
    return false;
  }
  out = j[key].get<float>();
  return true;
}

bool get_int(const json& j, const char* key, int& out, std::string& err) {
  if (!j.contains(key)) {
    return true;
  }
  if (!j[key].is_number_integer()) {
    err = std::string(key) + " must be integer";
    return false;
  }
  out = j[key].get<int>();
  return true;
}

bool parse_global(const json& j, config::Global& out, std::string& err) {
  if (!j.is_object()) {
    err = "global must be object";
    return false;
  }
  if (!get_float(j, "dt", out.dt, err)) return false;
  if (!get_float(j, "gravity", out.gravity, err)) return false;
  if (!get_int(j, "ticks", out.ticks, err)) return false;

  if (!(out.dt > 0.0f)) {
    err = "global.dt > 0";
    return false;
  }
  if (out.ticks < 1) {
    err = "global.ticks >= 1";
    return false;
  }
  return true;
}

bool parse_collision(const json& j, config::Collision& out, std::string& err) {
  if (!j.is_object()) {
    err = "collision must be object";
    return false;
  }
  if (j.contains("enabled")) {
    if (!j["enabled"].is_boolean()) {
      err = "collision.enabled must be boolean";
      return false;
    }
    out.enabled = j["enabled"].get<bool>();
  }
  return get_int(j, "group", out.group, err);
}

bool parse_capsule(const json& j, glide::CapsuleConfig& out, std::string& err) {
  if (!j.is_object()) {
    err = "capsule must be object";
    return false;
  }
  if (!get_float(j, "height", out.height, err)) return false;
  if (!get_float(j, "radius", out.radius, err)) return false;
  if (!get_float(j, "step_height", out.step_height, err)) return false;
  if (!get_float(j, "slope_limit_deg", out.slope_limit_deg, err)) return false;
  if (!get_float(j, "skin_width", out.skin_width, err)) return false;
  if (!get_int(j, "max_bounces", out.max_bounces, err)) return false;
  // Range checks happen in glide when the character is created.
  return true;
}

bool parse_character(const json& j, config::Character& out, std::string& err) {
  if (!j.is_object()) {
    err = "character must be object";
    return false;
  }
  if (j.contains("capsule") && !parse_capsule(j["capsule"], out.capsule, err)) {
    return false;
  }
  if (j.contains("collision") &&
      !parse_collision(j["collision"], out.collision, err)) {
    return false;
  }
  if (!get_vec3(j, "position", out.position, err)) return false;
  if (!get_vec3(j, "velocity", out.velocity, err)) return false;
  if (!get_float(j, "jump_speed", out.jump_speed, err)) return false;

  if (j.contains("jump_at")) {
    if (!j["jump_at"].is_array()) {
      err = "character.jump_at must be int array";
      return false;
    }
    for (const auto& t : j["jump_at"]) {
      if (!t.is_number_integer()) {
        err = "character.jump_at must be int array";
        return false;
      }
      out.jump_at.push_back(t.get<int>());
    }
  }
  return true;
}

bool parse_collider(const json& j, config::Collider& out, std::string& err) {
  if (!j.is_object()) {
    err = "colliders[i] must be object";
    return false;
  }
  if (!j.contains("type") || !j["type"].is_string()) {
    err = "colliders[i].type must be string";
    return false;
  }

  std::string t = j["type"].get<std::string>();
  if (t == "box") {
    out.type = config::ColliderType::Box;
  } else if (t == "sphere") {
    out.type = config::ColliderType::Sphere;
  } else if (t == "plane") {
    out.type = config::ColliderType::Plane;
  } else if (t == "capsule") {
    out.type = config::ColliderType::Capsule;
  } else {
    err = "colliders[i].type must be one of box/sphere/plane/capsule";
    return false;
  }

  if (j.contains("name") && j["name"].is_string()) {
    out.name = j["name"].get<std::string>();
  }
  if (j.contains("collision") &&
      !parse_collision(j["collision"], out.collision, err)) {
    return false;
  }
  if (!get_vec3(j, "center", out.center, err)) return false;
  if (!get_vec3(j, "half_extent", out.half_extent, err)) return false;
  if (!get_vec3(j, "normal", out.normal, err)) return false;
  if (!get_float(j, "offset", out.offset, err)) return false;
  if (!get_float(j, "radius", out.radius, err)) return false;
  if (!get_float(j, "height", out.height, err)) return false;
  return true;
}

}  // namespace

std::optional<ScenarioConfig> parse_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("Cannot open scenario file {}.", path);
    return std::nullopt;
  }

  json root;
  try {
    root = json::parse(in, nullptr, true, true);
  } catch (const json::parse_error& e) {
    spdlog::error("Fail to parse scenario {}. Reason: {}", path, e.what());
    return std::nullopt;
  }

  if (!root.is_object()) {
    spdlog::error("Scenario {} must be a JSON object.", path);
    return std::nullopt;
  }

  ScenarioConfig config;
  std::string err;
  bool is_ok = true;
  if (root.contains("global")) {
    is_ok = is_ok && parse_global(root["global"], config.global, err);
  }
  if (root.contains("character")) {
    is_ok = is_ok && parse_character(root["character"], config.character, err);
  }
  if (is_ok && root.contains("colliders")) {
    if (!root["colliders"].is_array()) {
      err = "colliders must be array";
      is_ok = false;
    } else {
      for (const auto& c : root["colliders"]) {
        config::Collider collider;
        if (!parse_collider(c, collider, err)) {
          is_ok = false;
          break;
        }
        config.colliders.push_back(std::move(collider));
      }
    }
  }

  if (!is_ok) {
    spdlog::error("Invalid scenario {}. Reason: {}", path, err);
    return std::nullopt;
  }
  return config;
}
