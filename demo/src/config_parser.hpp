#pragma once

#include <optional>
#include <string>

#include "config.hpp"

/**
 * @brief Load a JSON scenario file.
 *
 * Every section is optional and falls back to the defaults of config.hpp, but
 * present fields must have the right type and range.
 *
 * @return The scenario, or std::nullopt with the reason logged.
 */
std::optional<ScenarioConfig> parse_config(const std::string& path);
