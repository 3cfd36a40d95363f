#pragma once

#include <string>

#include "config.hpp"

/**
 * @brief Drive one character through a scenario and export its trajectory.
 * @param config Scenario description including global, character and
 * collider settings.
 * @param out_path Destination CSV path, one row per tick.
 * @return False if the scenario could not be built or a tick failed.
 */
bool headless_run(const ScenarioConfig& config, const std::string& out_path);
