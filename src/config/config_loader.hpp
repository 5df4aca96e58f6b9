#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace shellpilot::config {

std::filesystem::path GetConfigPath();

// Defaults, then ~/.shellpilot/config.json, then SHELLPILOT_* environment.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace shellpilot::config
