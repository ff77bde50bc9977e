#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace evalbox::config {

// Defaults, then ~/.evalbox/config.json, then EVALBOX_* environment variables.
Config LoadConfig();

// Defaults overlaid with a single JSON file; a missing or malformed file keeps the defaults.
Config LoadConfigFromFile(const std::filesystem::path& path);

std::filesystem::path GetConfigPath();

}  // namespace evalbox::config
