#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace cronkeeper::config {

std::filesystem::path GetConfigPath();

// Reads ~/.cronkeeper/config.json, then applies CRONKEEPER_* overrides.
Config LoadConfig();

// Same as LoadConfig but with an explicit file; a missing or malformed file
// leaves the defaults in place.
Config LoadConfigFromFile(const std::filesystem::path& path);

std::string ExpandHome(const std::string& path);

}  // namespace cronkeeper::config
