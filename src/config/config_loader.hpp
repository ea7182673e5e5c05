#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace hoya::config {

// Defaults, then $HOYA_CONFIG or ~/.hoya/config.json, then HOYA_* environment overrides.
Config LoadConfig();

// Same layering with an explicit file. A missing or unparsable file keeps the defaults.
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace hoya::config
