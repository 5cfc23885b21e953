#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codeteam::config {

std::filesystem::path GetConfigPath();

// Applies the recognized keys of data onto config; unknown or mistyped keys are ignored.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

// Reads ~/.codeteam/config.json, then CODETEAM_* environment overrides.
Config LoadConfig();

}  // namespace codeteam::config
