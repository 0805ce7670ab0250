#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace runbox::config {

// Defaults, then the JSON file, then environment overrides.
Config LoadConfig();

// Loads from an explicit file; environment overrides still apply.
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

std::filesystem::path DefaultConfigPath();

}  // namespace runbox::config
