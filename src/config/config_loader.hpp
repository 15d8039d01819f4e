#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace codebox::config {

std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file at `path` (when present), then CODEBOX_* variables.
Config LoadConfig(const std::filesystem::path& path);
Config LoadConfig();

}  // namespace codebox::config
