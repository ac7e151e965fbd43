#pragma once

#include "otto/common/result.hpp"
#include "otto/common/toml.hpp"
#include "otto/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace otto::config {

[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);

/// Reads the config file (defaults when it does not exist) and applies environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_file(const std::filesystem::path &path);
[[nodiscard]] Config config_from_toml(const common::TomlDocument &doc);

void apply_env_overrides(Config &config);

/// Hard violations come back as a failure; soft problems as warnings in the value.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Expanded, created runtime home directory (database and task configuration live here).
[[nodiscard]] common::Result<std::filesystem::path> resolve_home(const Config &config);
[[nodiscard]] std::filesystem::path database_path(const std::filesystem::path &home);

} // namespace otto::config
