#pragma once

#include "clawlink/common/result.hpp"
#include "clawlink/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace clawlink::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Loads the config file if present (defaults otherwise), then applies env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Returns the list of problems; empty means valid.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace clawlink::config
