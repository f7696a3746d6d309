#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace toolsmith::config {

/// Directory holding config.toml and .env: ~/.toolsmith unless --config or
/// TOOLSMITH_CONFIG_PATH points elsewhere. Created on demand.
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Absolute tool store directory: runtime.tools_dir resolved against the config directory.
[[nodiscard]] common::Result<std::filesystem::path> tools_dir(const Config &config);

/// Missing keys keep their defaults; mistyped or out-of-range values are a ParseError.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// Loads .env files, then applies TOOLSMITH_TOOLS_DIR, TOOLSMITH_GATEWAY_PORT and
/// TOOLSMITH_OBSERVABILITY on top of the file values.
void apply_env_overrides(Config &config);

} // namespace toolsmith::config
