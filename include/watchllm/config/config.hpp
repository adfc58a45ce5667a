#pragma once

#include "watchllm/common/result.hpp"
#include "watchllm/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace watchllm::config {

[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Reads the TOML config (a missing file yields defaults) and applies env overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

void apply_env_overrides(Config &config);

/// Fails with every problem joined by "; ". On success the value holds warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] std::string normalize_base_url(std::string url);

} // namespace watchllm::config
