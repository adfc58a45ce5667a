#pragma once

#include "watchllm/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace watchllm::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char separator);

/// Percent-encode everything outside the RFC 3986 unreserved set.
[[nodiscard]] std::string url_encode_component(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();

/// Expand a leading `~` and `$VAR` / `${VAR}` references.
[[nodiscard]] std::string expand_path(std::string value);

} // namespace watchllm::common
