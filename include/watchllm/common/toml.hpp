#pragma once

#include "watchllm/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace watchllm::common {

/// Flat view of a TOML document: `[section]` keys are stored as `section.key`.
/// Values keep their raw text; typed getters convert on demand.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace watchllm::common
