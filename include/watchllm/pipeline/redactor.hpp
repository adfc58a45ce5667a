#pragma once

#include <optional>
#include <string>

namespace watchllm::pipeline {

struct RedactionResult {
  std::string payload;
  /// Set when scrubbing failed and `payload` is the unmodified input.
  std::optional<std::string> warning;
};

/// Scrubs PII from a serialized event: email addresses, card numbers, US SSNs
/// and phone numbers are replaced by `[REDACTED_*]` markers. Patterns apply to
/// every decoded string value, so the output is still valid JSON; input that
/// does not parse is scrubbed as plain text. Idempotent.
class Redactor {
public:
  explicit Redactor(bool enabled = true) : enabled_(enabled) {}

  [[nodiscard]] RedactionResult redact(const std::string &payload) const;
  [[nodiscard]] bool enabled() const { return enabled_; }

private:
  bool enabled_;
};

} // namespace watchllm::pipeline
