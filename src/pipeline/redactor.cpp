#include "watchllm/pipeline/redactor.hpp"

#include "watchllm/common/json.hpp"

#include <array>
#include <regex>

namespace watchllm::pipeline {

namespace {

struct RedactionPattern {
  const char *label;
  std::regex regex;
  const char *replacement;
};

// Applied in order; email first so digits inside addresses are not split.
const std::array<RedactionPattern, 4> &redaction_patterns() {
  static const std::array<RedactionPattern, 4> patterns = {
      RedactionPattern{"email",
                       std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"),
                       "[REDACTED_EMAIL]"},
      RedactionPattern{"credit card", std::regex(R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)"),
                       "[REDACTED_CC]"},
      RedactionPattern{"ssn", std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)"), "[REDACTED_SSN]"},
      RedactionPattern{"phone",
                       std::regex(R"(\b(?:\+?1[-.\s])?\(?\d{3}\)?[-.\s]\d{3}[-.\s]\d{4}\b)"),
                       "[REDACTED_PHONE]"},
  };
  return patterns;
}

std::string scrub_text(std::string text) {
  for (const auto &pattern : redaction_patterns()) {
    text = std::regex_replace(text, pattern.regex, pattern.replacement);
  }
  return text;
}

// Patterns only see decoded string values, so escapes and numbers stay intact.
common::JsonValue scrub_value(const common::JsonValue &value) {
  switch (value.type()) {
  case common::JsonValue::Type::String:
    return common::JsonValue(scrub_text(value.as_string()));
  case common::JsonValue::Type::Array: {
    common::JsonValue out = common::JsonValue::array();
    for (const auto &item : value.items()) {
      out.push_back(scrub_value(item));
    }
    return out;
  }
  case common::JsonValue::Type::Object: {
    common::JsonValue out = common::JsonValue::object();
    for (const auto &member : value.members()) {
      out.set(member.key, scrub_value(member.value));
    }
    return out;
  }
  default:
    return value;
  }
}

} // namespace

RedactionResult Redactor::redact(const std::string &payload) const {
  if (!enabled_) {
    return RedactionResult{.payload = payload, .warning = std::nullopt};
  }

  try {
    auto document = common::JsonValue::parse(payload);
    if (!document.ok()) {
      // Not a JSON document: scrub it as plain text.
      return RedactionResult{.payload = scrub_text(payload), .warning = std::nullopt};
    }
    return RedactionResult{.payload = scrub_value(document.value()).dump(),
                           .warning = std::nullopt};
  } catch (const std::regex_error &error) {
    return RedactionResult{.payload = payload,
                           .warning = std::string("pattern matching failed: ") + error.what()};
  }
}

} // namespace watchllm::pipeline
