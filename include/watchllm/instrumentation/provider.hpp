#pragma once

#include "watchllm/common/json.hpp"

#include <cstdint>
#include <string>

namespace watchllm::instrumentation {

/// Input of an intercepted provider method: the model plus the request
/// arguments as the provider SDK would serialize them (`messages`, `system`, ...).
struct ProviderCall {
  std::string model;
  common::JsonValue arguments = common::JsonValue::object();
};

/// Opaque result of a provider method. Typed SDK responses expose data through
/// the capability interfaces below; raw HTTP responses use JsonResponse.
class ProviderResponse {
public:
  virtual ~ProviderResponse() = default;
};

struct TokenUsage {
  std::int64_t input = 0;
  std::int64_t output = 0;
  std::int64_t total = 0;
};

class HasTextContent {
public:
  virtual ~HasTextContent() = default;
  [[nodiscard]] virtual std::string text_content() const = 0;
};

class HasUsageCounts {
public:
  virtual ~HasUsageCounts() = default;
  [[nodiscard]] virtual TokenUsage usage_counts() const = 0;
};

class HasResponseMetadata {
public:
  virtual ~HasResponseMetadata() = default;
  [[nodiscard]] virtual common::JsonValue response_metadata() const = 0;
};

class JsonResponse final : public ProviderResponse {
public:
  explicit JsonResponse(common::JsonValue body) : body_(std::move(body)) {}

  [[nodiscard]] const common::JsonValue &body() const { return body_; }

private:
  common::JsonValue body_;
};

} // namespace watchllm::instrumentation
