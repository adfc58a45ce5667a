#pragma once

#include "watchllm/instrumentation/provider.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace watchllm::instrumentation {

/// Provider-specific, best-effort extraction. Missing fields yield empty or
/// zero values. Capability interfaces on the response take precedence over
/// the provider's JSON shape.
class ProviderAdapter {
public:
  virtual ~ProviderAdapter() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string extract_prompt(const ProviderCall &call) const = 0;
  [[nodiscard]] virtual std::string extract_text(const ProviderResponse &response) const;
  [[nodiscard]] virtual TokenUsage extract_usage(const ProviderResponse &response) const;
  [[nodiscard]] virtual common::JsonValue
  extract_metadata(const ProviderResponse &response) const;

protected:
  [[nodiscard]] virtual std::string text_from_json(const common::JsonValue &body) const = 0;
  [[nodiscard]] virtual TokenUsage usage_from_json(const common::JsonValue &body) const = 0;
  [[nodiscard]] virtual common::JsonValue metadata_from_json(const common::JsonValue &body) const;
};

class OpenAiAdapter final : public ProviderAdapter {
public:
  [[nodiscard]] std::string_view name() const override { return "openai"; }
  [[nodiscard]] std::string extract_prompt(const ProviderCall &call) const override;

protected:
  [[nodiscard]] std::string text_from_json(const common::JsonValue &body) const override;
  [[nodiscard]] TokenUsage usage_from_json(const common::JsonValue &body) const override;
  [[nodiscard]] common::JsonValue metadata_from_json(const common::JsonValue &body) const override;
};

class AnthropicAdapter final : public ProviderAdapter {
public:
  [[nodiscard]] std::string_view name() const override { return "anthropic"; }
  [[nodiscard]] std::string extract_prompt(const ProviderCall &call) const override;

protected:
  [[nodiscard]] std::string text_from_json(const common::JsonValue &body) const override;
  [[nodiscard]] TokenUsage usage_from_json(const common::JsonValue &body) const override;
  [[nodiscard]] common::JsonValue metadata_from_json(const common::JsonValue &body) const override;
};

/// "openai" or "anthropic" (case-insensitive); nullptr otherwise.
[[nodiscard]] std::shared_ptr<ProviderAdapter> make_adapter(std::string_view provider);

/// Renders chat messages as `[role]: content` lines. Multi-part content keeps
/// only its text parts, joined by a space.
[[nodiscard]] std::string render_messages(const common::JsonValue &messages);

} // namespace watchllm::instrumentation
