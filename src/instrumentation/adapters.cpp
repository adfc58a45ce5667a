#include "watchllm/instrumentation/adapters.hpp"

#include "watchllm/common/strings.hpp"

#include <vector>

namespace watchllm::instrumentation {

namespace {

using common::JsonValue;

std::string string_member(const JsonValue &object, const std::string_view key) {
  const JsonValue *value = object.find(key);
  return value != nullptr ? value->as_string() : std::string();
}

std::int64_t int_member(const JsonValue &object, const std::string_view key) {
  const JsonValue *value = object.find(key);
  return value != nullptr ? value->as_int() : 0;
}

std::string content_text(const JsonValue &content) {
  if (content.is_string()) {
    return content.as_string();
  }
  std::vector<std::string> parts;
  for (const auto &part : content.items()) {
    if (part.is_string()) {
      parts.push_back(part.as_string());
    } else if (string_member(part, "type") == "text") {
      parts.push_back(string_member(part, "text"));
    }
  }
  return common::join(parts, " ");
}

void copy_if_present(const JsonValue &from, const std::string_view key, JsonValue &to) {
  if (const JsonValue *value = from.find(key); value != nullptr && !value->is_null()) {
    to.set(std::string(key), *value);
  }
}

} // namespace

std::string render_messages(const JsonValue &messages) {
  std::vector<std::string> lines;
  for (const auto &message : messages.items()) {
    const JsonValue *content = message.find("content");
    lines.push_back("[" + string_member(message, "role") +
                    "]: " + (content != nullptr ? content_text(*content) : std::string()));
  }
  return common::join(lines, "\n");
}

std::string ProviderAdapter::extract_text(const ProviderResponse &response) const {
  if (const auto *capable = dynamic_cast<const HasTextContent *>(&response); capable != nullptr) {
    return capable->text_content();
  }
  if (const auto *json = dynamic_cast<const JsonResponse *>(&response); json != nullptr) {
    return text_from_json(json->body());
  }
  return {};
}

TokenUsage ProviderAdapter::extract_usage(const ProviderResponse &response) const {
  if (const auto *capable = dynamic_cast<const HasUsageCounts *>(&response); capable != nullptr) {
    return capable->usage_counts();
  }
  if (const auto *json = dynamic_cast<const JsonResponse *>(&response); json != nullptr) {
    return usage_from_json(json->body());
  }
  return {};
}

JsonValue ProviderAdapter::extract_metadata(const ProviderResponse &response) const {
  if (const auto *capable = dynamic_cast<const HasResponseMetadata *>(&response);
      capable != nullptr) {
    return capable->response_metadata();
  }
  if (const auto *json = dynamic_cast<const JsonResponse *>(&response); json != nullptr) {
    return metadata_from_json(json->body());
  }
  return JsonValue::object();
}

JsonValue ProviderAdapter::metadata_from_json(const JsonValue &body) const {
  JsonValue metadata = JsonValue::object();
  copy_if_present(body, "id", metadata);
  copy_if_present(body, "model", metadata);
  return metadata;
}

std::string OpenAiAdapter::extract_prompt(const ProviderCall &call) const {
  if (const JsonValue *messages = call.arguments.find("messages"); messages != nullptr) {
    return render_messages(*messages);
  }
  // Legacy completions and embeddings take a bare prompt/input.
  if (const JsonValue *prompt = call.arguments.find("prompt"); prompt != nullptr) {
    return content_text(*prompt);
  }
  if (const JsonValue *input = call.arguments.find("input"); input != nullptr) {
    return content_text(*input);
  }
  return {};
}

std::string OpenAiAdapter::text_from_json(const JsonValue &body) const {
  const JsonValue *choices = body.find("choices");
  if (choices == nullptr) {
    return {};
  }
  const JsonValue *first = choices->at(0);
  if (first == nullptr) {
    return {};
  }
  if (const JsonValue *message = first->find("message"); message != nullptr) {
    if (const JsonValue *content = message->find("content"); content != nullptr) {
      return content_text(*content);
    }
    return {};
  }
  return string_member(*first, "text");
}

TokenUsage OpenAiAdapter::usage_from_json(const JsonValue &body) const {
  const JsonValue *usage = body.find("usage");
  if (usage == nullptr) {
    return {};
  }
  TokenUsage counts{.input = int_member(*usage, "prompt_tokens"),
                    .output = int_member(*usage, "completion_tokens"),
                    .total = int_member(*usage, "total_tokens")};
  if (counts.total == 0) {
    counts.total = counts.input + counts.output;
  }
  return counts;
}

JsonValue OpenAiAdapter::metadata_from_json(const JsonValue &body) const {
  JsonValue metadata = ProviderAdapter::metadata_from_json(body);
  if (const JsonValue *choices = body.find("choices"); choices != nullptr) {
    if (const JsonValue *first = choices->at(0); first != nullptr) {
      copy_if_present(*first, "finish_reason", metadata);
    }
  }
  return metadata;
}

std::string AnthropicAdapter::extract_prompt(const ProviderCall &call) const {
  std::vector<std::string> sections;
  if (const JsonValue *system = call.arguments.find("system"); system != nullptr) {
    const std::string text = content_text(*system);
    if (!text.empty()) {
      sections.push_back("[system]: " + text);
    }
  }
  if (const JsonValue *messages = call.arguments.find("messages"); messages != nullptr) {
    const std::string rendered = render_messages(*messages);
    if (!rendered.empty()) {
      sections.push_back(rendered);
    }
  }
  return common::join(sections, "\n");
}

std::string AnthropicAdapter::text_from_json(const JsonValue &body) const {
  std::string text;
  if (const JsonValue *content = body.find("content"); content != nullptr) {
    for (const auto &block : content->items()) {
      if (string_member(block, "type") == "text") {
        text += string_member(block, "text");
      }
    }
  }
  return text;
}

TokenUsage AnthropicAdapter::usage_from_json(const JsonValue &body) const {
  const JsonValue *usage = body.find("usage");
  if (usage == nullptr) {
    return {};
  }
  TokenUsage counts{.input = int_member(*usage, "input_tokens"),
                    .output = int_member(*usage, "output_tokens"),
                    .total = 0};
  counts.total = counts.input + counts.output;
  return counts;
}

JsonValue AnthropicAdapter::metadata_from_json(const JsonValue &body) const {
  JsonValue metadata = ProviderAdapter::metadata_from_json(body);
  copy_if_present(body, "stop_reason", metadata);
  return metadata;
}

std::shared_ptr<ProviderAdapter> make_adapter(const std::string_view provider) {
  const std::string normalized = common::to_lower(common::trim(std::string(provider)));
  if (normalized == "openai") {
    return std::make_shared<OpenAiAdapter>();
  }
  if (normalized == "anthropic") {
    return std::make_shared<AnthropicAdapter>();
  }
  return nullptr;
}

} // namespace watchllm::instrumentation
