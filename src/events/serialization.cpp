#include "watchllm/events/serialization.hpp"

namespace watchllm::events {

namespace {

using common::JsonValue;

JsonValue optional_string(const std::optional<std::string> &value) {
  return value.has_value() ? JsonValue(*value) : JsonValue();
}

JsonValue optional_json(const std::optional<JsonValue> &value) {
  return value.has_value() ? *value : JsonValue();
}

JsonValue map_or_empty(const JsonValue &value) {
  return value.is_null() ? JsonValue::object() : value;
}

JsonValue client_json(const ClientInfo &client) {
  return JsonValue::object({
      {"sdk_name", client.sdk_name},
      {"sdk_version", client.sdk_version},
      {"platform", client.platform},
      {"hostname", client.hostname},
  });
}

JsonValue envelope_json(const Envelope &env, const EventType type) {
  return JsonValue::object({
      {"event_id", env.event_id},
      {"project_id", env.project_id},
      {"run_id", env.run_id},
      {"timestamp", env.timestamp},
      {"user_id", optional_string(env.user_id)},
      {"tags", JsonValue::string_array(env.tags)},
      {"release", optional_string(env.release)},
      {"env", env.env},
      {"client", client_json(env.client)},
      {"event_type", to_string(type)},
  });
}

void append_fields(JsonValue &out, const PromptCallEvent &evt) {
  JsonValue tool_calls = JsonValue::array();
  for (const auto &record : evt.tool_calls) {
    tool_calls.push_back(to_json(record));
  }
  out.set("prompt", evt.prompt);
  out.set("prompt_template_id", optional_string(evt.prompt_template_id));
  out.set("model", evt.model);
  out.set("model_version", optional_string(evt.model_version));
  out.set("tokens_input", evt.tokens_input);
  out.set("tokens_output", evt.tokens_output);
  out.set("cost_estimate_usd", evt.cost_estimate_usd);
  out.set("response", evt.response);
  out.set("response_metadata", map_or_empty(evt.response_metadata));
  out.set("tool_calls", std::move(tool_calls));
  out.set("status", to_string(evt.status));
  out.set("error", optional_json(evt.error));
  out.set("latency_ms", evt.latency_ms);
}

void append_fields(JsonValue &out, const AgentStepEvent &evt) {
  out.set("step_number", evt.step_number);
  out.set("step_name", evt.step_name);
  out.set("step_type", to_string(evt.step_type));
  out.set("input_data", map_or_empty(evt.input_data));
  out.set("output_data", map_or_empty(evt.output_data));
  out.set("reasoning", optional_string(evt.reasoning));
  out.set("context", map_or_empty(evt.context));
  out.set("latency_ms", evt.latency_ms);
  out.set("status", to_string(evt.status));
  out.set("error", optional_json(evt.error));
}

void append_fields(JsonValue &out, const ErrorEvent &evt) {
  out.set("error", map_or_empty(evt.error));
  out.set("context", map_or_empty(evt.context));
  out.set("stack_trace", optional_string(evt.stack_trace));
}

void append_fields(JsonValue &out, const AssertionFailedEvent &evt) {
  out.set("assertion_name", evt.assertion_name);
  out.set("assertion_type", to_string(evt.assertion_type));
  out.set("expected", evt.expected);
  out.set("actual", evt.actual);
  out.set("severity", to_string(evt.severity));
}

void append_fields(JsonValue &out, const HallucinationDetectedEvent &evt) {
  out.set("detection_method", to_string(evt.detection_method));
  out.set("confidence_score", evt.confidence_score);
  out.set("flagged_content", evt.flagged_content);
  out.set("ground_truth", optional_string(evt.ground_truth));
  out.set("recommendations", JsonValue::string_array(evt.recommendations));
}

void append_fields(JsonValue &out, const PerformanceAlertEvent &evt) {
  out.set("alert_type", to_string(evt.alert_type));
  out.set("threshold", evt.threshold);
  out.set("actual_value", evt.actual_value);
  out.set("window_minutes", evt.window_minutes);
  out.set("affected_models", JsonValue::string_array(evt.affected_models));
}

} // namespace

JsonValue to_json(const ToolCallRecord &record) {
  return JsonValue::object({
      {"tool_name", record.tool_name},
      {"tool_id", optional_string(record.tool_id)},
      {"input", map_or_empty(record.input)},
      {"output", map_or_empty(record.output)},
      {"latency_ms", record.latency_ms},
      {"status", to_string(record.status)},
      {"error", optional_json(record.error)},
  });
}

JsonValue to_json(const Event &event) {
  JsonValue out = envelope_json(envelope(event), event_type(event));
  std::visit([&out](const auto &evt) { append_fields(out, evt); }, event);
  return out;
}

std::string serialize(const Event &event) { return to_json(event).dump(); }

} // namespace watchllm::events
