#pragma once

#include "watchllm/common/json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace watchllm::events {

enum class EventType {
  PromptCall,
  ToolCall,
  AgentStep,
  Error,
  AssertionFailed,
  HallucinationDetected,
  CostThresholdExceeded,
  PerformanceAlert,
};

enum class Status { Success, Error, Timeout, AssertionFailed, Warning };

enum class StepType { Reasoning, ToolCall, Validation, Output };

enum class AssertionType { ResponseFormat, ContentFilter, SafetyCheck, Custom };

enum class DetectionMethod { Heuristic, ModelEnsemble, GroundTruthVerification };

enum class AlertType { CostSpike, LatencySpike, ErrorRateSpike, TokenLimit };

enum class Severity { Low, Medium, High, Critical };

[[nodiscard]] std::string_view to_string(EventType value);
[[nodiscard]] std::string_view to_string(Status value);
[[nodiscard]] std::string_view to_string(StepType value);
[[nodiscard]] std::string_view to_string(AssertionType value);
[[nodiscard]] std::string_view to_string(DetectionMethod value);
[[nodiscard]] std::string_view to_string(AlertType value);
[[nodiscard]] std::string_view to_string(Severity value);

[[nodiscard]] std::optional<Status> parse_status(std::string_view tag);
[[nodiscard]] std::optional<EventType> parse_event_type(std::string_view tag);

struct ClientInfo {
  std::string sdk_name = "watchllm-cpp";
  std::string sdk_version = "0.1.0";
  std::string platform = "cpp";
  std::string hostname = "unknown";
};

/// Descriptor stamped on every event; hostname is resolved once per process.
[[nodiscard]] const ClientInfo &default_client_info();

/// Fields shared by every event kind.
struct Envelope {
  std::string event_id;
  std::string project_id;
  std::string run_id;
  std::string timestamp;
  std::optional<std::string> user_id;
  std::vector<std::string> tags;
  std::optional<std::string> release;
  std::string env = "development";
  ClientInfo client;
};

struct ToolCallRecord {
  std::string tool_name;
  std::optional<std::string> tool_id;
  common::JsonValue input = common::JsonValue::object();
  common::JsonValue output = common::JsonValue::object();
  std::int64_t latency_ms = 0;
  Status status = Status::Success;
  std::optional<common::JsonValue> error;
};

struct PromptCallEvent {
  Envelope envelope;
  std::string prompt;
  std::optional<std::string> prompt_template_id;
  std::string model;
  std::optional<std::string> model_version;
  std::int64_t tokens_input = 0;
  std::int64_t tokens_output = 0;
  double cost_estimate_usd = 0.0;
  std::string response;
  common::JsonValue response_metadata = common::JsonValue::object();
  std::vector<ToolCallRecord> tool_calls;
  Status status = Status::Success;
  std::optional<common::JsonValue> error;
  std::int64_t latency_ms = 0;
};

struct AgentStepEvent {
  Envelope envelope;
  std::int64_t step_number = 0;
  std::string step_name;
  StepType step_type = StepType::Reasoning;
  common::JsonValue input_data = common::JsonValue::object();
  common::JsonValue output_data = common::JsonValue::object();
  std::optional<std::string> reasoning;
  common::JsonValue context = common::JsonValue::object();
  std::int64_t latency_ms = 0;
  Status status = Status::Success;
  std::optional<common::JsonValue> error;
};

struct ErrorEvent {
  Envelope envelope;
  /// {message, type, stack}
  common::JsonValue error = common::JsonValue::object();
  common::JsonValue context = common::JsonValue::object();
  std::optional<std::string> stack_trace;
};

struct AssertionFailedEvent {
  Envelope envelope;
  std::string assertion_name;
  AssertionType assertion_type = AssertionType::Custom;
  common::JsonValue expected;
  common::JsonValue actual;
  Severity severity = Severity::Medium;
};

struct HallucinationDetectedEvent {
  Envelope envelope;
  DetectionMethod detection_method = DetectionMethod::Heuristic;
  double confidence_score = 0.0;
  std::string flagged_content;
  std::optional<std::string> ground_truth;
  std::vector<std::string> recommendations;
};

struct PerformanceAlertEvent {
  Envelope envelope;
  AlertType alert_type = AlertType::CostSpike;
  double threshold = 0.0;
  double actual_value = 0.0;
  std::int64_t window_minutes = 0;
  std::vector<std::string> affected_models;
};

using Event = std::variant<PromptCallEvent, AgentStepEvent, ErrorEvent, AssertionFailedEvent,
                           HallucinationDetectedEvent, PerformanceAlertEvent>;

[[nodiscard]] EventType event_type(const Event &event);
[[nodiscard]] const Envelope &envelope(const Event &event);
[[nodiscard]] Envelope &envelope(Event &event);

} // namespace watchllm::events
