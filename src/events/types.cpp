#include "watchllm/events/types.hpp"

#include "watchllm/common/ids.hpp"

#include <array>
#include <utility>

namespace watchllm::events {

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 8> EVENT_TYPE_TAGS = {{
    {EventType::PromptCall, "prompt_call"},
    {EventType::ToolCall, "tool_call"},
    {EventType::AgentStep, "agent_step"},
    {EventType::Error, "error"},
    {EventType::AssertionFailed, "assertion_failed"},
    {EventType::HallucinationDetected, "hallucination_detected"},
    {EventType::CostThresholdExceeded, "cost_threshold_exceeded"},
    {EventType::PerformanceAlert, "performance_alert"},
}};

constexpr std::array<std::pair<Status, std::string_view>, 5> STATUS_TAGS = {{
    {Status::Success, "success"},
    {Status::Error, "error"},
    {Status::Timeout, "timeout"},
    {Status::AssertionFailed, "assertion_failed"},
    {Status::Warning, "warning"},
}};

template <typename Enum, std::size_t N>
std::string_view lookup_tag(const std::array<std::pair<Enum, std::string_view>, N> &table,
                            const Enum value) {
  for (const auto &[candidate, tag] : table) {
    if (candidate == value) {
      return tag;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> lookup_value(const std::array<std::pair<Enum, std::string_view>, N> &table,
                                 const std::string_view tag) {
  for (const auto &[candidate, candidate_tag] : table) {
    if (candidate_tag == tag) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace

std::string_view to_string(const EventType value) { return lookup_tag(EVENT_TYPE_TAGS, value); }

std::string_view to_string(const Status value) { return lookup_tag(STATUS_TAGS, value); }

std::string_view to_string(const StepType value) {
  switch (value) {
  case StepType::Reasoning:
    return "reasoning";
  case StepType::ToolCall:
    return "tool_call";
  case StepType::Validation:
    return "validation";
  case StepType::Output:
    return "output";
  }
  return "reasoning";
}

std::string_view to_string(const AssertionType value) {
  switch (value) {
  case AssertionType::ResponseFormat:
    return "response_format";
  case AssertionType::ContentFilter:
    return "content_filter";
  case AssertionType::SafetyCheck:
    return "safety_check";
  case AssertionType::Custom:
    return "custom";
  }
  return "custom";
}

std::string_view to_string(const DetectionMethod value) {
  switch (value) {
  case DetectionMethod::Heuristic:
    return "heuristic";
  case DetectionMethod::ModelEnsemble:
    return "model_ensemble";
  case DetectionMethod::GroundTruthVerification:
    return "ground_truth_verification";
  }
  return "heuristic";
}

std::string_view to_string(const AlertType value) {
  switch (value) {
  case AlertType::CostSpike:
    return "cost_spike";
  case AlertType::LatencySpike:
    return "latency_spike";
  case AlertType::ErrorRateSpike:
    return "error_rate_spike";
  case AlertType::TokenLimit:
    return "token_limit";
  }
  return "cost_spike";
}

std::string_view to_string(const Severity value) {
  switch (value) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "medium";
}

std::optional<Status> parse_status(const std::string_view tag) {
  return lookup_value(STATUS_TAGS, tag);
}

std::optional<EventType> parse_event_type(const std::string_view tag) {
  return lookup_value(EVENT_TYPE_TAGS, tag);
}

const ClientInfo &default_client_info() {
  static const ClientInfo info = [] {
    ClientInfo resolved;
    resolved.hostname = common::local_hostname();
    return resolved;
  }();
  return info;
}

EventType event_type(const Event &event) {
  struct Visitor {
    EventType operator()(const PromptCallEvent &) const { return EventType::PromptCall; }
    EventType operator()(const AgentStepEvent &) const { return EventType::AgentStep; }
    EventType operator()(const ErrorEvent &) const { return EventType::Error; }
    EventType operator()(const AssertionFailedEvent &) const { return EventType::AssertionFailed; }
    EventType operator()(const HallucinationDetectedEvent &) const {
      return EventType::HallucinationDetected;
    }
    EventType operator()(const PerformanceAlertEvent &) const {
      return EventType::PerformanceAlert;
    }
  };
  return std::visit(Visitor{}, event);
}

const Envelope &envelope(const Event &event) {
  return std::visit([](const auto &evt) -> const Envelope & { return evt.envelope; }, event);
}

Envelope &envelope(Event &event) {
  return std::visit([](auto &evt) -> Envelope & { return evt.envelope; }, event);
}

} // namespace watchllm::events
