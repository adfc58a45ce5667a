#pragma once

#include "watchllm/common/json.hpp"
#include "watchllm/common/result.hpp"
#include "watchllm/config/schema.hpp"
#include "watchllm/events/types.hpp"
#include "watchllm/observability/observer.hpp"
#include "watchllm/pipeline/event_pipeline.hpp"
#include "watchllm/transport/batch_transport.hpp"
#include "watchllm/transport/http_client.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace watchllm::client {

// For every log_* call: an empty run_id, a missing user_id or an empty tag
// list are taken from the ambient run context; a missing release from config.

struct PromptCallParams {
  std::string run_id;
  std::string prompt;
  std::string model;
  std::string response;
  std::int64_t tokens_input = 0;
  std::int64_t tokens_output = 0;
  std::int64_t latency_ms = 0;
  events::Status status = events::Status::Success;
  std::optional<common::JsonValue> error;
  std::optional<std::string> prompt_template_id;
  std::optional<std::string> model_version;
  common::JsonValue response_metadata = common::JsonValue::object();
  std::vector<events::ToolCallRecord> tool_calls;
  /// Overrides the pricing-table estimate.
  std::optional<double> cost_estimate_usd;
  std::vector<std::string> tags;
  std::optional<std::string> user_id;
  std::optional<std::string> release;
};

struct AgentStepParams {
  std::string run_id;
  std::int64_t step_number = 0;
  std::string step_name;
  events::StepType step_type = events::StepType::Reasoning;
  common::JsonValue input_data = common::JsonValue::object();
  common::JsonValue output_data = common::JsonValue::object();
  std::int64_t latency_ms = 0;
  events::Status status = events::Status::Success;
  std::optional<std::string> reasoning;
  common::JsonValue context = common::JsonValue::object();
  std::optional<common::JsonValue> error;
  std::vector<std::string> tags;
  std::optional<std::string> user_id;
  std::optional<std::string> release;
};

struct ErrorParams {
  std::string run_id;
  /// Object with `message`, `type` and optionally `stack`.
  common::JsonValue error = common::JsonValue::object();
  common::JsonValue context = common::JsonValue::object();
  std::optional<std::string> stack_trace;
  std::vector<std::string> tags;
  std::optional<std::string> user_id;
  std::optional<std::string> release;
};

struct AssertionFailureParams {
  std::string run_id;
  std::string assertion_name;
  events::AssertionType assertion_type = events::AssertionType::Custom;
  common::JsonValue expected;
  common::JsonValue actual;
  events::Severity severity = events::Severity::Medium;
  std::vector<std::string> tags;
  std::optional<std::string> user_id;
  std::optional<std::string> release;
};

struct HallucinationParams {
  std::string run_id;
  events::DetectionMethod detection_method = events::DetectionMethod::Heuristic;
  double confidence_score = 0.0;
  std::string flagged_content;
  std::optional<std::string> ground_truth;
  std::vector<std::string> recommendations;
  std::vector<std::string> tags;
  std::optional<std::string> user_id;
  std::optional<std::string> release;
};

struct PerformanceAlertParams {
  std::string run_id;
  events::AlertType alert_type = events::AlertType::CostSpike;
  double threshold = 0.0;
  double actual_value = 0.0;
  std::int64_t window_minutes = 0;
  std::vector<std::string> affected_models;
  std::vector<std::string> tags;
  std::optional<std::string> user_id;
  std::optional<std::string> release;
};

struct EventQuery {
  std::vector<std::string> event_types;
  std::optional<std::string> status;
  std::optional<std::string> date_from;
  std::optional<std::string> date_to;
  std::optional<std::string> text_search;
  std::size_t limit = 50;
};

using ClientStats = pipeline::PipelineStats;

/// Entry point for applications: builds events, feeds the delivery pipeline
/// and exposes the collector's query endpoints.
class Client {
public:
  explicit Client(config::Config config, std::shared_ptr<transport::HttpClient> http = nullptr,
                  std::shared_ptr<observability::IObserver> observer = nullptr);
  ~Client();

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  // Each returns the new event id, or a failure for malformed arguments.
  // An event dropped by sampling or a full queue still yields its id.
  [[nodiscard]] common::Result<std::string> log_prompt_call(PromptCallParams params);
  [[nodiscard]] common::Result<std::string> log_agent_step(AgentStepParams params);
  [[nodiscard]] common::Result<std::string> log_error(ErrorParams params);
  [[nodiscard]] common::Result<std::string> log_exception(const std::exception &error,
                                                          ErrorParams params = {});
  [[nodiscard]] common::Result<std::string>
  log_assertion_failure(AssertionFailureParams params);
  [[nodiscard]] common::Result<std::string>
  log_hallucination_detection(HallucinationParams params);
  [[nodiscard]] common::Result<std::string>
  log_performance_alert(PerformanceAlertParams params);

  /// Sends everything pending. A delivery failure puts the batch back in the
  /// queue and is returned.
  [[nodiscard]] common::Status flush();
  void close();

  [[nodiscard]] common::Result<common::JsonValue> query_events(const EventQuery &query) const;
  [[nodiscard]] common::Result<common::JsonValue>
  get_metrics(const std::optional<std::string> &date_from = std::nullopt,
              const std::optional<std::string> &date_to = std::nullopt) const;

  [[nodiscard]] ClientStats stats() const;
  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::shared_ptr<observability::IObserver> &observer() const {
    return observer_;
  }

private:
  [[nodiscard]] events::Envelope make_envelope(std::string run_id,
                                               std::optional<std::string> user_id,
                                               std::vector<std::string> tags,
                                               std::optional<std::string> release) const;
  common::Result<std::string> submit(events::Event event);

  config::Config config_;
  std::shared_ptr<observability::IObserver> observer_;
  std::shared_ptr<transport::BatchTransport> transport_;
  std::unique_ptr<pipeline::EventPipeline> pipeline_;
};

/// Validates `config` and starts a client.
[[nodiscard]] common::Result<std::shared_ptr<Client>>
init(config::Config config, std::shared_ptr<transport::HttpClient> http = nullptr,
     std::shared_ptr<observability::IObserver> observer = nullptr);

/// Human-readable type name of a live exception object.
[[nodiscard]] std::string exception_type_name(const std::exception &error);

} // namespace watchllm::client
