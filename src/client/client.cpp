#include "watchllm/client/client.hpp"

#include "watchllm/common/ids.hpp"
#include "watchllm/common/strings.hpp"
#include "watchllm/config/config.hpp"
#include "watchllm/context/run_context.hpp"
#include "watchllm/instrumentation/pricing.hpp"
#include "watchllm/observability/factory.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <typeinfo>

namespace watchllm::client {

namespace {

common::Result<std::string> invalid(const std::string &message) {
  return common::Result<std::string>::failure(message);
}

common::Result<common::JsonValue> parse_response(const transport::HttpResponse &response,
                                                 const std::string &what) {
  if (response.timeout || response.network_error) {
    return common::Result<common::JsonValue>::failure(what + " failed: " +
                                                      response.network_error_message);
  }
  if (!response.success()) {
    return common::Result<common::JsonValue>::failure(
        what + " failed: status=" + std::to_string(response.status) + " " + response.body);
  }
  auto parsed = common::JsonValue::parse(response.body);
  if (!parsed.ok()) {
    return common::Result<common::JsonValue>::failure(what + " returned invalid JSON: " +
                                                      parsed.error());
  }
  return parsed;
}

} // namespace

std::string exception_type_name(const std::exception &error) {
  const char *mangled = typeid(error).name();
  int status = 0;
  char *demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
  if (status != 0 || demangled == nullptr) {
    return mangled;
  }
  std::string name(demangled);
  std::free(demangled);
  return name;
}

Client::Client(config::Config config, std::shared_ptr<transport::HttpClient> http,
               std::shared_ptr<observability::IObserver> observer)
    : config_(std::move(config)), observer_(std::move(observer)) {
  config_.base_url = config::normalize_base_url(config_.base_url);
  if (observer_ == nullptr) {
    observer_ = observability::create_observer(config_);
  }
  if (http == nullptr) {
    http = std::make_shared<transport::CurlHttpClient>();
  }

  transport_ = std::make_shared<transport::BatchTransport>(
      transport::TransportConfig{
          .base_url = config_.base_url,
          .api_key = config_.api_key,
          .request_timeout_ms = config_.delivery.request_timeout_ms,
          .max_retries = config_.delivery.max_retries,
          .retry_backoff_ms = config_.delivery.retry_backoff_ms,
          .max_retry_after_ms = config_.delivery.max_retry_after_ms,
      },
      std::move(http));
  pipeline_ = std::make_unique<pipeline::EventPipeline>(pipeline::PipelineConfig::from(config_),
                                                        transport_, observer_);
  pipeline_->start();
}

Client::~Client() { close(); }

events::Envelope Client::make_envelope(std::string run_id, std::optional<std::string> user_id,
                                       std::vector<std::string> tags,
                                       std::optional<std::string> release) const {
  events::Envelope envelope;
  envelope.event_id = common::generate_uuid();
  envelope.project_id = config_.project_id;
  envelope.run_id = run_id.empty() ? context::current_run_id() : std::move(run_id);
  envelope.timestamp = common::iso8601_now();
  envelope.user_id = user_id.has_value() ? std::move(user_id) : context::current_user_id();
  envelope.tags = tags.empty() ? context::current_tags() : std::move(tags);
  envelope.release = release.has_value() ? std::move(release) : config_.release;
  envelope.env = config_.environment;
  envelope.client = events::default_client_info();
  return envelope;
}

common::Result<std::string> Client::submit(events::Event event) {
  std::string event_id = events::envelope(event).event_id;
  (void)pipeline_->submit(event);
  return common::Result<std::string>::success(std::move(event_id));
}

common::Result<std::string> Client::log_prompt_call(PromptCallParams params) {
  if (common::trim(params.model).empty()) {
    return invalid("log_prompt_call: model is required");
  }
  if (params.tokens_input < 0 || params.tokens_output < 0) {
    return invalid("log_prompt_call: token counts must be non-negative");
  }
  if (params.latency_ms < 0) {
    return invalid("log_prompt_call: latency_ms must be non-negative");
  }
  for (const auto &tool_call : params.tool_calls) {
    if (common::trim(tool_call.tool_name).empty()) {
      return invalid("log_prompt_call: tool call without tool_name");
    }
    if (tool_call.latency_ms < 0) {
      return invalid("log_prompt_call: tool call latency_ms must be non-negative");
    }
  }

  events::PromptCallEvent event;
  event.envelope = make_envelope(std::move(params.run_id), std::move(params.user_id),
                                 std::move(params.tags), std::move(params.release));
  event.cost_estimate_usd =
      params.cost_estimate_usd.value_or(instrumentation::calculate_cost(
          params.model, params.tokens_input, params.tokens_output));
  event.prompt = std::move(params.prompt);
  event.prompt_template_id = std::move(params.prompt_template_id);
  event.model = std::move(params.model);
  event.model_version = std::move(params.model_version);
  event.tokens_input = params.tokens_input;
  event.tokens_output = params.tokens_output;
  event.response = std::move(params.response);
  event.response_metadata = std::move(params.response_metadata);
  event.tool_calls = std::move(params.tool_calls);
  event.status = params.status;
  event.error = std::move(params.error);
  event.latency_ms = params.latency_ms;
  return submit(std::move(event));
}

common::Result<std::string> Client::log_agent_step(AgentStepParams params) {
  if (common::trim(params.step_name).empty()) {
    return invalid("log_agent_step: step_name is required");
  }
  if (params.latency_ms < 0) {
    return invalid("log_agent_step: latency_ms must be non-negative");
  }

  events::AgentStepEvent event;
  event.envelope = make_envelope(std::move(params.run_id), std::move(params.user_id),
                                 std::move(params.tags), std::move(params.release));
  event.step_number = params.step_number;
  event.step_name = std::move(params.step_name);
  event.step_type = params.step_type;
  event.input_data = std::move(params.input_data);
  event.output_data = std::move(params.output_data);
  event.reasoning = std::move(params.reasoning);
  event.context = std::move(params.context);
  event.latency_ms = params.latency_ms;
  event.status = params.status;
  event.error = std::move(params.error);
  return submit(std::move(event));
}

common::Result<std::string> Client::log_error(ErrorParams params) {
  if (!params.error.is_object() && !params.error.is_null()) {
    return invalid("log_error: error must be an object");
  }

  events::ErrorEvent event;
  event.envelope = make_envelope(std::move(params.run_id), std::move(params.user_id),
                                 std::move(params.tags), std::move(params.release));
  if (!params.stack_trace.has_value()) {
    if (const auto *stack = params.error.find("stack"); stack != nullptr && stack->is_string()) {
      params.stack_trace = stack->as_string();
    }
  }
  event.error = std::move(params.error);
  event.context = std::move(params.context);
  event.stack_trace = std::move(params.stack_trace);
  return submit(std::move(event));
}

common::Result<std::string> Client::log_exception(const std::exception &error,
                                                  ErrorParams params) {
  common::JsonValue descriptor = common::JsonValue::object({
      {"message", std::string(error.what())},
      {"type", exception_type_name(error)},
  });
  if (params.stack_trace.has_value()) {
    descriptor.set("stack", *params.stack_trace);
  }
  params.error = std::move(descriptor);
  return log_error(std::move(params));
}

common::Result<std::string> Client::log_assertion_failure(AssertionFailureParams params) {
  if (common::trim(params.assertion_name).empty()) {
    return invalid("log_assertion_failure: assertion_name is required");
  }

  events::AssertionFailedEvent event;
  event.envelope = make_envelope(std::move(params.run_id), std::move(params.user_id),
                                 std::move(params.tags), std::move(params.release));
  event.assertion_name = std::move(params.assertion_name);
  event.assertion_type = params.assertion_type;
  event.expected = std::move(params.expected);
  event.actual = std::move(params.actual);
  event.severity = params.severity;
  return submit(std::move(event));
}

common::Result<std::string> Client::log_hallucination_detection(HallucinationParams params) {
  events::HallucinationDetectedEvent event;
  event.envelope = make_envelope(std::move(params.run_id), std::move(params.user_id),
                                 std::move(params.tags), std::move(params.release));
  event.detection_method = params.detection_method;
  event.confidence_score = params.confidence_score;
  event.flagged_content = std::move(params.flagged_content);
  event.ground_truth = std::move(params.ground_truth);
  event.recommendations = std::move(params.recommendations);
  return submit(std::move(event));
}

common::Result<std::string> Client::log_performance_alert(PerformanceAlertParams params) {
  if (params.window_minutes < 0) {
    return invalid("log_performance_alert: window_minutes must be non-negative");
  }

  events::PerformanceAlertEvent event;
  event.envelope = make_envelope(std::move(params.run_id), std::move(params.user_id),
                                 std::move(params.tags), std::move(params.release));
  event.alert_type = params.alert_type;
  event.threshold = params.threshold;
  event.actual_value = params.actual_value;
  event.window_minutes = params.window_minutes;
  event.affected_models = std::move(params.affected_models);
  return submit(std::move(event));
}

common::Status Client::flush() { return pipeline_->flush(); }

void Client::close() { pipeline_->close(); }

common::Result<common::JsonValue> Client::query_events(const EventQuery &query) const {
  common::JsonValue body = common::JsonValue::object({
      {"project_id", config_.project_id},
      {"limit", query.limit},
      {"sort_by", "timestamp"},
      {"sort_order", "desc"},
  });
  if (!query.event_types.empty()) {
    body.set("event_types", common::JsonValue::string_array(query.event_types));
  }
  if (query.status.has_value()) {
    body.set("status", *query.status);
  }
  if (query.date_from.has_value()) {
    body.set("date_from", *query.date_from);
  }
  if (query.date_to.has_value()) {
    body.set("date_to", *query.date_to);
  }
  if (query.text_search.has_value()) {
    body.set("text_search", *query.text_search);
  }

  const auto response = transport_->http()->post_json(
      config_.base_url + "/events/query", transport_->auth_headers(), body.dump(),
      config_.delivery.request_timeout_ms);
  return parse_response(response, "query_events");
}

common::Result<common::JsonValue>
Client::get_metrics(const std::optional<std::string> &date_from,
                    const std::optional<std::string> &date_to) const {
  std::string url = config_.base_url + "/projects/" +
                    common::url_encode_component(config_.project_id) + "/metrics";
  std::vector<std::string> params;
  if (date_from.has_value()) {
    params.push_back("date_from=" + common::url_encode_component(*date_from));
  }
  if (date_to.has_value()) {
    params.push_back("date_to=" + common::url_encode_component(*date_to));
  }
  if (!params.empty()) {
    url += "?" + common::join(params, "&");
  }

  const auto response = transport_->http()->get(url, transport_->auth_headers(),
                                                config_.delivery.request_timeout_ms);
  return parse_response(response, "get_metrics");
}

ClientStats Client::stats() const { return pipeline_->stats(); }

common::Result<std::shared_ptr<Client>> init(config::Config config,
                                             std::shared_ptr<transport::HttpClient> http,
                                             std::shared_ptr<observability::IObserver> observer) {
  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return common::Result<std::shared_ptr<Client>>::failure("invalid configuration: " +
                                                            validated.error());
  }
  auto client = std::make_shared<Client>(std::move(config), std::move(http), observer);
  for (const auto &warning : validated.value()) {
    client->observer()->record_event(
        observability::ErrorEvent{.component = "config", .message = warning});
  }
  return common::Result<std::shared_ptr<Client>>::success(std::move(client));
}

} // namespace watchllm::client
