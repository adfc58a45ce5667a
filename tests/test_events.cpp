#include "test_framework.hpp"

#include "watchllm/events/serialization.hpp"
#include "watchllm/events/types.hpp"

#include <string>
#include <utility>

namespace {

watchllm::events::Envelope sample_envelope() {
  watchllm::events::Envelope env;
  env.event_id = "evt-1";
  env.project_id = "proj-123";
  env.run_id = "run-1";
  env.timestamp = "2024-01-01T00:00:00.000Z";
  env.tags = {"a", "b"};
  env.env = "test";
  env.client.hostname = "host-1";
  return env;
}

std::vector<std::string> keys_of(const watchllm::common::JsonValue &value) {
  std::vector<std::string> keys;
  for (const auto &member : value.members()) {
    keys.push_back(member.key);
  }
  return keys;
}

} // namespace

void register_event_tests(std::vector<watchllm::tests::TestCase> &tests) {
  using watchllm::tests::require;
  namespace ev = watchllm::events;
  using watchllm::common::JsonValue;

  tests.push_back({"event_map_fields_default_to_empty_objects", [] {
                     const ev::PromptCallEvent prompt;
                     require(prompt.response_metadata.is_object(), "response_metadata");
                     require(prompt.response_metadata.empty(), "response_metadata not empty");
                     const ev::AgentStepEvent step;
                     require(step.input_data.is_object() && step.output_data.is_object() &&
                                 step.context.is_object(),
                             "agent step maps");
                     const ev::ToolCallRecord record;
                     require(record.input.is_object() && record.output.is_object(), "tool maps");
                   }});

  tests.push_back({"event_tags_and_parsing", [] {
                     require(ev::to_string(ev::EventType::HallucinationDetected) ==
                                 "hallucination_detected",
                             "event tag");
                     require(ev::to_string(ev::Status::AssertionFailed) == "assertion_failed",
                             "status tag");
                     require(ev::to_string(ev::DetectionMethod::GroundTruthVerification) ==
                                 "ground_truth_verification",
                             "detection tag");
                     require(ev::parse_status("timeout") == ev::Status::Timeout, "parse status");
                     require(!ev::parse_status("exploded").has_value(), "unknown status parsed");
                     require(ev::parse_event_type("agent_step") == ev::EventType::AgentStep,
                             "parse event type");
                   }});

  tests.push_back({"event_client_info_has_hostname", [] {
                     const auto &client = ev::default_client_info();
                     require(client.sdk_name == "watchllm-cpp", "sdk name");
                     require(client.platform == "cpp", "platform");
                     require(!client.hostname.empty(), "hostname");
                   }});

  tests.push_back({"event_prompt_call_field_order", [] {
                     ev::PromptCallEvent prompt;
                     prompt.envelope = sample_envelope();
                     prompt.prompt = "hi";
                     prompt.model = "gpt-4o";
                     prompt.tokens_input = 10;
                     prompt.tokens_output = 5;
                     prompt.response = "hello";
                     prompt.latency_ms = 42;

                     const JsonValue json = ev::to_json(ev::Event(prompt));
                     const std::vector<std::string> expected = {
                         "event_id",      "project_id",   "run_id",
                         "timestamp",     "user_id",      "tags",
                         "release",       "env",          "client",
                         "event_type",    "prompt",       "prompt_template_id",
                         "model",         "model_version", "tokens_input",
                         "tokens_output", "cost_estimate_usd", "response",
                         "response_metadata", "tool_calls", "status",
                         "error",         "latency_ms"};
                     require(keys_of(json) == expected, json.dump());
                     require(json.find("event_type")->as_string() == "prompt_call", "event type");
                     require(json.find("user_id")->is_null(), "user id should be null");
                     require(json.find("error")->is_null(), "error should be null");
                     require(json.find("status")->as_string() == "success", "status");
                     require(json.find("tokens_input")->as_int() == 10, "tokens");
                     require(json.find("tags")->size() == 2, "tags");
                     require(json.find("client")->find("hostname")->as_string() == "host-1",
                             "client hostname");
                   }});

  tests.push_back({"event_null_maps_serialize_as_empty_objects", [] {
                     ev::AgentStepEvent step;
                     step.envelope = sample_envelope();
                     step.step_number = 2;
                     step.step_name = "plan";
                     step.input_data = JsonValue();
                     step.context = JsonValue();
                     const std::string wire = ev::serialize(ev::Event(step));
                     require(wire.find(R"("input_data":{})") != std::string::npos, wire);
                     require(wire.find(R"("context":{})") != std::string::npos, wire);
                     require(wire.find(R"("step_type":"reasoning")") != std::string::npos, wire);
                     require(wire.find(R"("reasoning":null)") != std::string::npos, wire);
                   }});

  tests.push_back({"event_tool_call_serialization", [] {
                     ev::ToolCallRecord record;
                     record.tool_name = "search";
                     record.tool_id = "t-1";
                     record.input = JsonValue::object({{"q", "weather"}});
                     record.latency_ms = 12;
                     record.status = ev::Status::Timeout;
                     const JsonValue json = ev::to_json(record);
                     require(json.dump() == R"({"tool_name":"search","tool_id":"t-1",)"
                                            R"("input":{"q":"weather"},"output":{},)"
                                            R"("latency_ms":12,"status":"timeout","error":null})",
                             json.dump());

                     ev::PromptCallEvent prompt;
                     prompt.envelope = sample_envelope();
                     prompt.model = "m";
                     prompt.tool_calls.push_back(record);
                     const JsonValue event = ev::to_json(ev::Event(prompt));
                     require(event.find("tool_calls")->size() == 1, "tool calls");
                   }});

  tests.push_back({"event_variant_helpers", [] {
                     ev::Event event = ev::HallucinationDetectedEvent{};
                     require(ev::event_type(event) == ev::EventType::HallucinationDetected,
                             "event type");
                     ev::envelope(event).run_id = "r-9";
                     require(ev::envelope(std::as_const(event)).run_id == "r-9", "envelope ref");

                     ev::PerformanceAlertEvent alert;
                     alert.alert_type = ev::AlertType::LatencySpike;
                     alert.window_minutes = 15;
                     alert.affected_models = {"gpt-4o"};
                     const JsonValue json = ev::to_json(ev::Event(alert));
                     require(json.find("alert_type")->as_string() == "latency_spike", "alert");
                     require(json.find("affected_models")->at(0)->as_string() == "gpt-4o",
                             "affected models");
                   }});
}
