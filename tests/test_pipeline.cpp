#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "watchllm/common/json.hpp"
#include "watchllm/events/serialization.hpp"
#include "watchllm/pipeline/delivery_queue.hpp"
#include "watchllm/pipeline/event_pipeline.hpp"
#include "watchllm/pipeline/flush_scheduler.hpp"
#include "watchllm/pipeline/redactor.hpp"
#include "watchllm/pipeline/sampler.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

namespace wt = watchllm::testing;

struct PipelineFixture {
  std::shared_ptr<wt::MockHttpClient> http = std::make_shared<wt::MockHttpClient>();
  std::shared_ptr<wt::CountingObserver> observer = std::make_shared<wt::CountingObserver>();
  std::unique_ptr<watchllm::pipeline::EventPipeline> pipeline;

  explicit PipelineFixture(watchllm::pipeline::PipelineConfig config,
                           std::uint32_t max_retries = 0) {
    auto transport = std::make_shared<watchllm::transport::BatchTransport>(
        watchllm::transport::TransportConfig{.base_url = "https://collector.test/v1",
                                             .api_key = "test-key",
                                             .request_timeout_ms = 1000,
                                             .max_retries = max_retries,
                                             .retry_backoff_ms = 0,
                                             .max_retry_after_ms = 0},
        http, [](std::chrono::milliseconds) {});
    pipeline = std::make_unique<watchllm::pipeline::EventPipeline>(config, transport, observer);
  }
};

// Simulates a socket layer that fails by throwing instead of returning a response.
class ThrowingHttpClient final : public watchllm::transport::HttpClient {
public:
  watchllm::transport::HttpResponse post_json(const std::string &,
                                              const watchllm::transport::HeaderMap &,
                                              const std::string &, std::uint64_t) override {
    calls.fetch_add(1);
    throw std::runtime_error("socket layer failed");
  }
  watchllm::transport::HttpResponse get(const std::string &,
                                        const watchllm::transport::HeaderMap &,
                                        std::uint64_t) override {
    throw std::runtime_error("socket layer failed");
  }

  std::atomic<int> calls{0};
};

std::shared_ptr<watchllm::transport::BatchTransport>
throwing_transport(const std::shared_ptr<ThrowingHttpClient> &http) {
  return std::make_shared<watchllm::transport::BatchTransport>(
      watchllm::transport::TransportConfig{.base_url = "https://collector.test/v1",
                                           .api_key = "test-key",
                                           .request_timeout_ms = 1000,
                                           .max_retries = 0,
                                           .retry_backoff_ms = 0,
                                           .max_retry_after_ms = 0},
      http, [](std::chrono::milliseconds) {});
}

watchllm::pipeline::PipelineConfig quiet_config() {
  return watchllm::pipeline::PipelineConfig{
      .sample_rate = 1.0,
      .redact_pii = true,
      .queue_capacity = 100,
      .batch_size = 100,
      .max_batch_events = 100,
      .flush_interval = std::chrono::milliseconds(60'000),
      .poll_interval = std::chrono::milliseconds(10),
      .shutdown_timeout = std::chrono::milliseconds(2000),
  };
}

watchllm::events::Event prompt_event(const std::string &prompt) {
  watchllm::events::PromptCallEvent event;
  event.envelope.event_id = "evt-" + prompt;
  event.envelope.project_id = "proj-123";
  event.envelope.run_id = "run-1";
  event.prompt = prompt;
  event.model = "gpt-4o";
  return event;
}

} // namespace

void register_pipeline_tests(std::vector<watchllm::tests::TestCase> &tests) {
  using watchllm::tests::require;
  namespace pl = watchllm::pipeline;
  namespace obs = watchllm::observability;

  tests.push_back({"sampler_extremes", [] {
                     const pl::Sampler always(1.0);
                     const pl::Sampler never(0.0);
                     for (int i = 0; i < 200; ++i) {
                       require(always.admit(), "rate 1.0 rejected an event");
                       require(!never.admit(), "rate 0.0 admitted an event");
                     }
                   }});

  tests.push_back({"sampler_half_rate_is_roughly_half", [] {
                     int admitted = 0;
                     for (int i = 0; i < 4000; ++i) {
                       admitted += pl::Sampler::admit(0.5) ? 1 : 0;
                     }
                     require(admitted > 1600 && admitted < 2400,
                             "admitted " + std::to_string(admitted));
                   }});

  tests.push_back({"redactor_scrubs_pii", [] {
                     const pl::Redactor redactor;
                     const auto result = redactor.redact(
                         R"({"prompt":"mail jane.doe@example.com card 4111 1111 1111 1111 )"
                         R"(ssn 123-45-6789 call 555-123-4567"})");
                     require(!result.warning.has_value(), "unexpected warning");
                     const std::string &out = result.payload;
                     require(out.find("jane.doe") == std::string::npos, out);
                     require(out.find("[REDACTED_EMAIL]") != std::string::npos, out);
                     require(out.find("[REDACTED_CC]") != std::string::npos, out);
                     require(out.find("[REDACTED_SSN]") != std::string::npos, out);
                     require(out.find("[REDACTED_PHONE]") != std::string::npos, out);
                     require(out.find("4111") == std::string::npos, out);
                   }});

  tests.push_back({"redactor_keeps_escaped_strings_valid", [] {
                     const pl::Redactor redactor;
                     const auto result = redactor.redact(watchllm::events::serialize(
                         prompt_event("Contact:\nalice@example.com\tbob@example.com\x01"
                                      "carol@example.com")));
                     require(!result.warning.has_value(), "unexpected warning");
                     auto parsed = watchllm::common::JsonValue::parse(result.payload);
                     require(parsed.ok(), result.payload);
                     require(parsed.value().find("prompt")->as_string() ==
                                 "Contact:\n[REDACTED_EMAIL]\t[REDACTED_EMAIL]\x01"
                                 "[REDACTED_EMAIL]",
                             result.payload);
                   }});

  tests.push_back({"redactor_leaves_numbers_alone", [] {
                     const pl::Redactor redactor;
                     watchllm::events::PerformanceAlertEvent alert;
                     alert.envelope.event_id = "evt-alert";
                     alert.envelope.project_id = "proj-123";
                     alert.threshold = 1.0000000000000002;
                     alert.actual_value = 4111111111111111.0;
                     const auto result = redactor.redact(watchllm::events::serialize(alert));
                     auto parsed = watchllm::common::JsonValue::parse(result.payload);
                     require(parsed.ok(), result.payload);
                     require(parsed.value().find("threshold")->as_double() == 1.0000000000000002,
                             result.payload);
                     require(result.payload.find("REDACTED") == std::string::npos, result.payload);
                   }});

  tests.push_back({"redactor_is_idempotent", [] {
                     const pl::Redactor redactor;
                     const std::string once =
                         redactor.redact("reach me at ops@watchllm.dev or 555-867-5309").payload;
                     require(redactor.redact(once).payload == once, once);
                   }});

  tests.push_back({"redactor_disabled_is_identity", [] {
                     const pl::Redactor redactor(false);
                     const std::string input = "jane@example.com 123-45-6789";
                     require(redactor.redact(input).payload == input, "payload changed");
                   }});

  tests.push_back({"queue_is_fifo_and_bounded", [] {
                     pl::DeliveryQueue queue(2);
                     require(queue.enqueue("a"), "first");
                     require(queue.enqueue("b"), "second");
                     require(!queue.enqueue("c"), "overflow accepted");
                     require(queue.dropped() == 1, "drop not counted");
                     require(queue.size() == 2, "size");
                     const auto drained = queue.drain_up_to(5);
                     require(drained == std::vector<std::string>{"a", "b"}, "order");
                     require(queue.size() == 0, "not drained");
                   }});

  tests.push_back({"queue_requeue_front_keeps_order", [] {
                     pl::DeliveryQueue queue(4);
                     (void)queue.enqueue("c");
                     const std::size_t overflow = queue.requeue_front({"a", "b"});
                     require(overflow == 0, "unexpected overflow");
                     require(queue.drain_up_to(10) == std::vector<std::string>{"a", "b", "c"},
                             "requeued order");
                   }});

  tests.push_back({"queue_requeue_front_reports_overflow", [] {
                     pl::DeliveryQueue queue(3);
                     (void)queue.enqueue("x");
                     (void)queue.enqueue("y");
                     const std::size_t overflow = queue.requeue_front({"a", "b", "c"});
                     require(overflow == 2, "overflow " + std::to_string(overflow));
                     require(queue.dropped() == 2, "dropped");
                     require(queue.drain_up_to(10) == std::vector<std::string>{"a", "x", "y"},
                             "kept items");
                   }});

  tests.push_back({"scheduler_flushes_on_batch_size", [] {
                     std::atomic<std::size_t> depth{0};
                     std::atomic<int> flushes{0};
                     pl::FlushScheduler scheduler(
                         pl::SchedulerConfig{.poll_interval = std::chrono::milliseconds(10),
                                             .flush_interval = std::chrono::milliseconds(60'000),
                                             .batch_size = 3},
                         [&depth]() { return depth.load(); },
                         [&depth, &flushes]() {
                           depth = 0;
                           ++flushes;
                         });
                     scheduler.start();
                     depth = 2;
                     std::this_thread::sleep_for(std::chrono::milliseconds(50));
                     require(flushes.load() == 0, "flushed below batch size");
                     depth = 3;
                     scheduler.wake();
                     require(wt::eventually([&flushes]() { return flushes.load() == 1; }),
                             "no size-triggered flush");
                     require(scheduler.stop(std::chrono::milliseconds(1000)), "stop timed out");
                   }});

  tests.push_back({"scheduler_flushes_on_interval", [] {
                     std::atomic<std::size_t> depth{1};
                     std::atomic<int> flushes{0};
                     pl::FlushScheduler scheduler(
                         pl::SchedulerConfig{.poll_interval = std::chrono::milliseconds(10),
                                             .flush_interval = std::chrono::milliseconds(30),
                                             .batch_size = 100},
                         [&depth]() { return depth.load(); },
                         [&depth, &flushes]() {
                           depth = 0;
                           ++flushes;
                         });
                     scheduler.start();
                     require(wt::eventually([&flushes]() { return flushes.load() == 1; }),
                             "no interval flush");
                     std::this_thread::sleep_for(std::chrono::milliseconds(80));
                     require(flushes.load() == 1, "flushed an empty queue");
                     require(scheduler.stop(std::chrono::milliseconds(1000)), "stop timed out");
                   }});

  tests.push_back({"scheduler_stops_promptly", [] {
                     pl::FlushScheduler scheduler(
                         pl::SchedulerConfig{.poll_interval = std::chrono::milliseconds(10'000),
                                             .flush_interval = std::chrono::milliseconds(10'000),
                                             .batch_size = 1},
                         []() { return std::size_t{0}; }, []() {});
                     scheduler.start();
                     require(scheduler.is_running(), "not running");
                     const auto started = std::chrono::steady_clock::now();
                     require(scheduler.stop(std::chrono::milliseconds(2000)), "stop timed out");
                     require(std::chrono::steady_clock::now() - started <
                                 std::chrono::milliseconds(1000),
                             "stop waited for the poll interval");
                     require(!scheduler.is_running(), "still running");
                   }});

  tests.push_back({"pipeline_manual_flush_failure_requeues", [] {
                     PipelineFixture fixture(quiet_config());
                     fixture.http->script({wt::http_status(401, R"({"error":"bad key"})")});
                     for (const char *prompt : {"one", "two", "three"}) {
                       require(fixture.pipeline->submit(prompt_event(prompt)) ==
                                   pl::SubmitOutcome::Queued,
                               "not queued");
                     }
                     const auto failed = fixture.pipeline->flush();
                     require(!failed.ok(), "flush should fail on 401");
                     require(failed.error().find("status=401") != std::string::npos,
                             failed.error());
                     require(fixture.pipeline->queue_size() == 3, "batch not requeued");
                     const auto batch_failures = fixture.observer->all<obs::BatchFailedEvent>();
                     require(batch_failures.size() == 1 && batch_failures.front().requeued,
                             "missing requeued failure event");

                     require(fixture.pipeline->flush().ok(), "second flush failed");
                     require(fixture.pipeline->queue_size() == 0, "queue not drained");
                     // Both attempts carried the same batch.
                     const auto events = fixture.http->posted_events();
                     require(events.size() == 6, "posted " + std::to_string(events.size()));
                     require(events[3].find("prompt")->as_string() == "one" &&
                                 events[5].find("prompt")->as_string() == "three",
                             "order lost after requeue");
                     require(fixture.pipeline->stats().sent == 3, "sent count");
                   }});

  tests.push_back({"pipeline_scheduled_failure_drops_batch", [] {
                     auto config = quiet_config();
                     config.batch_size = 2;
                     PipelineFixture fixture(config);
                     fixture.http->set_fallback(wt::http_status(500));
                     fixture.pipeline->start();
                     (void)fixture.pipeline->submit(prompt_event("a"));
                     (void)fixture.pipeline->submit(prompt_event("b"));
                     require(wt::eventually([&fixture]() {
                               return fixture.observer->count<obs::BatchFailedEvent>() == 1;
                             }),
                             "no failure reported");
                     const auto failure = fixture.observer->all<obs::BatchFailedEvent>().front();
                     require(!failure.requeued, "scheduled failure requeued");
                     require(failure.status == 500 && failure.events == 2, "failure details");
                     require(fixture.pipeline->queue_size() == 0, "batch left in queue");
                     require(fixture.pipeline->stats().dropped == 2, "loss not counted");
                     fixture.pipeline->close();
                   }});

  tests.push_back({"pipeline_drops_when_queue_full", [] {
                     auto config = quiet_config();
                     config.queue_capacity = 2;
                     PipelineFixture fixture(config);
                     (void)fixture.pipeline->submit(prompt_event("a"));
                     (void)fixture.pipeline->submit(prompt_event("b"));
                     require(fixture.pipeline->submit(prompt_event("c")) ==
                                 pl::SubmitOutcome::Dropped,
                             "overflow queued");
                     const auto drops = fixture.observer->all<obs::EventDroppedEvent>();
                     require(drops.size() == 1 && drops.front().reason == "queue_full",
                             "drop not reported");
                     require(drops.front().event_type == "prompt_call", "drop event type");
                     require(fixture.pipeline->stats().dropped == 1, "drop not counted");
                   }});

  tests.push_back({"pipeline_sample_rate_zero_queues_nothing", [] {
                     auto config = quiet_config();
                     config.sample_rate = 0.0;
                     PipelineFixture fixture(config);
                     require(fixture.pipeline->submit(prompt_event("a")) ==
                                 pl::SubmitOutcome::SampledOut,
                             "sampled event queued");
                     require(fixture.pipeline->queue_size() == 0, "queue not empty");
                     require(fixture.pipeline->stats().sampled_out == 1, "sampled count");
                   }});

  tests.push_back({"pipeline_redacts_before_queueing", [] {
                     PipelineFixture fixture(quiet_config());
                     (void)fixture.pipeline->submit(prompt_event("email me at a.b@example.org"));
                     require(fixture.pipeline->flush().ok(), "flush failed");
                     const auto events = fixture.http->posted_events();
                     require(events.size() == 1, "nothing posted");
                     require(events[0].find("prompt")->as_string() ==
                                 "email me at [REDACTED_EMAIL]",
                             events[0].find("prompt")->as_string());
                   }});

  tests.push_back({"pipeline_close_absorbs_throwing_transport", [] {
                     auto http = std::make_shared<ThrowingHttpClient>();
                     auto observer = std::make_shared<wt::CountingObserver>();
                     pl::EventPipeline pipeline(quiet_config(), throwing_transport(http), observer);
                     (void)pipeline.submit(prompt_event("a"));
                     pipeline.close();
                     require(pipeline.closed(), "not closed");
                     require(http->calls.load() == 1, "final flush not attempted");
                     require(pipeline.stats().failed_batches == 1, "failure not counted");
                     const auto errors = observer->all<obs::ErrorEvent>();
                     require(!errors.empty() && errors.front().component == "pipeline",
                             "failure not reported");
                   }});

  tests.push_back({"pipeline_flush_thread_survives_throwing_transport", [] {
                     auto http = std::make_shared<ThrowingHttpClient>();
                     auto observer = std::make_shared<wt::CountingObserver>();
                     auto config = quiet_config();
                     config.batch_size = 1;
                     pl::EventPipeline pipeline(config, throwing_transport(http), observer);
                     pipeline.start();
                     (void)pipeline.submit(prompt_event("a"));
                     const auto deadline =
                         std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (pipeline.stats().dropped == 0 &&
                            std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     }
                     require(pipeline.stats().failed_batches == 1, "scheduled flush not attempted");
                     require(pipeline.stats().dropped == 1, "lost batch not counted");

                     (void)pipeline.submit(prompt_event("b"));
                     const auto second_deadline =
                         std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (http->calls.load() < 2 &&
                            std::chrono::steady_clock::now() < second_deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     }
                     require(http->calls.load() == 2, "flush thread stopped after a throw");
                     pipeline.close();
                   }});

  tests.push_back({"pipeline_close_flushes_and_rejects", [] {
                     PipelineFixture fixture(quiet_config());
                     fixture.pipeline->start();
                     (void)fixture.pipeline->submit(prompt_event("a"));
                     (void)fixture.pipeline->submit(prompt_event("b"));
                     fixture.pipeline->close();
                     require(fixture.pipeline->closed(), "not closed");
                     require(fixture.http->posted_events().size() == 2, "final flush missing");
                     fixture.pipeline->close();
                     require(fixture.http->request_count() == 1, "second close sent again");

                     require(fixture.pipeline->submit(prompt_event("late")) ==
                                 pl::SubmitOutcome::Dropped,
                             "accepted after close");
                     const auto drops = fixture.observer->all<obs::EventDroppedEvent>();
                     require(!drops.empty() && drops.back().reason == "client_closed",
                             "close drop not reported");
                   }});
}
