#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "watchllm/observability/factory.hpp"
#include "watchllm/observability/multi_observer.hpp"

#include <memory>

void register_observability_tests(std::vector<watchllm::tests::TestCase> &tests) {
  using watchllm::tests::require;
  namespace obs = watchllm::observability;
  namespace wt = watchllm::testing;

  tests.push_back({"observer_factory_selects_backend", [] {
                     auto config = wt::test_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none backend");
                     config.observability.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log,noop";
                     require(obs::create_observer(config)->name() == "multi", "multi backend");
                     config.observability.backend = "prometheus";
                     require(obs::create_observer(config)->name() == "log",
                             "unknown backend should fall back to log");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     auto first = std::make_shared<wt::CountingObserver>();
                     auto second = std::make_shared<wt::CountingObserver>();
                     obs::MultiObserver multi;
                     multi.add(first);
                     multi.add(second);
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observer kept");
                     const obs::MultiObserver seeded({first, nullptr});
                     require(seeded.size() == 1, "null observer kept by constructor");

                     multi.record_event(obs::EventDroppedEvent{.reason = "queue_full",
                                                               .event_type = "prompt_call"});
                     multi.record_metric(obs::QueueDepthMetric{.depth = 3});
                     multi.flush();

                     for (const auto &observer : {first, second}) {
                       const auto drops = observer->all<obs::EventDroppedEvent>();
                       require(drops.size() == 1, "drop not forwarded");
                       require(drops.front().reason == "queue_full", "reason");
                       require(observer->metric_count() == 1, "metric not forwarded");
                     }
                   }});

  tests.push_back({"log_observer_accepts_every_event_kind", [] {
                     auto config = wt::test_config();
                     config.observability.backend = "log";
                     const auto observer = obs::create_observer(config);
                     observer->record_event(obs::EventDroppedEvent{.reason = "sampled_out"});
                     observer->record_event(obs::RedactionWarningEvent{.message = "skipped"});
                     observer->record_event(obs::BatchSentEvent{.events = 2, .attempts = 1});
                     observer->record_event(obs::BatchFailedEvent{.events = 2, .status = 503});
                     observer->record_event(
                         obs::InstrumentationErrorEvent{.provider = "openai", .message = "x"});
                     observer->record_event(obs::ErrorEvent{.component = "config", .message = "y"});
                     observer->record_metric(obs::DeliveryLatencyMetric{});
                     observer->flush();
                   }});
}
