#include "watchllm/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace watchllm::observability {

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[watchllm] [" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, EventDroppedEvent>) {
          log_line("WARN", "event.dropped reason=" + evt.reason + " type=" + evt.event_type);
        } else if constexpr (std::is_same_v<T, RedactionWarningEvent>) {
          log_line("WARN", "redaction skipped: " + evt.message);
        } else if constexpr (std::is_same_v<T, BatchSentEvent>) {
          log_line("DEBUG", "batch.sent events=" + std::to_string(evt.events) +
                                " attempts=" + std::to_string(evt.attempts) +
                                " status=" + std::to_string(evt.status) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, BatchFailedEvent>) {
          log_line("ERROR", "batch.failed events=" + std::to_string(evt.events) +
                                " status=" + std::to_string(evt.status) +
                                (evt.requeued ? " requeued" : " dropped") + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, InstrumentationErrorEvent>) {
          log_line("WARN", "instrumentation." + evt.provider + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line("DEBUG", "metric.queue_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, DeliveryLatencyMetric>) {
          log_line("DEBUG", "metric.delivery_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace watchllm::observability
