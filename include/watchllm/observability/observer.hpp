#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace watchllm::observability {

struct EventDroppedEvent {
  std::string reason;
  std::string event_type;
};

struct RedactionWarningEvent {
  std::string message;
};

struct BatchSentEvent {
  std::size_t events = 0;
  std::uint32_t attempts = 0;
  std::uint16_t status = 0;
  std::chrono::milliseconds duration{0};
};

struct BatchFailedEvent {
  std::size_t events = 0;
  std::uint16_t status = 0;
  std::string message;
  bool requeued = false;
};

struct InstrumentationErrorEvent {
  std::string provider;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<EventDroppedEvent, RedactionWarningEvent, BatchSentEvent,
                                   BatchFailedEvent, InstrumentationErrorEvent, ErrorEvent>;

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

struct DeliveryLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<QueueDepthMetric, DeliveryLatencyMetric>;

/// Sink for SDK-internal diagnostics. Implementations are called from producer
/// threads and the flush thread concurrently.
class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Discards everything. Backend "none"; also stands in when no observer is supplied.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace watchllm::observability
