#include "watchllm/pipeline/event_pipeline.hpp"

#include "watchllm/events/serialization.hpp"
#include "watchllm/pipeline/delivery_queue.hpp"
#include "watchllm/pipeline/redactor.hpp"
#include "watchllm/pipeline/sampler.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>

namespace watchllm::pipeline {

namespace {

enum class FlushMode { Scheduled, Manual, Final };

} // namespace

struct EventPipeline::Core {
  Core(PipelineConfig cfg, std::shared_ptr<transport::BatchTransport> batch_transport,
       std::shared_ptr<observability::IObserver> diagnostics)
      : config(cfg), sampler(cfg.sample_rate), redactor(cfg.redact_pii),
        queue(cfg.queue_capacity), transport(std::move(batch_transport)),
        observer(diagnostics != nullptr ? std::move(diagnostics)
                                        : std::make_shared<observability::NoopObserver>()) {}

  PipelineConfig config;
  Sampler sampler;
  Redactor redactor;
  DeliveryQueue queue;
  std::shared_ptr<transport::BatchTransport> transport;
  std::shared_ptr<observability::IObserver> observer;

  // Serializes flushes so batches leave in drain order.
  std::timed_mutex flush_mutex;
  std::atomic<bool> closed{false};
  std::atomic<std::uint64_t> accepted{0};
  std::atomic<std::uint64_t> sampled_out{0};
  std::atomic<std::uint64_t> lost{0};
  std::atomic<std::uint64_t> sent{0};
  std::atomic<std::uint64_t> failed_batches{0};

  // Returns false only when a batch failed to deliver.
  bool flush_batch(FlushMode mode, std::string *error_out);
  // flush_batch for the flush thread and close(); nothing escapes.
  bool flush_batch_noexcept(FlushMode mode, std::string *error_out) noexcept;
  void report_error(const std::string &message) noexcept;
  void report_drop(const std::string &reason, const std::string &event_type, std::uint64_t count);
};

void EventPipeline::Core::report_drop(const std::string &reason, const std::string &event_type,
                                      const std::uint64_t count) {
  for (std::uint64_t i = 0; i < count; ++i) {
    observer->record_event(
        observability::EventDroppedEvent{.reason = reason, .event_type = event_type});
  }
}

void EventPipeline::Core::report_error(const std::string &message) noexcept {
  try {
    observer->record_event(
        observability::ErrorEvent{.component = "pipeline", .message = message});
  } catch (const std::exception &error) {
    std::cerr << "[watchllm] pipeline: " << message << " (observer failed: " << error.what()
              << ")\n";
  }
}

bool EventPipeline::Core::flush_batch_noexcept(const FlushMode mode,
                                               std::string *error_out) noexcept {
  try {
    return flush_batch(mode, error_out);
  } catch (const std::exception &error) {
    const std::string message = std::string("flush failed: ") + error.what();
    report_error(message);
    if (error_out != nullptr) {
      *error_out = message;
    }
    return false;
  }
}

bool EventPipeline::Core::flush_batch(const FlushMode mode, std::string *error_out) {
  std::vector<std::string> batch = queue.drain_up_to(config.max_batch_events);
  observer->record_metric(observability::QueueDepthMetric{.depth = queue.size()});
  if (batch.empty()) {
    return true;
  }

  const auto started = std::chrono::steady_clock::now();
  transport::DeliveryOutcome outcome;
  try {
    outcome = transport->send_batch(batch);
  } catch (const std::exception &error) {
    // A throwing HttpClient counts as a failed attempt so the batch is handled below.
    report_error(std::string("transport threw: ") + error.what());
    outcome.error = transport::DeliveryError{.code = transport::DeliveryErrorCode::NetworkError,
                                             .message = error.what(),
                                             .attempts = 1};
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observer->record_metric(observability::DeliveryLatencyMetric{.latency = elapsed});

  if (outcome.ok()) {
    sent.fetch_add(batch.size());
    observer->record_event(observability::BatchSentEvent{.events = batch.size(),
                                                         .attempts = outcome.ack->attempts,
                                                         .status = outcome.ack->status,
                                                         .duration = elapsed});
    return true;
  }

  failed_batches.fetch_add(1);
  const transport::DeliveryError &error = *outcome.error;
  const std::size_t batch_size = batch.size();
  if (mode == FlushMode::Manual) {
    const std::size_t overflow = queue.requeue_front(std::move(batch));
    report_drop("requeue_overflow", "batch", overflow);
  } else {
    lost.fetch_add(batch_size);
  }
  observer->record_event(observability::BatchFailedEvent{.events = batch_size,
                                                         .status = error.status,
                                                         .message = error.to_string(),
                                                         .requeued = mode == FlushMode::Manual});
  if (error_out != nullptr) {
    *error_out = error.to_string();
  }
  return false;
}

PipelineConfig PipelineConfig::from(const config::Config &config) {
  return PipelineConfig{
      .sample_rate = config.sample_rate,
      .redact_pii = config.redact_pii,
      .queue_capacity = config.delivery.queue_capacity,
      .batch_size = config.delivery.batch_size,
      .max_batch_events = config.delivery.max_batch_events,
      .flush_interval = std::chrono::milliseconds(config.delivery.flush_interval_ms),
      .poll_interval = std::chrono::milliseconds(config.delivery.poll_interval_ms),
      .shutdown_timeout = std::chrono::milliseconds(config.delivery.shutdown_timeout_ms),
  };
}

EventPipeline::EventPipeline(PipelineConfig config,
                             std::shared_ptr<transport::BatchTransport> transport,
                             std::shared_ptr<observability::IObserver> observer)
    : core_(std::make_shared<Core>(config, std::move(transport), std::move(observer))),
      scheduler_(
          SchedulerConfig{.poll_interval = config.poll_interval,
                          .flush_interval = config.flush_interval,
                          .batch_size = config.batch_size},
          [core = core_]() { return core->queue.size(); },
          [core = core_]() {
            std::lock_guard<std::timed_mutex> lock(core->flush_mutex);
            (void)core->flush_batch_noexcept(FlushMode::Scheduled, nullptr);
          }) {}

EventPipeline::~EventPipeline() { close(); }

void EventPipeline::start() {
  if (!core_->closed.load()) {
    scheduler_.start();
  }
}

SubmitOutcome EventPipeline::submit(const events::Event &event) {
  const std::string type(events::to_string(events::event_type(event)));
  if (core_->closed.load()) {
    core_->lost.fetch_add(1);
    core_->report_drop("client_closed", type, 1);
    return SubmitOutcome::Dropped;
  }
  if (!core_->sampler.admit()) {
    core_->sampled_out.fetch_add(1);
    return SubmitOutcome::SampledOut;
  }

  RedactionResult redacted = core_->redactor.redact(events::serialize(event));
  if (redacted.warning.has_value()) {
    core_->observer->record_event(
        observability::RedactionWarningEvent{.message = *redacted.warning});
  }

  if (!core_->queue.enqueue(std::move(redacted.payload))) {
    core_->report_drop("queue_full", type, 1);
    return SubmitOutcome::Dropped;
  }
  core_->accepted.fetch_add(1);
  if (core_->queue.size() >= core_->config.batch_size) {
    scheduler_.wake();
  }
  return SubmitOutcome::Queued;
}

common::Status EventPipeline::flush() {
  std::lock_guard<std::timed_mutex> lock(core_->flush_mutex);
  // Bounded by what is pending now so concurrent producers cannot keep us here.
  std::size_t remaining = core_->queue.size();
  while (remaining > 0) {
    const std::size_t before = core_->queue.size();
    std::string error;
    if (!core_->flush_batch(FlushMode::Manual, &error)) {
      return common::Status::error(error);
    }
    const std::size_t drained = std::min(before, core_->config.max_batch_events);
    if (drained == 0) {
      break;
    }
    remaining = remaining > drained ? remaining - drained : 0;
  }
  return common::Status::success();
}

void EventPipeline::close() {
  if (core_->closed.exchange(true)) {
    return;
  }
  scheduler_.request_stop();

  std::unique_lock<std::timed_mutex> lock(core_->flush_mutex, std::defer_lock);
  if (lock.try_lock_for(core_->config.shutdown_timeout)) {
    while (core_->queue.size() > 0) {
      std::string error;
      if (!core_->flush_batch_noexcept(FlushMode::Final, &error)) {
        core_->report_error("final flush: " + error);
        break;
      }
    }
    lock.unlock();
  } else {
    core_->report_error("final flush skipped: delivery still in progress");
  }

  if (!scheduler_.join(core_->config.shutdown_timeout)) {
    core_->report_error("flush thread did not stop in time; detached");
  }
  try {
    core_->observer->flush();
  } catch (const std::exception &error) {
    std::cerr << "[watchllm] pipeline: observer flush failed: " << error.what() << "\n";
  }
}

bool EventPipeline::closed() const { return core_->closed.load(); }

PipelineStats EventPipeline::stats() const {
  return PipelineStats{
      .accepted = core_->accepted.load(),
      .sampled_out = core_->sampled_out.load(),
      .dropped = core_->queue.dropped() + core_->lost.load(),
      .sent = core_->sent.load(),
      .failed_batches = core_->failed_batches.load(),
      .queue_depth = core_->queue.size(),
  };
}

std::size_t EventPipeline::queue_size() const { return core_->queue.size(); }

} // namespace watchllm::pipeline
