#pragma once

#include "watchllm/common/result.hpp"
#include "watchllm/config/schema.hpp"
#include "watchllm/events/types.hpp"
#include "watchllm/observability/observer.hpp"
#include "watchllm/pipeline/flush_scheduler.hpp"
#include "watchllm/transport/batch_transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace watchllm::pipeline {

struct PipelineConfig {
  double sample_rate = 1.0;
  bool redact_pii = true;
  std::size_t queue_capacity = 1000;
  std::size_t batch_size = 10;
  std::size_t max_batch_events = 100;
  std::chrono::milliseconds flush_interval{5000};
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds shutdown_timeout{5000};

  [[nodiscard]] static PipelineConfig from(const config::Config &config);
};

struct PipelineStats {
  std::uint64_t accepted = 0;
  std::uint64_t sampled_out = 0;
  std::uint64_t dropped = 0;
  std::uint64_t sent = 0;
  std::uint64_t failed_batches = 0;
  std::size_t queue_depth = 0;
};

enum class SubmitOutcome { Queued, SampledOut, Dropped };

/// Sampler -> serializer -> Redactor -> DeliveryQueue, drained by a
/// FlushScheduler (or flush()) into a BatchTransport.
class EventPipeline {
public:
  EventPipeline(PipelineConfig config, std::shared_ptr<transport::BatchTransport> transport,
                std::shared_ptr<observability::IObserver> observer);
  ~EventPipeline();

  EventPipeline(const EventPipeline &) = delete;
  EventPipeline &operator=(const EventPipeline &) = delete;

  void start();

  SubmitOutcome submit(const events::Event &event);

  /// Sends everything queued at call time. On delivery failure the failed
  /// batch goes back to the head of the queue and the error is returned.
  [[nodiscard]] common::Status flush();

  /// Stops the scheduler, makes one best-effort final flush and waits a
  /// bounded time for the scheduler thread. Idempotent; never fails.
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] PipelineStats stats() const;
  [[nodiscard]] std::size_t queue_size() const;

private:
  struct Core;

  std::shared_ptr<Core> core_;
  FlushScheduler scheduler_;
};

} // namespace watchllm::pipeline
