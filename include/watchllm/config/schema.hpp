#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace watchllm::config {

inline constexpr const char *DEFAULT_BASE_URL = "https://proxy.watchllm.dev/v1";

struct DeliveryConfig {
  std::size_t batch_size = 10;
  std::uint64_t flush_interval_ms = 5000;
  std::size_t queue_capacity = 1000;
  std::size_t max_batch_events = 100;
  std::uint64_t poll_interval_ms = 1000;
  std::uint64_t request_timeout_ms = 30'000;
  std::uint32_t max_retries = 3;
  std::uint64_t retry_backoff_ms = 1000;
  std::uint64_t max_retry_after_ms = 60'000;
  std::uint64_t shutdown_timeout_ms = 5000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string api_key;
  std::string project_id;
  std::string base_url = DEFAULT_BASE_URL;
  std::string environment = "development";
  std::optional<std::string> release;
  double sample_rate = 1.0;
  bool redact_pii = true;

  DeliveryConfig delivery;
  ObservabilityConfig observability;
};

} // namespace watchllm::config
