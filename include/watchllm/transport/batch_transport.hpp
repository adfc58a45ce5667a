#pragma once

#include "watchllm/transport/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace watchllm::transport {

enum class DeliveryErrorCode {
  NetworkError,
  Timeout,
  AuthError,
  RateLimitError,
  ServerError,
  ClientError,
};

struct DeliveryError {
  DeliveryErrorCode code = DeliveryErrorCode::ServerError;
  std::uint16_t status = 0;
  std::string body;
  std::string message;
  std::uint32_t attempts = 0;

  [[nodiscard]] std::string to_string() const;
};

struct DeliveryAck {
  std::uint16_t status = 0;
  std::string body;
  std::uint32_t attempts = 0;
};

struct DeliveryOutcome {
  std::optional<DeliveryAck> ack;
  std::optional<DeliveryError> error;

  [[nodiscard]] bool ok() const { return ack.has_value(); }
};

struct TransportConfig {
  std::string base_url;
  std::string api_key;
  std::uint64_t request_timeout_ms = 30'000;
  /// Retries after the first attempt.
  std::uint32_t max_retries = 3;
  std::uint64_t retry_backoff_ms = 1000;
  std::uint64_t max_retry_after_ms = 60'000;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Statuses and failures worth another attempt: connection failure, timeout,
/// 408, 429, 500, 502, 503, 504.
[[nodiscard]] bool is_transient(const HttpResponse &response);

/// Authenticated `POST {base_url}/events/batch` with bounded exponential backoff.
class BatchTransport {
public:
  BatchTransport(TransportConfig config, std::shared_ptr<HttpClient> http,
                 Sleeper sleeper = {});

  /// `events` are already-serialized JSON objects.
  [[nodiscard]] DeliveryOutcome send_batch(const std::vector<std::string> &events) const;

  [[nodiscard]] HeaderMap auth_headers() const;
  [[nodiscard]] const TransportConfig &config() const { return config_; }
  [[nodiscard]] const std::shared_ptr<HttpClient> &http() const { return http_; }

private:
  [[nodiscard]] std::chrono::milliseconds retry_delay(const HttpResponse &response,
                                                      std::uint32_t attempt) const;

  TransportConfig config_;
  std::shared_ptr<HttpClient> http_;
  Sleeper sleeper_;
};

[[nodiscard]] std::string build_batch_body(const std::vector<std::string> &events);

} // namespace watchllm::transport
