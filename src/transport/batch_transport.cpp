#include "watchllm/transport/batch_transport.hpp"

#include "watchllm/common/strings.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <thread>

namespace watchllm::transport {

namespace {

DeliveryErrorCode classify(const HttpResponse &response) {
  if (response.timeout) {
    return DeliveryErrorCode::Timeout;
  }
  if (response.network_error) {
    return DeliveryErrorCode::NetworkError;
  }
  if (response.status == 401 || response.status == 403) {
    return DeliveryErrorCode::AuthError;
  }
  if (response.status == 429) {
    return DeliveryErrorCode::RateLimitError;
  }
  if (response.status >= 500) {
    return DeliveryErrorCode::ServerError;
  }
  return DeliveryErrorCode::ClientError;
}

std::optional<std::uint64_t> parse_retry_after_seconds(const HeaderMap &headers) {
  const auto it = headers.find("retry-after");
  if (it == headers.end()) {
    return std::nullopt;
  }
  const std::string value = common::trim(it->second);
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](const char ch) { return ch >= '0' && ch <= '9'; })) {
    // HTTP-date form is not honoured; plain backoff applies.
    return std::nullopt;
  }
  return std::strtoull(value.c_str(), nullptr, 10);
}

} // namespace

std::string DeliveryError::to_string() const {
  std::ostringstream stream;
  stream << "Delivery error [";
  switch (code) {
  case DeliveryErrorCode::NetworkError:
    stream << "network";
    break;
  case DeliveryErrorCode::Timeout:
    stream << "timeout";
    break;
  case DeliveryErrorCode::AuthError:
    stream << "auth";
    break;
  case DeliveryErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case DeliveryErrorCode::ServerError:
    stream << "server";
    break;
  case DeliveryErrorCode::ClientError:
    stream << "client";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  stream << " attempts=" << attempts;
  if (!message.empty()) {
    stream << " " << message;
  }
  if (!body.empty()) {
    stream << " body=" << body.substr(0, 256);
  }
  return stream.str();
}

bool is_transient(const HttpResponse &response) {
  if (response.timeout || response.network_error) {
    return true;
  }
  switch (response.status) {
  case 408:
  case 429:
  case 500:
  case 502:
  case 503:
  case 504:
    return true;
  default:
    return false;
  }
}

std::string build_batch_body(const std::vector<std::string> &events) {
  std::size_t total = 16;
  for (const auto &event : events) {
    total += event.size() + 1;
  }
  std::string body;
  body.reserve(total);
  body += "{\"events\":[";
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (i > 0) {
      body.push_back(',');
    }
    body += events[i];
  }
  body += "]}";
  return body;
}

BatchTransport::BatchTransport(TransportConfig config, std::shared_ptr<HttpClient> http,
                               Sleeper sleeper)
    : config_(std::move(config)), http_(std::move(http)), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

HeaderMap BatchTransport::auth_headers() const {
  return {
      {"Authorization", "Bearer " + config_.api_key},
      {"Content-Type", "application/json"},
  };
}

std::chrono::milliseconds BatchTransport::retry_delay(const HttpResponse &response,
                                                      const std::uint32_t attempt) const {
  const std::uint64_t backoff = config_.retry_backoff_ms * (1ULL << std::min<std::uint32_t>(attempt, 20));
  if (response.status == 429 || response.status == 503) {
    if (const auto seconds = parse_retry_after_seconds(response.headers); seconds.has_value()) {
      const std::uint64_t requested = std::min(*seconds * 1000, config_.max_retry_after_ms);
      return std::chrono::milliseconds(std::max(backoff, requested));
    }
  }
  return std::chrono::milliseconds(backoff);
}

DeliveryOutcome BatchTransport::send_batch(const std::vector<std::string> &events) const {
  const std::string url = config_.base_url + "/events/batch";
  const std::string body = build_batch_body(events);
  const HeaderMap headers = auth_headers();

  HttpResponse response;
  std::uint32_t attempts = 0;
  for (std::uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
    response = http_->post_json(url, headers, body, config_.request_timeout_ms);
    attempts = attempt + 1;
    if (response.success()) {
      return DeliveryOutcome{
          .ack = DeliveryAck{.status = response.status,
                             .body = std::move(response.body),
                             .attempts = attempts},
          .error = std::nullopt,
      };
    }
    if (!is_transient(response)) {
      break;
    }
    if (attempt < config_.max_retries) {
      sleeper_(retry_delay(response, attempt));
    }
  }

  DeliveryError error{
      .code = classify(response),
      .status = response.status,
      .body = response.body,
      .message = response.network_error_message,
      .attempts = attempts,
  };
  if (error.message.empty()) {
    error.message = is_transient(response) ? "retries exhausted" : "non-retryable status";
  }
  return DeliveryOutcome{.ack = std::nullopt, .error = std::move(error)};
}

} // namespace watchllm::transport
