#pragma once

#include "watchllm/common/json.hpp"
#include "watchllm/config/schema.hpp"
#include "watchllm/observability/observer.hpp"
#include "watchllm/transport/http_client.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace watchllm::testing {

/// Valid config with fast polling, no backoff, and triggers far enough away
/// that only explicit flush() or close() sends anything.
config::Config test_config();

struct RecordedRequest {
  std::string method;
  std::string url;
  transport::HeaderMap headers;
  std::string body;
};

/// Thread-safe HttpClient double. Scripted responses are consumed in order;
/// once exhausted every request gets `fallback`.
class MockHttpClient final : public transport::HttpClient {
public:
  void script(std::vector<transport::HttpResponse> responses);
  void set_fallback(transport::HttpResponse response);
  void set_delay(std::chrono::milliseconds delay);

  [[nodiscard]] transport::HttpResponse post_json(const std::string &url,
                                                  const transport::HeaderMap &headers,
                                                  const std::string &body,
                                                  std::uint64_t timeout_ms) override;
  [[nodiscard]] transport::HttpResponse get(const std::string &url,
                                            const transport::HeaderMap &headers,
                                            std::uint64_t timeout_ms) override;

  [[nodiscard]] std::vector<RecordedRequest> requests() const;
  [[nodiscard]] std::size_t request_count() const;
  /// Waits until at least `count` requests were recorded.
  bool wait_for_requests(std::size_t count, std::chrono::milliseconds timeout) const;

  /// Every event object from every recorded `/events/batch` body, in send order.
  [[nodiscard]] std::vector<common::JsonValue> posted_events() const;

private:
  transport::HttpResponse respond(RecordedRequest request);

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::deque<transport::HttpResponse> script_;
  transport::HttpResponse fallback_{.status = 200, .body = R"({"accepted":true})"};
  std::chrono::milliseconds delay_{0};
  std::vector<RecordedRequest> requests_;
};

transport::HttpResponse http_status(std::uint16_t status, std::string body = "");
transport::HttpResponse network_failure();

/// Records every diagnostic for later inspection.
class CountingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "counting"; }

  template <typename T> [[nodiscard]] std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto &event : events_) {
      if (std::holds_alternative<T>(event)) {
        ++total;
      }
    }
    return total;
  }

  template <typename T> [[nodiscard]] std::vector<T> all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> matching;
    for (const auto &event : events_) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        matching.push_back(*typed);
      }
    }
    return matching;
  }

  [[nodiscard]] std::size_t metric_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::size_t metrics_ = 0;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Sets an environment variable for the guard's lifetime, restoring the old value.
class ScopedEnv {
public:
  ScopedEnv(std::string name, const std::optional<std::string> &value);
  ~ScopedEnv();

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

/// Polls `predicate` until it holds or `timeout` passes.
template <typename Predicate>
bool eventually(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace watchllm::testing
