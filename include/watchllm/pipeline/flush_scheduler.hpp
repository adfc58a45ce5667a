#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace watchllm::pipeline {

struct SchedulerConfig {
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds flush_interval{5000};
  std::size_t batch_size = 10;
};

/// Background thread deciding when to drain the queue. On every tick (or
/// wake) it flushes when the depth reached `batch_size`, or when anything is
/// pending and `flush_interval` has elapsed since the last flush.
class FlushScheduler {
public:
  using DepthFn = std::function<std::size_t()>;
  using FlushFn = std::function<void()>;

  FlushScheduler(SchedulerConfig config, DepthFn depth, FlushFn flush);
  ~FlushScheduler();

  FlushScheduler(const FlushScheduler &) = delete;
  FlushScheduler &operator=(const FlushScheduler &) = delete;

  void start();
  /// Interrupts the idle wait and makes the loop exit after any in-flight flush.
  void request_stop();
  /// Waits at most `timeout` for the thread to finish. Returns false (and
  /// detaches) if it did not.
  bool join(std::chrono::milliseconds timeout);
  bool stop(std::chrono::milliseconds timeout);

  /// Re-evaluates the triggers now instead of at the next tick.
  void wake();

  [[nodiscard]] bool is_running() const;

private:
  // Shared with the worker so a detached thread never touches a destroyed scheduler.
  struct State {
    SchedulerConfig config;
    DepthFn depth;
    FlushFn flush;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool running = false;
    bool woken = false;
  };

  static void run_loop(const std::shared_ptr<State> &state);

  std::shared_ptr<State> state_;
  std::thread thread_;
  std::future<void> finished_;
};

} // namespace watchllm::pipeline
