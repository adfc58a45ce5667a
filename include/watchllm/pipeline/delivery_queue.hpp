#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace watchllm::pipeline {

/// Bounded FIFO of serialized, redacted events. Never blocks producers:
/// enqueue beyond capacity drops the new item.
class DeliveryQueue {
public:
  explicit DeliveryQueue(std::size_t capacity);

  /// False when the queue is full and the payload was dropped.
  [[nodiscard]] bool enqueue(std::string payload);

  [[nodiscard]] std::vector<std::string> drain_up_to(std::size_t max_items);

  /// Puts a failed batch back at the head, in its original order. Returns how
  /// many items did not fit and were dropped (taken from the tail of `batch`).
  std::size_t requeue_front(std::vector<std::string> batch);

  /// Approximate; read without taking the lock.
  [[nodiscard]] std::size_t size() const { return size_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::uint64_t dropped() const { return dropped_.load(); }

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<std::string> items_;
  std::atomic<std::size_t> size_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace watchllm::pipeline
