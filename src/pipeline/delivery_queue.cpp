#include "watchllm/pipeline/delivery_queue.hpp"

#include <algorithm>

namespace watchllm::pipeline {

DeliveryQueue::DeliveryQueue(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

bool DeliveryQueue::enqueue(std::string payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (items_.size() >= capacity_) {
    dropped_.fetch_add(1);
    return false;
  }
  items_.push_back(std::move(payload));
  size_.store(items_.size(), std::memory_order_relaxed);
  return true;
}

std::vector<std::string> DeliveryQueue::drain_up_to(const std::size_t max_items) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = std::min(max_items, items_.size());
  std::vector<std::string> drained;
  drained.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    drained.push_back(std::move(items_.front()));
    items_.pop_front();
  }
  size_.store(items_.size(), std::memory_order_relaxed);
  return drained;
}

std::size_t DeliveryQueue::requeue_front(std::vector<std::string> batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t room = capacity_ > items_.size() ? capacity_ - items_.size() : 0;
  const std::size_t keep = std::min(room, batch.size());
  const std::size_t overflow = batch.size() - keep;

  for (std::size_t i = keep; i > 0; --i) {
    items_.push_front(std::move(batch[i - 1]));
  }
  size_.store(items_.size(), std::memory_order_relaxed);
  dropped_.fetch_add(overflow);
  return overflow;
}

} // namespace watchllm::pipeline
