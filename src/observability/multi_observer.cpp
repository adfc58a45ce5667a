#include "watchllm/observability/multi_observer.hpp"

#include <algorithm>
#include <mutex>

namespace watchllm::observability {

MultiObserver::MultiObserver(std::vector<std::shared_ptr<IObserver>> observers) {
  observers.erase(std::remove(observers.begin(), observers.end(), nullptr), observers.end());
  observers_ = std::move(observers);
}

void MultiObserver::add(std::shared_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  observers_.push_back(std::move(observer));
}

std::size_t MultiObserver::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return observers_.size();
}

std::vector<std::shared_ptr<IObserver>> MultiObserver::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return observers_;
}

// Backends are called outside the lock so a slow sink never holds up add().
void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : snapshot()) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : snapshot()) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : snapshot()) {
    observer->flush();
  }
}

} // namespace watchllm::observability
