#pragma once

#include "watchllm/observability/observer.hpp"

#include <mutex>

namespace watchllm::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::mutex mutex_;
};

} // namespace watchllm::observability
