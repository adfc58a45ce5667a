#pragma once

#include "watchllm/observability/observer.hpp"

#include <memory>
#include <shared_mutex>
#include <vector>

namespace watchllm::observability {

/// Fans diagnostics out to several backends. Observers may be added while the
/// flush thread and producers are already reporting.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::shared_ptr<IObserver>> observers);

  void add(std::shared_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  [[nodiscard]] std::vector<std::shared_ptr<IObserver>> snapshot() const;

  mutable std::shared_mutex mutex_;
  std::vector<std::shared_ptr<IObserver>> observers_;
};

} // namespace watchllm::observability
