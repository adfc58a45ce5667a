#include "watchllm/observability/factory.hpp"

#include "watchllm/common/strings.hpp"
#include "watchllm/observability/log_observer.hpp"
#include "watchllm/observability/multi_observer.hpp"

namespace watchllm::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_shared<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_shared<LogObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    std::vector<std::shared_ptr<IObserver>> backends;
    for (const auto &part : common::split(backend, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        backends.push_back(std::make_shared<LogObserver>());
      } else if (p == "noop" || p == "none") {
        backends.push_back(std::make_shared<NoopObserver>());
      }
    }
    return std::make_shared<MultiObserver>(std::move(backends));
  }

  return std::make_shared<LogObserver>();
}

} // namespace watchllm::observability
