#pragma once

#include "watchllm/config/schema.hpp"
#include "watchllm/observability/observer.hpp"

#include <memory>

namespace watchllm::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace watchllm::observability
