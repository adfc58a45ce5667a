#include "watchllm/context/run_context.hpp"

#include "watchllm/common/ids.hpp"

namespace watchllm::context {

namespace {

thread_local std::optional<RunContext> t_current;

} // namespace

TraceScope::TraceScope(std::optional<std::string> run_id, std::optional<std::string> user_id,
                       std::optional<std::vector<std::string>> tags)
    : previous_(t_current) {
  RunContext next;
  if (run_id.has_value() && !run_id->empty()) {
    next.run_id = std::move(*run_id);
  } else if (previous_.has_value()) {
    next.run_id = previous_->run_id;
  } else {
    next.run_id = common::generate_uuid();
  }

  if (user_id.has_value()) {
    next.user_id = std::move(user_id);
  } else if (previous_.has_value()) {
    next.user_id = previous_->user_id;
  }

  if (tags.has_value()) {
    next.tags = std::move(*tags);
  } else if (previous_.has_value()) {
    next.tags = previous_->tags;
  }

  run_id_ = next.run_id;
  t_current = std::move(next);
}

TraceScope::~TraceScope() { t_current = std::move(previous_); }

ContextGuard::ContextGuard(std::optional<RunContext> snapshot) : previous_(t_current) {
  t_current = std::move(snapshot);
}

ContextGuard::~ContextGuard() { t_current = std::move(previous_); }

std::optional<RunContext> current_context() { return t_current; }

std::string current_run_id() {
  if (t_current.has_value() && !t_current->run_id.empty()) {
    return t_current->run_id;
  }
  return common::generate_uuid();
}

std::optional<std::string> current_user_id() {
  if (!t_current.has_value()) {
    return std::nullopt;
  }
  return t_current->user_id;
}

std::vector<std::string> current_tags() {
  if (!t_current.has_value()) {
    return {};
  }
  return t_current->tags;
}

} // namespace watchllm::context
