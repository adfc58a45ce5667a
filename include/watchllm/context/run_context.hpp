#pragma once

#include <optional>
#include <string>
#include <vector>

namespace watchllm::context {

/// Ambient correlation data for a logical unit of work.
struct RunContext {
  std::string run_id;
  std::optional<std::string> user_id;
  std::vector<std::string> tags;
};

/// Installs a run context on the calling thread for the lifetime of the scope.
/// Omitted fields inherit from the enclosing scope; an omitted run id with no
/// enclosing scope is generated. The previous context is restored on every exit path.
class TraceScope {
public:
  explicit TraceScope(std::optional<std::string> run_id = std::nullopt,
                      std::optional<std::string> user_id = std::nullopt,
                      std::optional<std::vector<std::string>> tags = std::nullopt);
  ~TraceScope();

  TraceScope(const TraceScope &) = delete;
  TraceScope &operator=(const TraceScope &) = delete;

  [[nodiscard]] const std::string &run_id() const { return run_id_; }

private:
  std::optional<RunContext> previous_;
  std::string run_id_;
};

/// Installs an exact snapshot (possibly empty), e.g. on a worker thread that
/// continues work started elsewhere.
class ContextGuard {
public:
  explicit ContextGuard(std::optional<RunContext> snapshot);
  ~ContextGuard();

  ContextGuard(const ContextGuard &) = delete;
  ContextGuard &operator=(const ContextGuard &) = delete;

private:
  std::optional<RunContext> previous_;
};

[[nodiscard]] std::optional<RunContext> current_context();

/// The ambient run id, or a freshly generated one (not cached) when none is installed.
[[nodiscard]] std::string current_run_id();
[[nodiscard]] std::optional<std::string> current_user_id();
[[nodiscard]] std::vector<std::string> current_tags();

} // namespace watchllm::context
