#pragma once

#include "watchllm/client/client.hpp"
#include "watchllm/instrumentation/adapters.hpp"
#include "watchllm/instrumentation/provider.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <variant>

namespace watchllm::instrumentation {

using ProviderMethod = std::function<std::shared_ptr<ProviderResponse>(const ProviderCall &)>;
using AsyncProviderMethod =
    std::function<std::future<std::shared_ptr<ProviderResponse>>(const ProviderCall &)>;

/// Owns the patched-method table. Installing swaps a method slot for an
/// observing wrapper and keeps the original; removing puts the original back.
/// Patched slots must outlive their registration.
class InstrumentationRegistry {
public:
  explicit InstrumentationRegistry(std::shared_ptr<client::Client> client);

  InstrumentationRegistry(const InstrumentationRegistry &) = delete;
  InstrumentationRegistry &operator=(const InstrumentationRegistry &) = delete;

  /// False when `target` is already patched (nothing changes).
  bool install(ProviderMethod &target, std::shared_ptr<ProviderAdapter> adapter);
  bool install(AsyncProviderMethod &target, std::shared_ptr<ProviderAdapter> adapter);

  /// False when `target` is not patched.
  bool remove(ProviderMethod &target);
  bool remove(AsyncProviderMethod &target);
  void remove_all();

  // Wrappers consult this flag per call; disabled wrappers only delegate.
  void enable();
  void disable();
  [[nodiscard]] bool enabled() const;

  [[nodiscard]] bool is_patched(const ProviderMethod &target) const;
  [[nodiscard]] bool is_patched(const AsyncProviderMethod &target) const;
  [[nodiscard]] std::size_t patched_count() const;

  [[nodiscard]] const std::shared_ptr<client::Client> &client() const { return state_->client; }

private:
  struct State {
    std::shared_ptr<client::Client> client;
    std::atomic<bool> enabled{true};
  };

  struct SyncPatch {
    ProviderMethod *target = nullptr;
    ProviderMethod original;
  };

  struct AsyncPatch {
    AsyncProviderMethod *target = nullptr;
    AsyncProviderMethod original;
  };

  using Patch = std::variant<SyncPatch, AsyncPatch>;

  std::shared_ptr<State> state_;
  mutable std::mutex mutex_;
  std::unordered_map<const void *, Patch> patches_;
};

} // namespace watchllm::instrumentation
