#pragma once

#include "watchllm/client/client.hpp"
#include "watchllm/common/result.hpp"
#include "watchllm/config/schema.hpp"
#include "watchllm/instrumentation/registry.hpp"

#include <memory>
#include <string_view>

namespace watchllm::instrumentation {

/// Creates the process-wide client and an enabled registry. Returns the
/// existing client when already instrumented.
[[nodiscard]] common::Result<std::shared_ptr<client::Client>>
auto_instrument(config::Config config, std::shared_ptr<transport::HttpClient> http = nullptr,
                std::shared_ptr<observability::IObserver> observer = nullptr);

/// Patches `target` on the process-wide registry with the named provider's adapter.
[[nodiscard]] common::Status instrument(ProviderMethod &target, std::string_view provider);
[[nodiscard]] common::Status instrument(AsyncProviderMethod &target, std::string_view provider);

/// Disables observation, restores every patched method, closes and forgets the client.
void disable_instrumentation();

[[nodiscard]] bool is_instrumented();
[[nodiscard]] std::shared_ptr<client::Client> get_client();

} // namespace watchllm::instrumentation
