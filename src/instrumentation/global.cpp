#include "watchllm/instrumentation/global.hpp"

#include <mutex>

namespace watchllm::instrumentation {

namespace {

std::mutex g_mutex;
std::shared_ptr<client::Client> g_client;
std::unique_ptr<InstrumentationRegistry> g_registry;

template <typename Method>
common::Status instrument_target(Method &target, const std::string_view provider) {
  auto adapter = make_adapter(provider);
  if (adapter == nullptr) {
    return common::Status::error("unsupported provider: " + std::string(provider));
  }
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_registry == nullptr) {
    return common::Status::error("instrumentation is not enabled; call auto_instrument first");
  }
  (void)g_registry->install(target, std::move(adapter));
  return common::Status::success();
}

} // namespace

common::Result<std::shared_ptr<client::Client>>
auto_instrument(config::Config config, std::shared_ptr<transport::HttpClient> http,
                std::shared_ptr<observability::IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_registry != nullptr) {
    g_registry->enable();
    return common::Result<std::shared_ptr<client::Client>>::success(g_client);
  }

  auto created = client::init(std::move(config), std::move(http), std::move(observer));
  if (!created.ok()) {
    return created;
  }
  g_client = created.value();
  g_registry = std::make_unique<InstrumentationRegistry>(g_client);
  return created;
}

common::Status instrument(ProviderMethod &target, const std::string_view provider) {
  return instrument_target(target, provider);
}

common::Status instrument(AsyncProviderMethod &target, const std::string_view provider) {
  return instrument_target(target, provider);
}

void disable_instrumentation() {
  std::shared_ptr<client::Client> client;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_registry != nullptr) {
      g_registry->disable();
      g_registry->remove_all();
      g_registry.reset();
    }
    client = std::move(g_client);
    g_client.reset();
  }
  if (client != nullptr) {
    client->close();
  }
}

bool is_instrumented() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_registry != nullptr && g_registry->enabled();
}

std::shared_ptr<client::Client> get_client() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_client;
}

} // namespace watchllm::instrumentation
