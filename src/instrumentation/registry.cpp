#include "watchllm/instrumentation/registry.hpp"

#include "watchllm/common/ids.hpp"
#include "watchllm/context/run_context.hpp"

#include <chrono>

namespace watchllm::instrumentation {

namespace {

struct Observation {
  std::chrono::steady_clock::time_point started;
  std::string model;
  std::string prompt;
  std::optional<context::RunContext> context;
};

void report(const client::Client &client, const ProviderAdapter &adapter,
            const std::string &message) {
  client.observer()->record_event(observability::InstrumentationErrorEvent{
      .provider = std::string(adapter.name()), .message = message});
}

Observation begin_observation(const client::Client &client, const ProviderAdapter &adapter,
                              const ProviderCall &call) {
  Observation observation{.started = std::chrono::steady_clock::now(),
                          .model = call.model,
                          .prompt = {},
                          .context = context::current_context()};
  if (observation.model.empty()) {
    if (const auto *model = call.arguments.find("model"); model != nullptr) {
      observation.model = model->as_string();
    }
  }
  if (observation.model.empty()) {
    observation.model = "unknown";
  }
  try {
    observation.prompt = adapter.extract_prompt(call);
  } catch (const std::exception &error) {
    report(client, adapter, std::string("prompt extraction failed: ") + error.what());
  }
  return observation;
}

client::PromptCallParams base_params(const ProviderAdapter &adapter,
                                     const Observation &observation) {
  client::PromptCallParams params;
  params.prompt = observation.prompt;
  params.model = observation.model;
  params.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - observation.started)
                          .count();
  if (observation.context.has_value()) {
    params.run_id = observation.context->run_id;
    params.user_id = observation.context->user_id;
    params.tags = observation.context->tags;
  } else {
    params.run_id = common::generate_uuid();
  }
  params.tags.emplace_back(adapter.name());
  params.tags.emplace_back("auto-instrumented");
  return params;
}

void submit(client::Client &client, const ProviderAdapter &adapter,
            client::PromptCallParams params) {
  const auto logged = client.log_prompt_call(std::move(params));
  if (!logged.ok()) {
    report(client, adapter, logged.error());
  }
}

void record_success(client::Client &client, const ProviderAdapter &adapter,
                    const Observation &observation, const ProviderResponse *response) {
  client::PromptCallParams params = base_params(adapter, observation);
  if (response != nullptr) {
    try {
      params.response = adapter.extract_text(*response);
    } catch (const std::exception &error) {
      report(client, adapter, std::string("response extraction failed: ") + error.what());
    }
    try {
      const TokenUsage usage = adapter.extract_usage(*response);
      params.tokens_input = usage.input > 0 ? usage.input : 0;
      params.tokens_output = usage.output > 0 ? usage.output : 0;
    } catch (const std::exception &error) {
      report(client, adapter, std::string("usage extraction failed: ") + error.what());
    }
    try {
      params.response_metadata = adapter.extract_metadata(*response);
    } catch (const std::exception &error) {
      report(client, adapter, std::string("metadata extraction failed: ") + error.what());
    }
  }
  submit(client, adapter, std::move(params));
}

void record_failure(client::Client &client, const ProviderAdapter &adapter,
                    const Observation &observation, const std::string &type,
                    const std::string &message) {
  client::PromptCallParams params = base_params(adapter, observation);
  params.status = events::Status::Error;
  params.error = common::JsonValue::object({{"message", message}, {"type", type}});
  submit(client, adapter, std::move(params));
}

} // namespace

InstrumentationRegistry::InstrumentationRegistry(std::shared_ptr<client::Client> client)
    : state_(std::make_shared<State>()) {
  state_->client = std::move(client);
}

bool InstrumentationRegistry::install(ProviderMethod &target,
                                      std::shared_ptr<ProviderAdapter> adapter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (patches_.contains(&target) || adapter == nullptr) {
    return false;
  }

  ProviderMethod original = target;
  target = [state = state_, adapter, original](const ProviderCall &call) {
    if (!state->enabled.load()) {
      return original(call);
    }
    const Observation observation = begin_observation(*state->client, *adapter, call);
    std::shared_ptr<ProviderResponse> response;
    try {
      response = original(call);
    } catch (const std::exception &error) {
      record_failure(*state->client, *adapter, observation, client::exception_type_name(error),
                     error.what());
      throw;
    } catch (...) {
      record_failure(*state->client, *adapter, observation, "unknown", "non-standard exception");
      throw;
    }
    record_success(*state->client, *adapter, observation, response.get());
    return response;
  };
  patches_.emplace(&target, SyncPatch{.target = &target, .original = std::move(original)});
  return true;
}

bool InstrumentationRegistry::install(AsyncProviderMethod &target,
                                      std::shared_ptr<ProviderAdapter> adapter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (patches_.contains(&target) || adapter == nullptr) {
    return false;
  }

  AsyncProviderMethod original = target;
  target = [state = state_, adapter, original](const ProviderCall &call) {
    if (!state->enabled.load()) {
      return original(call);
    }
    Observation observation = begin_observation(*state->client, *adapter, call);
    std::future<std::shared_ptr<ProviderResponse>> pending;
    try {
      pending = original(call);
    } catch (const std::exception &error) {
      record_failure(*state->client, *adapter, observation, client::exception_type_name(error),
                     error.what());
      throw;
    } catch (...) {
      record_failure(*state->client, *adapter, observation, "unknown", "non-standard exception");
      throw;
    }

    // Completes on its own thread so the caller is never blocked; the caller's
    // run context travels with it.
    return std::async(
        std::launch::async,
        [state, adapter, observation = std::move(observation),
         pending = std::move(pending)]() mutable -> std::shared_ptr<ProviderResponse> {
          context::ContextGuard guard(observation.context);
          std::shared_ptr<ProviderResponse> response;
          try {
            response = pending.get();
          } catch (const std::exception &error) {
            record_failure(*state->client, *adapter, observation,
                           client::exception_type_name(error), error.what());
            throw;
          } catch (...) {
            record_failure(*state->client, *adapter, observation, "unknown",
                           "non-standard exception");
            throw;
          }
          record_success(*state->client, *adapter, observation, response.get());
          return response;
        });
  };
  patches_.emplace(&target, AsyncPatch{.target = &target, .original = std::move(original)});
  return true;
}

bool InstrumentationRegistry::remove(ProviderMethod &target) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = patches_.find(&target);
  if (it == patches_.end() || !std::holds_alternative<SyncPatch>(it->second)) {
    return false;
  }
  target = std::move(std::get<SyncPatch>(it->second).original);
  patches_.erase(it);
  return true;
}

bool InstrumentationRegistry::remove(AsyncProviderMethod &target) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = patches_.find(&target);
  if (it == patches_.end() || !std::holds_alternative<AsyncPatch>(it->second)) {
    return false;
  }
  target = std::move(std::get<AsyncPatch>(it->second).original);
  patches_.erase(it);
  return true;
}

void InstrumentationRegistry::remove_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[key, patch] : patches_) {
    std::visit([](auto &entry) { *entry.target = std::move(entry.original); }, patch);
  }
  patches_.clear();
}

void InstrumentationRegistry::enable() { state_->enabled.store(true); }

void InstrumentationRegistry::disable() { state_->enabled.store(false); }

bool InstrumentationRegistry::enabled() const { return state_->enabled.load(); }

bool InstrumentationRegistry::is_patched(const ProviderMethod &target) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return patches_.contains(&target);
}

bool InstrumentationRegistry::is_patched(const AsyncProviderMethod &target) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return patches_.contains(&target);
}

std::size_t InstrumentationRegistry::patched_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return patches_.size();
}

} // namespace watchllm::instrumentation
