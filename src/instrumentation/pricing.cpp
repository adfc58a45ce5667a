#include "watchllm/instrumentation/pricing.hpp"

#include <array>

namespace watchllm::instrumentation {

namespace {

constexpr ModelPricing DEFAULT_PRICING{.input = 0.001, .output = 0.002};

constexpr std::array<std::pair<std::string_view, ModelPricing>, 3> FAMILY_PRICING = {{
    {"gpt-4", {.input = 0.03, .output = 0.06}},
    {"gpt-3", {.input = 0.0005, .output = 0.0015}},
    {"claude", {.input = 0.003, .output = 0.015}},
}};

} // namespace

const std::vector<std::pair<std::string, ModelPricing>> &pricing_table() {
  static const std::vector<std::pair<std::string, ModelPricing>> table = {
      // OpenAI
      {"gpt-4o", {.input = 0.0025, .output = 0.01}},
      {"gpt-4o-mini", {.input = 0.00015, .output = 0.0006}},
      {"gpt-4-turbo", {.input = 0.01, .output = 0.03}},
      {"gpt-4", {.input = 0.03, .output = 0.06}},
      {"gpt-3.5-turbo", {.input = 0.0005, .output = 0.0015}},
      {"o1", {.input = 0.015, .output = 0.06}},
      {"o1-mini", {.input = 0.003, .output = 0.012}},
      // Anthropic
      {"claude-3-5-sonnet-20241022", {.input = 0.003, .output = 0.015}},
      {"claude-3-5-sonnet-20240620", {.input = 0.003, .output = 0.015}},
      {"claude-3-opus-20240229", {.input = 0.015, .output = 0.075}},
      {"claude-3-sonnet-20240229", {.input = 0.003, .output = 0.015}},
      {"claude-3-haiku-20240307", {.input = 0.00025, .output = 0.00125}},
      {"claude-3-5-haiku-20241022", {.input = 0.001, .output = 0.005}},
      // Embeddings
      {"text-embedding-3-small", {.input = 0.00002, .output = 0.0}},
      {"text-embedding-3-large", {.input = 0.00013, .output = 0.0}},
      {"text-embedding-ada-002", {.input = 0.0001, .output = 0.0}},
  };
  return table;
}

ModelPricing lookup_pricing(const std::string_view model) {
  const auto &table = pricing_table();
  for (const auto &[key, pricing] : table) {
    if (model == key) {
      return pricing;
    }
  }

  const ModelPricing *best = nullptr;
  std::size_t best_length = 0;
  for (const auto &[key, pricing] : table) {
    if (key.size() > best_length && model.substr(0, key.size()) == key) {
      best = &pricing;
      best_length = key.size();
    }
  }
  if (best != nullptr) {
    return *best;
  }

  for (const auto &[family, pricing] : FAMILY_PRICING) {
    if (model.find(family) != std::string_view::npos) {
      return pricing;
    }
  }
  return DEFAULT_PRICING;
}

double calculate_cost(const std::string_view model, const std::int64_t tokens_input,
                      const std::int64_t tokens_output) {
  const ModelPricing pricing = lookup_pricing(model);
  return (static_cast<double>(tokens_input) * pricing.input +
          static_cast<double>(tokens_output) * pricing.output) /
         1000.0;
}

} // namespace watchllm::instrumentation
