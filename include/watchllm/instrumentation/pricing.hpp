#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace watchllm::instrumentation {

/// USD per 1000 tokens.
struct ModelPricing {
  double input = 0.0;
  double output = 0.0;
};

[[nodiscard]] const std::vector<std::pair<std::string, ModelPricing>> &pricing_table();

/// Exact match, then the longest table key the model id starts with, then the
/// "gpt-4" / "gpt-3" / "claude" family rates, then a generic default.
[[nodiscard]] ModelPricing lookup_pricing(std::string_view model);

[[nodiscard]] double calculate_cost(std::string_view model, std::int64_t tokens_input,
                                    std::int64_t tokens_output);

} // namespace watchllm::instrumentation
