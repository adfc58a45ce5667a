#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace watchllm::bench {

struct BenchResult {
  long long total_us = 0;
  double avg_us = 0.0;
  double ops_per_sec = 0.0;
};

inline BenchResult run_bench(const std::string &name, int iterations,
                             const std::function<void()> &fn) {
  fn(); // warm-up, not timed

  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();

  BenchResult result;
  result.total_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  result.avg_us = static_cast<double>(result.total_us) / static_cast<double>(iterations);
  result.ops_per_sec = result.avg_us > 0.0 ? 1'000'000.0 / result.avg_us : 0.0;
  std::cout << name << ": iterations=" << iterations << " total_us=" << result.total_us
            << " avg_us=" << result.avg_us << " ops_per_sec=" << result.ops_per_sec << "\n";
  return result;
}

} // namespace watchllm::bench
