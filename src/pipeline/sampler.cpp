#include "watchllm/pipeline/sampler.hpp"

#include <random>

namespace watchllm::pipeline {

bool Sampler::admit(const double rate) {
  if (rate >= 1.0) {
    return true;
  }
  if (!(rate > 0.0)) {
    return false;
  }
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng) < rate;
}

} // namespace watchllm::pipeline
