#pragma once

namespace watchllm::pipeline {

/// Probabilistic admission filter. Each thread draws from its own generator.
class Sampler {
public:
  explicit Sampler(double rate = 1.0) : rate_(rate) {}

  [[nodiscard]] bool admit() const { return admit(rate_); }
  [[nodiscard]] static bool admit(double rate);

  [[nodiscard]] double rate() const { return rate_; }

private:
  double rate_;
};

} // namespace watchllm::pipeline
