#include <iostream>

void run_config_benchmark();
void run_pipeline_benchmarks();
void run_concurrency_benchmark();

int main() {
  std::cout << "WatchLLM Benchmarks\n";
  run_config_benchmark();
  run_pipeline_benchmarks();
  run_concurrency_benchmark();
  return 0;
}
