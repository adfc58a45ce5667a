#include "watchllm/pipeline/flush_scheduler.hpp"

namespace watchllm::pipeline {

FlushScheduler::FlushScheduler(SchedulerConfig config, DepthFn depth, FlushFn flush)
    : state_(std::make_shared<State>()) {
  state_->config = config;
  state_->depth = std::move(depth);
  state_->flush = std::move(flush);
}

FlushScheduler::~FlushScheduler() { stop(std::chrono::milliseconds(0)); }

void FlushScheduler::start() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->running || thread_.joinable()) {
      return;
    }
    state_->running = true;
  }
  std::promise<void> finished;
  finished_ = finished.get_future();
  thread_ = std::thread([state = state_, done = std::move(finished)]() mutable {
    run_loop(state);
    done.set_value();
  });
}

void FlushScheduler::request_stop() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->running = false;
  }
  state_->cv.notify_all();
}

bool FlushScheduler::join(const std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) {
    return true;
  }
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
    return false;
  }
  if (finished_.wait_for(timeout) == std::future_status::ready) {
    thread_.join();
    return true;
  }
  thread_.detach();
  return false;
}

bool FlushScheduler::stop(const std::chrono::milliseconds timeout) {
  request_stop();
  return join(timeout);
}

void FlushScheduler::wake() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->woken = true;
  }
  state_->cv.notify_all();
}

bool FlushScheduler::is_running() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->running;
}

void FlushScheduler::run_loop(const std::shared_ptr<State> &state) {
  auto last_flush = std::chrono::steady_clock::now();
  std::unique_lock<std::mutex> lock(state->mutex);
  while (state->running) {
    state->cv.wait_for(lock, state->config.poll_interval,
                       [&state]() { return !state->running || state->woken; });
    if (!state->running) {
      break;
    }
    state->woken = false;
    lock.unlock();

    const std::size_t depth = state->depth();
    const auto elapsed = std::chrono::steady_clock::now() - last_flush;
    if (depth >= state->config.batch_size ||
        (depth > 0 && elapsed >= state->config.flush_interval)) {
      state->flush();
      last_flush = std::chrono::steady_clock::now();
    }

    lock.lock();
  }
}

} // namespace watchllm::pipeline
