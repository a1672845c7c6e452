#include <stdexcept>
#include <swipe/batch/periodic_timer.hpp>
#include <utility>

namespace swipe::batch {

  PeriodicTimer::PeriodicTimer(std::string name, std::chrono::milliseconds interval, Task task)
      : name_(std::move(name)), interval_(interval), task_(std::move(task)) {
    if (interval_.count() <= 0) {
      throw std::invalid_argument("timer interval must be positive");
    }
    if (!task_) {
      throw std::invalid_argument("timer task must be callable");
    }
  }

  PeriodicTimer::~PeriodicTimer() { stop(); }

  void PeriodicTimer::start(bool run_immediately) {
    if (running_.exchange(true)) return;
    thread_ = std::jthread(
        [this, run_immediately](std::stop_token stop) { run(stop, run_immediately); });
  }

  void PeriodicTimer::stop() {
    if (!running_.exchange(false)) return;
    thread_.request_stop();
    if (thread_.joinable()) thread_.join();
  }

  void PeriodicTimer::run(std::stop_token stop, bool run_immediately) {
    if (run_immediately && !stop.stop_requested()) {
      task_();
      ticks_.fetch_add(1);
    }

    while (!stop.stop_requested()) {
      {
        std::unique_lock lock(mutex_);
        // Wakes early only when stop is requested.
        wake_.wait_for(lock, stop, interval_, [] { return false; });
      }
      if (stop.stop_requested()) break;
      task_();
      ticks_.fetch_add(1);
    }
  }

}  // namespace swipe::batch
