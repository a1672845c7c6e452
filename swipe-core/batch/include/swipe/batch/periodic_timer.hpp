#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace swipe::batch {

  // Runs a task every `interval` on a dedicated thread. A tick runs to completion
  // before the next tick of the same timer can start. The task must not throw.
  class PeriodicTimer {
  public:
    using Task = std::function<void()>;

    // Throws std::invalid_argument on a non-positive interval or empty task.
    PeriodicTimer(std::string name, std::chrono::milliseconds interval, Task task);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;
    PeriodicTimer(PeriodicTimer&&) = delete;
    PeriodicTimer& operator=(PeriodicTimer&&) = delete;

    // No-op when already running.
    void start(bool run_immediately);

    // Prevents further ticks and waits for an in-flight tick to return.
    // Idempotent. Must not be called from inside the task.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

  private:
    void run(std::stop_token stop, bool run_immediately);

    std::string name_;
    std::chrono::milliseconds interval_;
    Task task_;

    std::mutex mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
  };

}  // namespace swipe::batch
