#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <swipe/common/logging.hpp>

namespace swipe {

  namespace {

    std::mutex& registry_mutex() {
      static std::mutex mutex;
      return mutex;
    }

    std::atomic<spdlog::level::level_enum> g_level{spdlog::level::info};

  }  // namespace

  std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    std::lock_guard lock(registry_mutex());
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    auto logger = spdlog::stdout_color_mt(name);
    logger->set_level(g_level.load(std::memory_order_relaxed));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
  }

  void set_log_level(spdlog::level::level_enum level) {
    std::lock_guard lock(registry_mutex());
    g_level.store(level, std::memory_order_relaxed);
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
      if (logger->name().starts_with("swipe.")) logger->set_level(level);
    });
  }

}  // namespace swipe
