#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace swipe {

  // Named component logger, created on first use with a colored stdout sink.
  // Safe to call from any thread.
  [[nodiscard]] std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

  // Applies to every swipe logger, existing and future.
  void set_log_level(spdlog::level::level_enum level);

}  // namespace swipe
