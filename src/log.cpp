#include "sv2/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sv2 {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> log = [] {
    auto existing = spdlog::get("sv2");
    if (existing) return existing;
    return spdlog::stderr_color_mt("sv2");
  }();
  return log;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace sv2
