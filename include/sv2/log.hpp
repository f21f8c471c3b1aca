#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace sv2 {

// Library-wide logger named "sv2". Created on first use with a coloured
// stderr sink unless the host application registered one under that name.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace sv2
