#pragma once
#include "spdlog/spdlog.h"

namespace dryve {
// To be called in each top level executable
inline void configureLogger() {
  spdlog::set_level(
      static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
}
}  // namespace dryve
