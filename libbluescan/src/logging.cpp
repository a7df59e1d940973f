/**
 * @file logging.cpp
 * @brief Logger setup implementation
 */

#include "bluescan/logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace bluescan {

void setup_logger(spdlog::level::level_enum level) {
  auto logger = spdlog::get("bluescan");
  if (!logger) {
    logger = spdlog::stderr_color_mt("bluescan");
  }
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
}

} // namespace bluescan
