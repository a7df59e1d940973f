/**
 * @file logging.h
 * @brief Logger setup for BlueScan
 *
 * The library logs through the spdlog default logger using the SPDLOG_*
 * macros. Applications call setup_logger() once at start-up; without it
 * spdlog's stock default logger is used.
 */

#ifndef BLUESCAN_LOGGING_H
#define BLUESCAN_LOGGING_H

#include "platform.h"
#include <spdlog/common.h>

namespace bluescan {

/**
 * @brief Install a colored console logger as the spdlog default
 * @param level Minimum level that is emitted
 */
BLUESCAN_API void setup_logger(spdlog::level::level_enum level);

} // namespace bluescan

#endif // BLUESCAN_LOGGING_H
