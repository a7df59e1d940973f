/**
 * @file config.cpp
 * @brief Scan configuration implementation
 */

#include "bluescan/config.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace bluescan {

const char *scanning_mode_name(ScanningMode mode) {
  switch (mode) {
  case ScanningMode::Passive:
    return "Passive";
  case ScanningMode::Active:
    return "Active";
  default:
    return "Unknown";
  }
}

// ============================================================================
// ScanConfig Methods
// ============================================================================

void ScanConfig::load_defaults() {
  scan_duration = std::chrono::milliseconds(8000);
  paired_query_timeout = std::chrono::milliseconds(5000);
  scanning_mode = ScanningMode::Active;
  adapter.clear();
  unknown_device_name = UNKNOWN_DEVICE_NAME;
  unknown_ble_device_name = UNKNOWN_BLE_DEVICE_NAME;
}

Result<void> ScanConfig::validate() const {
  if (scan_duration.count() <= 0) {
    return Error(ErrorCode::InvalidArgument, "Scan duration must be positive");
  }

  if (scan_duration > MAX_SCAN_DURATION) {
    return Error(ErrorCode::InvalidArgument,
                 "Scan duration too long (max 300 seconds)");
  }

  if (paired_query_timeout.count() <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Paired query timeout must be positive");
  }

  // Adapter names look like "hci0"
  if (!adapter.empty()) {
    bool valid = adapter.size() > 3 && adapter.compare(0, 3, "hci") == 0;
    for (size_t i = 3; valid && i < adapter.size(); ++i) {
      valid = std::isdigit(static_cast<unsigned char>(adapter[i])) != 0;
    }
    if (!valid) {
      return Error(ErrorCode::InvalidArgument, "Invalid adapter name",
                   adapter);
    }
  }

  if (unknown_device_name.empty() || unknown_ble_device_name.empty()) {
    return Error(ErrorCode::InvalidArgument,
                 "Placeholder device names must not be empty");
  }

  // The store only upgrades names it recognizes as placeholders
  if (!is_placeholder_name(unknown_device_name) ||
      !is_placeholder_name(unknown_ble_device_name)) {
    return Error(ErrorCode::InvalidArgument,
                 "Placeholder device names must contain \"unknown\"");
  }

  return Result<void>::ok();
}

Result<std::chrono::milliseconds> parse_scan_duration(const std::string &seconds) {
  const char *text = seconds.c_str();
  char *end = nullptr;
  errno = 0;
  long value = std::strtol(text, &end, 10);

  BLUESCAN_REQUIRE(end != text && *end == '\0' && errno != ERANGE,
                   ErrorCode::InvalidArgument, "Invalid duration: " + seconds);
  BLUESCAN_REQUIRE(value > 0, ErrorCode::InvalidArgument,
                   "Scan duration must be positive");

  // Compared in seconds so the millisecond conversion cannot overflow
  auto max_seconds = std::chrono::duration_cast<std::chrono::seconds>(
      ScanConfig::MAX_SCAN_DURATION);
  BLUESCAN_REQUIRE(value <= max_seconds.count(), ErrorCode::InvalidArgument,
                   "Scan duration too long (max 300 seconds)");

  return std::chrono::milliseconds(std::chrono::seconds(value));
}

} // namespace bluescan
