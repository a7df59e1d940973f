/**
 * @file config.h
 * @brief Scan configuration for BlueScan
 */

#ifndef BLUESCAN_CONFIG_H
#define BLUESCAN_CONFIG_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace bluescan {

/**
 * @brief How the BLE listener gathers advertisements
 */
enum class ScanningMode : uint8_t {
  /// Only listen for advertisements
  Passive = 0,
  /// Send scan requests to solicit scan responses (better name resolution)
  Active = 1
};

BLUESCAN_API const char *scanning_mode_name(ScanningMode mode);

// ============================================================================
// Scan Configuration
// ============================================================================

/**
 * @brief Configuration for a scan session
 *
 * Values are fixed for the lifetime of a ScanSession.
 */
struct ScanConfig {
  /// Maximum accepted scan duration
  static constexpr std::chrono::milliseconds MAX_SCAN_DURATION{300000};

  /// How long both sources run before results are finalized
  std::chrono::milliseconds scan_duration{8000};

  /// D-Bus reply timeout the BlueZ backend applies to the paired-device query
  std::chrono::milliseconds paired_query_timeout{5000};

  /// BLE scanning mode
  ScanningMode scanning_mode = ScanningMode::Active;

  /// Adapter name (e.g. "hci0"); empty selects the first adapter
  std::string adapter;

  /// Name shown for classic devices until a real name is seen
  std::string unknown_device_name = UNKNOWN_DEVICE_NAME;

  /// Name shown for BLE devices until a real name is seen
  std::string unknown_ble_device_name = UNKNOWN_BLE_DEVICE_NAME;

  /// Restore every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;
};

/**
 * @brief Parse a whole number of seconds into a scan duration
 *
 * Accepts 1 to 300 seconds. Anything else, including values too large
 * to represent, is InvalidArgument.
 */
BLUESCAN_API Result<std::chrono::milliseconds>
parse_scan_duration(const std::string &seconds);

} // namespace bluescan

#endif // BLUESCAN_CONFIG_H
