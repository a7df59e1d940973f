/**
 * @file types.h
 * @brief Core type definitions for BlueScan
 */

#ifndef BLUESCAN_TYPES_H
#define BLUESCAN_TYPES_H

#include "platform.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bluescan {

// ============================================================================
// Status Strings
// ============================================================================

constexpr const char *STATUS_PAIRED = "Paired";
constexpr const char *STATUS_AVAILABLE = "Available";
constexpr const char *STATUS_CONNECTED = "Connected";

/// Default placeholder names used until a real name is observed
constexpr const char *UNKNOWN_DEVICE_NAME = "Unknown Device";
constexpr const char *UNKNOWN_BLE_DEVICE_NAME = "Unknown BLE Device";

// ============================================================================
// Device Record
// ============================================================================

/**
 * @brief One entry per physically distinct discovered device
 *
 * The id never changes once a record exists. The name only moves from a
 * placeholder to a real name. The status is whatever was observed last.
 */
struct DeviceRecord {
  std::string id;
  std::string name;
  std::string status;

  bool operator==(const DeviceRecord &other) const {
    return id == other.id && name == other.name && status == other.status;
  }
  bool operator!=(const DeviceRecord &other) const { return !(*this == other); }
};

using DeviceRecordList = std::vector<DeviceRecord>;

/**
 * @brief Check whether a name is a placeholder
 *
 * Empty names and names containing "unknown" (any case) are placeholders.
 */
BLUESCAN_API bool is_placeholder_name(const std::string &name);

// ============================================================================
// Observations
// ============================================================================

/**
 * @brief A normalized discovery event submitted by a source
 */
struct Observation {
  enum class Kind : uint8_t {
    /// Insert or merge a full (id, name, status) tuple
    Upsert = 0,
    /// Replace the status of an existing record, never insert
    StatusUpdate = 1
  };

  Kind kind = Kind::Upsert;
  std::string id;
  std::string name; // Empty for StatusUpdate
  std::string status;

  static Observation upsert(std::string id, std::string name,
                            std::string status) {
    return Observation{Kind::Upsert, std::move(id), std::move(name),
                       std::move(status)};
  }

  static Observation status_update(std::string id, std::string status) {
    return Observation{Kind::StatusUpdate, std::move(id), {},
                       std::move(status)};
  }
};

// ============================================================================
// Bluetooth Addresses
// ============================================================================

/// 48-bit hardware address stored in the low bits
using BluetoothAddress = uint64_t;

/**
 * @brief Render an address as 12 uppercase hex digits
 *
 * Bits above 48 are ignored. The same address always renders to the
 * same string, so it is usable as a record id.
 */
BLUESCAN_API std::string format_bluetooth_address(BluetoothAddress address);

/**
 * @brief Parse "AA:BB:CC:DD:EE:FF" into a numeric address
 */
BLUESCAN_API std::optional<BluetoothAddress>
parse_bluetooth_address(const std::string &text);

/**
 * @brief Status text for a received signal strength sample
 */
BLUESCAN_API std::string format_signal_status(int rssi_dbm);

} // namespace bluescan

#endif // BLUESCAN_TYPES_H
