/**
 * @file bluetooth.h
 * @brief Platform discovery interfaces consumed by BlueScan
 *
 * These interfaces describe the Bluetooth stack at the boundary the
 * discovery sources need:
 *
 *   - PairedDeviceQuery: one-shot asynchronous "find all paired devices"
 *   - DeviceWatcher: live enumeration with added/updated/completed/stopped
 *   - AdvertisementWatcher: raw BLE advertisement listener
 *
 * The Linux implementation (BlueZ over D-Bus) is created with
 * make_bluez_platform(). Tests provide their own BluetoothPlatform.
 */

#ifndef BLUESCAN_BLUETOOTH_H
#define BLUESCAN_BLUETOOTH_H

#include "config.h"
#include "error.h"
#include "event.h"
#include "platform.h"
#include "types.h"
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bluescan {

// ============================================================================
// Device Information
// ============================================================================

/**
 * @brief A device reported by the paired query or the device watcher
 */
struct DeviceInformation {
  /// Platform endpoint identifier (BlueZ object path)
  std::string id;

  /// Display name; may be empty
  std::string name;

  /// Connectivity flag, absent when the platform did not report it
  std::optional<bool> is_connected;

  bool is_paired = false;
};

/**
 * @brief Changed properties of a device already reported as added
 *
 * Only properties that changed are present.
 */
struct DeviceInformationUpdate {
  std::string id;
  std::optional<bool> is_connected;
};

/**
 * @brief One received BLE advertisement packet
 */
struct AdvertisementReceived {
  /// Advertised local name; may be empty
  std::string local_name;

  BluetoothAddress bluetooth_address = 0;

  /// Received signal strength in dBm
  int16_t rssi_dbm = 0;
};

// ============================================================================
// Watcher Status
// ============================================================================

enum class WatcherStatus : uint8_t {
  Created = 0,
  Started = 1,
  EnumerationCompleted = 2,
  Stopping = 3,
  Stopped = 4,
  Aborted = 5
};

BLUESCAN_API const char *watcher_status_name(WatcherStatus status);

enum class AdvertisementWatcherStatus : uint8_t {
  Created = 0,
  Started = 1,
  Stopping = 2,
  Stopped = 3,
  Aborted = 4
};

BLUESCAN_API const char *
advertisement_watcher_status_name(AdvertisementWatcherStatus status);

// ============================================================================
// Paired Device Query
// ============================================================================

using PairedDeviceList = std::vector<DeviceInformation>;

/**
 * @brief One-shot query for devices already paired with this host
 */
class BLUESCAN_API PairedDeviceQuery {
public:
  virtual ~PairedDeviceQuery() = default;

  /**
   * @brief Start the query
   * @return Future resolved with the paired devices or an error
   */
  virtual std::future<Result<PairedDeviceList>> find_all_paired() = 0;
};

// ============================================================================
// Device Watcher
// ============================================================================

/**
 * @brief Live enumeration of discoverable classic devices
 *
 * Events may be raised on a platform thread.
 */
class BLUESCAN_API DeviceWatcher {
public:
  virtual ~DeviceWatcher() = default;

  virtual Result<void> start() = 0;

  /**
   * @brief Halt enumeration
   *
   * Only valid in Started or EnumerationCompleted; anything else is a
   * caller error and returns InvalidState.
   */
  virtual Result<void> stop() = 0;

  virtual WatcherStatus status() const = 0;

  Event<const DeviceInformation &> added;
  Event<const DeviceInformationUpdate &> updated;
  Event<> enumeration_completed;
  Event<> stopped;
};

// ============================================================================
// Advertisement Watcher
// ============================================================================

/**
 * @brief Continuous BLE advertisement listener
 *
 * Raises received once per advertisement; nothing is deduplicated.
 */
class BLUESCAN_API AdvertisementWatcher {
public:
  virtual ~AdvertisementWatcher() = default;

  virtual void set_scanning_mode(ScanningMode mode) = 0;
  virtual ScanningMode scanning_mode() const = 0;

  virtual Result<void> start() = 0;

  /**
   * @brief Halt listening
   *
   * Only valid in Started; anything else returns InvalidState.
   */
  virtual Result<void> stop() = 0;

  virtual AdvertisementWatcherStatus status() const = 0;

  Event<const AdvertisementReceived &> received;
};

// ============================================================================
// Platform Factory
// ============================================================================

/**
 * @brief Creates the platform discovery objects for one session
 */
class BLUESCAN_API BluetoothPlatform {
public:
  virtual ~BluetoothPlatform() = default;

  virtual Result<std::unique_ptr<PairedDeviceQuery>> create_paired_query() = 0;

  virtual Result<std::unique_ptr<DeviceWatcher>> create_device_watcher() = 0;

  virtual Result<std::unique_ptr<AdvertisementWatcher>>
  create_advertisement_watcher() = 0;
};

/**
 * @brief Create the BlueZ (D-Bus) platform
 * @param config Adapter selection is taken from the configuration
 */
BLUESCAN_API std::unique_ptr<BluetoothPlatform>
make_bluez_platform(const ScanConfig &config);

} // namespace bluescan

#endif // BLUESCAN_BLUETOOTH_H
