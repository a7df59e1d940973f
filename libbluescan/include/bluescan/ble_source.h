/**
 * @file ble_source.h
 * @brief BLE advertisement discovery source
 */

#ifndef BLUESCAN_BLE_SOURCE_H
#define BLUESCAN_BLE_SOURCE_H

#include "bluetooth.h"
#include "config.h"
#include "error.h"
#include "intake.h"
#include "platform.h"
#include "types.h"
#include <memory>
#include <mutex>

namespace bluescan {

/**
 * @brief Feeds BLE advertisements into a scan session
 *
 * Every received advertisement becomes one upsert keyed by the hardware
 * address. A device advertising ten times a second produces ten upserts;
 * the store collapses them into one record holding the latest signal.
 */
class BLUESCAN_API BleAdvertisementSource {
public:
  BleAdvertisementSource(BluetoothPlatform &platform, ObservationSink sink,
                         const ScanConfig &config);
  ~BleAdvertisementSource();

  // Non-copyable
  BleAdvertisementSource(const BleAdvertisementSource &) = delete;
  BleAdvertisementSource &operator=(const BleAdvertisementSource &) = delete;

  /// Create the listener, configure the scanning mode and start it
  Result<void> start();

  /// Unregister the handler, then halt the listener if it is running
  Result<void> stop();

  bool is_running() const;

  /// Observation for one received advertisement
  static Observation from_advertisement(const AdvertisementReceived &adv,
                                        const std::string &unknown_name);

private:
  BluetoothPlatform &platform_;
  ObservationSink sink_;
  ScanConfig config_;

  mutable std::mutex mutex_;
  std::unique_ptr<AdvertisementWatcher> watcher_;
  Event<const AdvertisementReceived &>::Token received_token_ = 0;
};

} // namespace bluescan

#endif // BLUESCAN_BLE_SOURCE_H
