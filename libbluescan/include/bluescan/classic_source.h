/**
 * @file classic_source.h
 * @brief Classic/paired Bluetooth discovery source
 */

#ifndef BLUESCAN_CLASSIC_SOURCE_H
#define BLUESCAN_CLASSIC_SOURCE_H

#include "bluetooth.h"
#include "config.h"
#include "error.h"
#include "intake.h"
#include "platform.h"
#include "types.h"
#include <memory>
#include <mutex>
#include <optional>

namespace bluescan {

/**
 * @brief Feeds classic Bluetooth devices into a scan session
 *
 * Combines two platform sub-protocols:
 *   - a one-shot paired-device query, posted with status "Paired"
 *   - a live device watcher whose added/updated events are normalized
 *     and posted as they arrive
 *
 * The source never touches the store directly; everything goes through
 * the ObservationSink it was constructed with.
 */
class BLUESCAN_API ClassicDiscoverySource {
public:
  ClassicDiscoverySource(BluetoothPlatform &platform, ObservationSink sink,
                         const ScanConfig &config);
  ~ClassicDiscoverySource();

  // Non-copyable
  ClassicDiscoverySource(const ClassicDiscoverySource &) = delete;
  ClassicDiscoverySource &operator=(const ClassicDiscoverySource &) = delete;

  /**
   * @brief Start the watcher, then run the paired query
   *
   * Blocks until the paired query answers. A failed query is logged and
   * contributes no devices. A watcher that cannot be created or started is reported as
   * the returned error, after the paired query has still been run.
   */
  Result<void> start();

  /**
   * @brief Unregister handlers, then halt the watcher if it is running
   *
   * Safe to call repeatedly.
   */
  Result<void> stop();

  /// True between a start() that created a watcher and stop()
  bool is_running() const;

  // ========================================================================
  // Normalization
  // ========================================================================

  /// Observation for a newly discovered device
  static Observation from_added(const DeviceInformation &info,
                                const std::string &unknown_name);

  /// Observation for a property change; nullopt when connectivity is unchanged
  static std::optional<Observation>
  from_update(const DeviceInformationUpdate &update);

  /// Observation for a device returned by the paired query
  static Observation from_paired(const DeviceInformation &info,
                                 const std::string &unknown_name);

private:
  Result<void> start_watcher();
  void run_paired_query();
  void post(Observation observation);
  void unregister_handlers();

  BluetoothPlatform &platform_;
  ObservationSink sink_;
  ScanConfig config_;

  mutable std::mutex mutex_;
  std::unique_ptr<DeviceWatcher> watcher_;
  std::unique_ptr<PairedDeviceQuery> paired_query_;

  Event<const DeviceInformation &>::Token added_token_ = 0;
  Event<const DeviceInformationUpdate &>::Token updated_token_ = 0;
  Event<>::Token completed_token_ = 0;
  Event<>::Token stopped_token_ = 0;
};

} // namespace bluescan

#endif // BLUESCAN_CLASSIC_SOURCE_H
