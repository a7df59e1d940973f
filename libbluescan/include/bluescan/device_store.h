/**
 * @file device_store.h
 * @brief Ordered, deduplicated store of discovered devices
 *
 * The DeviceRecordStore is the one piece of shared mutable state in a
 * scan session. Both discovery sources feed it (through the
 * ObservationIntake) and the presentation layer reads snapshots of it.
 */

#ifndef BLUESCAN_DEVICE_STORE_H
#define BLUESCAN_DEVICE_STORE_H

#include "platform.h"
#include "types.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bluescan {

/**
 * @brief Mutable collection of DeviceRecords keyed by id
 *
 * Records keep the position of their first insertion. Thread-safe: every
 * operation runs under a single mutex, so no reader can observe a
 * partially-updated record.
 *
 * @code
 *   DeviceRecordStore store;
 *   store.upsert("000000001122", "Unknown BLE Device", "Signal: -70 dBm");
 *   store.upsert("000000001122", "Headphones", "Signal: -64 dBm");
 *   // one record: name "Headphones", status "Signal: -64 dBm"
 * @endcode
 */
class BLUESCAN_API DeviceRecordStore {
public:
  DeviceRecordStore() = default;

  // Non-copyable
  DeviceRecordStore(const DeviceRecordStore &) = delete;
  DeviceRecordStore &operator=(const DeviceRecordStore &) = delete;

  /**
   * @brief Insert a record or merge into the existing one
   *
   * A new id is appended. For an existing id the status is replaced and
   * the name is replaced only when the stored name is a placeholder and
   * the incoming one is not.
   *
   * @return Copy of the record after the merge
   */
  DeviceRecord upsert(const std::string &id, const std::string &name,
                      const std::string &status);

  /**
   * @brief Replace the status of an existing record
   * @return false if no record with this id exists (nothing is inserted)
   */
  bool update_status(const std::string &id, const std::string &status);

  /// Look up a record by id
  std::optional<DeviceRecord> find(const std::string &id) const;

  /// Remove all records
  void clear();

  /// Ordered copy of all records (first-discovery order)
  DeviceRecordList snapshot() const;

  size_t size() const;
  bool empty() const;

  /**
   * @brief Set callback fired after every mutation
   *
   * Invoked outside the store lock; it may read the store.
   */
  void on_changed(std::function<void()> callback);

private:
  void notify_changed();

  mutable std::mutex mutex_;
  DeviceRecordList records_;
  std::unordered_map<std::string, size_t> index_;

  std::mutex callback_mutex_;
  std::function<void()> changed_cb_;
};

} // namespace bluescan

#endif // BLUESCAN_DEVICE_STORE_H
