/**
 * @file scan_session.h
 * @brief Bounded discovery session over classic and BLE sources
 *
 * A ScanSession runs one discovery cycle:
 *
 *   Idle -> Scanning    store cleared, classic and BLE sources started
 *   Scanning            both sources feed the store for scan_duration
 *   -> Finalizing       sources stopped, pending observations applied
 *   -> Idle             ScanReport handed to the caller
 *
 * A source that fails to start or stop is logged and skipped. Only a
 * failure of the session itself reaches the on_error callback.
 */

#ifndef BLUESCAN_SCAN_SESSION_H
#define BLUESCAN_SCAN_SESSION_H

#include "bluetooth.h"
#include "config.h"
#include "device_store.h"
#include "error.h"
#include "platform.h"
#include "state_machine.h"
#include "types.h"
#include <functional>
#include <memory>
#include <string>

namespace bluescan {

/// Header shown when a session found nothing
constexpr const char *NO_DEVICES_MESSAGE =
    "No devices found. Make sure Bluetooth is enabled and devices are "
    "discoverable.";

/// Guidance attached to every session-level error
constexpr const char *TROUBLESHOOTING_TEXT =
    "Troubleshooting:\n"
    "1. Make sure Bluetooth is enabled\n"
    "2. Ensure devices are in pairing/discoverable mode\n"
    "3. Check that the bluetooth service is running and you may access it";

// ============================================================================
// Session Results
// ============================================================================

/**
 * @brief Finalized result of one session
 */
struct ScanReport {
  /// Records in first-discovery order
  DeviceRecordList records;

  size_t count() const { return records.size(); }
  bool empty() const { return records.empty(); }

  /// "Found N Device(s):" or NO_DEVICES_MESSAGE
  std::string message() const;
};

/**
 * @brief A session-level failure, as shown to the user
 */
struct SessionError {
  Error error;

  /// "Error scanning for devices: ..."
  std::string message;

  std::string troubleshooting = TROUBLESHOOTING_TEXT;
};

// ============================================================================
// Scan Session
// ============================================================================

/**
 * @brief Orchestrates one discovery run at a time
 *
 * @code
 *   auto platform = make_bluez_platform(config);
 *   ScanSession session(*platform);
 *   session.init(config);
 *
 *   session.on_error([](const SessionError &e) {
 *       std::cerr << e.message << "\n\n" << e.troubleshooting << std::endl;
 *   });
 *
 *   auto result = session.run();
 *   if (result) {
 *       std::cout << result.value().message() << std::endl;
 *   }
 * @endcode
 *
 * The platform must outlive the session.
 */
class BLUESCAN_API ScanSession {
public:
  explicit ScanSession(BluetoothPlatform &platform);
  ~ScanSession();

  // Non-copyable
  ScanSession(const ScanSession &) = delete;
  ScanSession &operator=(const ScanSession &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Validate and apply the configuration
   * @return InvalidArgument for a bad config, AlreadyInitialized if called
   *         twice
   */
  Result<void> init(const ScanConfig &config = {});

  bool is_initialized() const;

  const ScanConfig &config() const;

  // ========================================================================
  // Session Control
  // ========================================================================

  /**
   * @brief Run one full session (blocks for scan_duration)
   *
   * Returns SessionInProgress if a session is already running; that
   * session is not affected. When the session itself breaks down the
   * error is returned after on_error has fired (SessionFailed for an
   * exception outside source start). A source that fails or throws while
   * starting is logged and the session carries on with the other one.
   */
  Result<ScanReport> run();

  SessionState state() const;

  bool is_scanning() const;

  /// Live view of the records collected so far
  const DeviceRecordStore &store() const;

  // ========================================================================
  // Callbacks
  // ========================================================================

  void on_state_changed(SessionStateMachine::StateChangedCallback callback);

  /// Fired once per successful session with its report
  void on_completed(std::function<void(const ScanReport &)> callback);

  /// Fired once per failed session
  void on_error(std::function<void(const SessionError &)> callback);

  /// Coarse signal fired whenever the record store changes
  void on_devices_changed(std::function<void()> callback);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace bluescan

#endif // BLUESCAN_SCAN_SESSION_H
