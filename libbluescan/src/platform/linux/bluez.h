/**
 * @file bluez.h
 * @brief BlueZ discovery types and internal declarations
 *
 * Internal types for the BlueZ implementation of the BlueScan platform
 * interfaces. Every watcher owns a private system bus connection, its
 * own BlueZ discovery session and a thread dispatching D-Bus signals.
 */

#ifndef BLUESCAN_PLATFORM_LINUX_BLUEZ_H
#define BLUESCAN_PLATFORM_LINUX_BLUEZ_H

#include "bluescan/bluetooth.h"
#include "dbus_helpers.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace bluescan {
namespace platform {

// BlueZ D-Bus constants
constexpr const char *BLUEZ_SERVICE = "org.bluez";
constexpr const char *BLUEZ_ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char *BLUEZ_DEVICE_IFACE = "org.bluez.Device1";
constexpr const char *DBUS_OBJECT_MANAGER_IFACE =
    "org.freedesktop.DBus.ObjectManager";
constexpr const char *DBUS_PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";

// Discovery filter transports
constexpr const char *TRANSPORT_BREDR = "bredr";
constexpr const char *TRANSPORT_LE = "le";

/**
 * @brief BlueZ adapter state
 */
struct BlueZAdapter {
  std::string object_path; // e.g., "/org/bluez/hci0"
  std::string address;     // MAC address
  std::string name;        // Adapter name
  bool powered = false;
  bool discovering = false;
};

// ============================================================================
// Adapter Control
// ============================================================================

/**
 * @brief Find a BlueZ adapter
 * @param name "hciN" to select a specific adapter, empty for the first one
 *
 * Returns HardwareNotAvailable when no adapter matches and BluetoothOff
 * when the adapter exists but is not powered.
 */
Result<BlueZAdapter> find_adapter(DBusConnection *conn,
                                  const std::string &name);

/**
 * @brief Restrict this connection's discovery session
 * @param transport "bredr" or "le"
 * @param duplicate_data Report every advertisement, not only changes
 */
Result<void> set_discovery_filter(DBusConnection *conn,
                                  const std::string &adapter_path,
                                  const char *transport, bool duplicate_data);

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path);

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path);

/**
 * @brief Device objects of one adapter, with their Device1 properties
 */
Result<std::vector<ManagedObject>>
get_adapter_devices(DBusConnection *conn, const std::string &adapter_path,
                    int timeout_ms = -1);

/**
 * @brief True if path is a device object below adapter_path
 */
bool is_device_of(const std::string &path, const std::string &adapter_path);

/**
 * @brief Build DeviceInformation from a Device1 property set
 *
 * Name is used when present, otherwise Alias. An Alias that merely
 * repeats the address is treated as no name.
 */
DeviceInformation device_information(const std::string &path,
                                     const PropertyMap &props);

/**
 * @brief Recover the address from a ".../dev_AA_BB_CC_DD_EE_FF" path
 */
std::optional<BluetoothAddress> address_from_path(const std::string &path);

// ============================================================================
// Signal Loop
// ============================================================================

/**
 * @brief Private bus connection plus the thread dispatching its signals
 *
 * Subscribes to InterfacesAdded and Device1 PropertiesChanged from BlueZ
 * and hands each one to the installed handlers on the loop thread.
 */
class SignalLoop {
public:
  using InterfacesAddedHandler =
      std::function<void(const std::string &path, const InterfaceMap &)>;
  using PropertiesChangedHandler =
      std::function<void(const std::string &path, const PropertyMap &)>;
  using DisconnectedHandler = std::function<void()>;

  SignalLoop() = default;
  ~SignalLoop();

  SignalLoop(const SignalLoop &) = delete;
  SignalLoop &operator=(const SignalLoop &) = delete;

  /**
   * @brief Open the connection and subscribe to BlueZ signals
   *
   * Signals arriving before run() are queued by libdbus.
   */
  Result<void> open();

  void on_interfaces_added(InterfacesAddedHandler handler);
  void on_properties_changed(PropertiesChangedHandler handler);

  /// Called on the loop thread if the bus connection drops
  void on_disconnected(DisconnectedHandler handler);

  /// Start dispatching on a background thread
  void run();

  /// Stop and join the dispatch thread; the connection stays open
  void halt();

  /// Remove the filter and close the connection
  void close();

  DBusConnection *connection() const { return conn_.get(); }

private:
  static DBusHandlerResult filter(DBusConnection *conn, DBusMessage *msg,
                                  void *user_data);
  void handle_interfaces_added(DBusMessage *msg);
  void handle_properties_changed(DBusMessage *msg);
  void loop();

  DBusConnectionWrapper conn_;
  bool filter_installed_ = false;

  InterfacesAddedHandler interfaces_added_;
  PropertiesChangedHandler properties_changed_;
  DisconnectedHandler disconnected_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread event_thread_;
};

// ============================================================================
// Platform Objects
// ============================================================================

/**
 * @brief Paired devices from the BlueZ object tree
 */
class BlueZPairedDeviceQuery : public PairedDeviceQuery {
public:
  BlueZPairedDeviceQuery(std::string adapter_name,
                         std::chrono::milliseconds timeout);

  std::future<Result<PairedDeviceList>> find_all_paired() override;

private:
  std::string adapter_name_;
  std::chrono::milliseconds timeout_;
};

/**
 * @brief BR/EDR discovery session reporting unpaired devices
 */
class BlueZDeviceWatcher : public DeviceWatcher {
public:
  explicit BlueZDeviceWatcher(std::string adapter_name);
  ~BlueZDeviceWatcher() override;

  Result<void> start() override;
  Result<void> stop() override;
  WatcherStatus status() const override { return status_.load(); }

private:
  void handle_interfaces_added(const std::string &path,
                               const InterfaceMap &interfaces);
  void handle_properties_changed(const std::string &path,
                                 const PropertyMap &changed);
  void handle_disconnected();

  std::string adapter_name_;
  BlueZAdapter adapter_;
  SignalLoop loop_;
  std::atomic<WatcherStatus> status_{WatcherStatus::Created};
};

/**
 * @brief LE discovery session raising one event per advertisement
 */
class BlueZAdvertisementWatcher : public AdvertisementWatcher {
public:
  explicit BlueZAdvertisementWatcher(std::string adapter_name);
  ~BlueZAdvertisementWatcher() override;

  void set_scanning_mode(ScanningMode mode) override { mode_ = mode; }
  ScanningMode scanning_mode() const override { return mode_; }

  Result<void> start() override;
  Result<void> stop() override;
  AdvertisementWatcherStatus status() const override { return status_.load(); }

private:
  struct KnownDevice {
    BluetoothAddress address = 0;
    std::string name;
  };

  void handle_interfaces_added(const std::string &path,
                               const InterfaceMap &interfaces);
  void handle_properties_changed(const std::string &path,
                                 const PropertyMap &changed);
  void handle_disconnected();

  std::string adapter_name_;
  ScanningMode mode_ = ScanningMode::Active;
  BlueZAdapter adapter_;
  SignalLoop loop_;
  std::atomic<AdvertisementWatcherStatus> status_{
      AdvertisementWatcherStatus::Created};

  // Only touched on the loop thread
  std::map<std::string, KnownDevice> known_;
};

/**
 * @brief BluetoothPlatform backed by BlueZ
 */
class BlueZPlatform : public BluetoothPlatform {
public:
  explicit BlueZPlatform(const ScanConfig &config);

  Result<std::unique_ptr<PairedDeviceQuery>> create_paired_query() override;
  Result<std::unique_ptr<DeviceWatcher>> create_device_watcher() override;
  Result<std::unique_ptr<AdvertisementWatcher>>
  create_advertisement_watcher() override;

private:
  std::string adapter_name_;
  std::chrono::milliseconds query_timeout_;
};

} // namespace platform
} // namespace bluescan

#endif // BLUESCAN_PLATFORM_LINUX_BLUEZ_H
