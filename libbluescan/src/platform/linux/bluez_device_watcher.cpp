/**
 * @file bluez_device_watcher.cpp
 * @brief BR/EDR device enumeration over BlueZ
 *
 * The watcher reports devices BlueZ already knows about first, raises
 * enumeration_completed, then keeps reporting new devices and
 * connectivity changes until stopped. Paired devices are left to the
 * paired query.
 */

#include "bluez.h"
#include <spdlog/spdlog.h>

namespace bluescan {
namespace platform {

BlueZDeviceWatcher::BlueZDeviceWatcher(std::string adapter_name)
    : adapter_name_(std::move(adapter_name)) {}

BlueZDeviceWatcher::~BlueZDeviceWatcher() {
  auto current = status_.load();
  if (current == WatcherStatus::Started ||
      current == WatcherStatus::EnumerationCompleted) {
    auto result = stop();
    if (result.is_error()) {
      SPDLOG_WARN("Device watcher stop failed: {}", result.error().to_string());
    }
  }
  loop_.close();
}

Result<void> BlueZDeviceWatcher::start() {
  auto current = status_.load();
  if (current != WatcherStatus::Created && current != WatcherStatus::Stopped &&
      current != WatcherStatus::Aborted) {
    return Error(ErrorCode::InvalidState,
                 std::string("Device watcher cannot start while ") +
                     watcher_status_name(current));
  }

  BLUESCAN_TRY(loop_.open());
  DBusConnection *conn = loop_.connection();

  auto adapter_result = find_adapter(conn, adapter_name_);
  if (adapter_result.is_error()) {
    loop_.close();
    return adapter_result.error();
  }
  adapter_ = adapter_result.value();

  auto filter_result =
      set_discovery_filter(conn, adapter_.object_path, TRANSPORT_BREDR, false);
  if (filter_result.is_error()) {
    loop_.close();
    return filter_result;
  }

  auto discovery_result = start_discovery(conn, adapter_.object_path);
  if (discovery_result.is_error()) {
    loop_.close();
    return discovery_result;
  }

  loop_.on_interfaces_added(
      [this](const std::string &path, const InterfaceMap &interfaces) {
        handle_interfaces_added(path, interfaces);
      });
  loop_.on_properties_changed(
      [this](const std::string &path, const PropertyMap &changed) {
        handle_properties_changed(path, changed);
      });
  loop_.on_disconnected([this] { handle_disconnected(); });

  status_ = WatcherStatus::Started;
  SPDLOG_DEBUG("BR/EDR discovery started on {}", adapter_.object_path);

  // Devices BlueZ already knows about
  auto known = get_adapter_devices(conn, adapter_.object_path);
  if (known.is_error()) {
    SPDLOG_WARN("Initial device enumeration failed: {}",
                known.error().to_string());
  } else {
    for (const auto &object : known.value()) {
      handle_interfaces_added(object.path, object.interfaces);
    }
  }

  status_ = WatcherStatus::EnumerationCompleted;
  enumeration_completed.emit();

  loop_.run();
  return Result<void>::ok();
}

Result<void> BlueZDeviceWatcher::stop() {
  auto current = status_.load();
  if (current != WatcherStatus::Started &&
      current != WatcherStatus::EnumerationCompleted) {
    return Error(ErrorCode::InvalidState,
                 std::string("Device watcher cannot stop while ") +
                     watcher_status_name(current));
  }

  status_ = WatcherStatus::Stopping;
  loop_.halt();

  auto result = stop_discovery(loop_.connection(), adapter_.object_path);
  loop_.close();

  status_ = WatcherStatus::Stopped;
  stopped.emit();
  SPDLOG_DEBUG("BR/EDR discovery stopped on {}", adapter_.object_path);
  return result;
}

void BlueZDeviceWatcher::handle_interfaces_added(
    const std::string &path, const InterfaceMap &interfaces) {
  if (!is_device_of(path, adapter_.object_path)) {
    return;
  }

  auto device = interfaces.find(BLUEZ_DEVICE_IFACE);
  if (device == interfaces.end()) {
    return;
  }

  DeviceInformation info = device_information(path, device->second);
  if (info.is_paired) {
    return;
  }

  added.emit(info);
}

void BlueZDeviceWatcher::handle_properties_changed(const std::string &path,
                                                   const PropertyMap &changed) {
  if (!is_device_of(path, adapter_.object_path)) {
    return;
  }

  DeviceInformationUpdate update;
  update.id = path;
  update.is_connected = get_bool(changed, "Connected");
  if (!update.is_connected) {
    return;
  }

  updated.emit(update);
}

void BlueZDeviceWatcher::handle_disconnected() {
  status_ = WatcherStatus::Aborted;
  stopped.emit();
}

} // namespace platform
} // namespace bluescan
