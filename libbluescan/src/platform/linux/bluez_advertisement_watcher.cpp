/**
 * @file bluez_advertisement_watcher.cpp
 * @brief BLE advertisement listening over BlueZ
 *
 * BlueZ has no raw advertisement callback for clients. With the LE
 * discovery filter's DuplicateData set, every advertisement refreshes the
 * device's RSSI property, so each RSSI report is raised as one received
 * event.
 */

#include "bluez.h"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace bluescan {
namespace platform {

namespace {

int16_t to_rssi(int64_t value) {
  value = std::max<int64_t>(value, std::numeric_limits<int16_t>::min());
  value = std::min<int64_t>(value, std::numeric_limits<int16_t>::max());
  return static_cast<int16_t>(value);
}

} // namespace

BlueZAdvertisementWatcher::BlueZAdvertisementWatcher(std::string adapter_name)
    : adapter_name_(std::move(adapter_name)) {}

BlueZAdvertisementWatcher::~BlueZAdvertisementWatcher() {
  if (status_.load() == AdvertisementWatcherStatus::Started) {
    auto result = stop();
    if (result.is_error()) {
      SPDLOG_WARN("Advertisement watcher stop failed: {}",
                  result.error().to_string());
    }
  }
  loop_.close();
}

Result<void> BlueZAdvertisementWatcher::start() {
  auto current = status_.load();
  if (current != AdvertisementWatcherStatus::Created &&
      current != AdvertisementWatcherStatus::Stopped &&
      current != AdvertisementWatcherStatus::Aborted) {
    return Error(ErrorCode::InvalidState,
                 std::string("Advertisement watcher cannot start while ") +
                     advertisement_watcher_status_name(current));
  }

  if (mode_ == ScanningMode::Passive) {
    return Error(ErrorCode::NotSupported,
                 "BlueZ discovery does not offer passive scanning");
  }

  BLUESCAN_TRY(loop_.open());
  DBusConnection *conn = loop_.connection();

  auto adapter_result = find_adapter(conn, adapter_name_);
  if (adapter_result.is_error()) {
    loop_.close();
    return Error(ErrorCode::BleScanFailed, adapter_result.error().message);
  }
  adapter_ = adapter_result.value();

  auto filter_result =
      set_discovery_filter(conn, adapter_.object_path, TRANSPORT_LE, true);
  if (filter_result.is_error()) {
    loop_.close();
    return filter_result;
  }

  // Seed names and addresses of devices BlueZ already caches
  known_.clear();
  auto cached = get_adapter_devices(conn, adapter_.object_path);
  if (cached.is_ok()) {
    for (const auto &object : cached.value()) {
      const PropertyMap &props = object.interfaces.at(BLUEZ_DEVICE_IFACE);
      KnownDevice device;
      auto address = parse_bluetooth_address(
          get_string(props, "Address").value_or(""));
      device.address = address ? *address
                               : address_from_path(object.path).value_or(0);
      device.name = get_string(props, "Name").value_or("");
      known_[object.path] = device;
    }
  }

  auto discovery_result = start_discovery(conn, adapter_.object_path);
  if (discovery_result.is_error()) {
    loop_.close();
    return Error(ErrorCode::BleScanFailed, discovery_result.error().message);
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

  status_ = AdvertisementWatcherStatus::Started;
  loop_.run();

  SPDLOG_DEBUG("LE discovery started on {}", adapter_.object_path);
  return Result<void>::ok();
}

Result<void> BlueZAdvertisementWatcher::stop() {
  auto current = status_.load();
  if (current != AdvertisementWatcherStatus::Started) {
    return Error(ErrorCode::InvalidState,
                 std::string("Advertisement watcher cannot stop while ") +
                     advertisement_watcher_status_name(current));
  }

  status_ = AdvertisementWatcherStatus::Stopping;
  loop_.halt();

  auto result = stop_discovery(loop_.connection(), adapter_.object_path);
  loop_.close();

  status_ = AdvertisementWatcherStatus::Stopped;
  SPDLOG_DEBUG("LE discovery stopped on {}", adapter_.object_path);
  return result;
}

void BlueZAdvertisementWatcher::handle_interfaces_added(
    const std::string &path, const InterfaceMap &interfaces) {
  if (!is_device_of(path, adapter_.object_path)) {
    return;
  }

  auto device = interfaces.find(BLUEZ_DEVICE_IFACE);
  if (device == interfaces.end()) {
    return;
  }
  const PropertyMap &props = device->second;

  KnownDevice &known = known_[path];
  auto address =
      parse_bluetooth_address(get_string(props, "Address").value_or(""));
  known.address = address ? *address : address_from_path(path).value_or(0);
  known.name = get_string(props, "Name").value_or("");

  auto rssi = get_int(props, "RSSI");
  if (!rssi) {
    return;
  }

  AdvertisementReceived adv;
  adv.local_name = known.name;
  adv.bluetooth_address = known.address;
  adv.rssi_dbm = to_rssi(*rssi);
  received.emit(adv);
}

void BlueZAdvertisementWatcher::handle_properties_changed(
    const std::string &path, const PropertyMap &changed) {
  if (!is_device_of(path, adapter_.object_path)) {
    return;
  }

  auto it = known_.find(path);
  if (it == known_.end()) {
    KnownDevice device;
    device.address = address_from_path(path).value_or(0);
    it = known_.emplace(path, device).first;
  }

  auto name = get_string(changed, "Name");
  if (name) {
    it->second.name = *name;
  }

  auto rssi = get_int(changed, "RSSI");
  if (!rssi) {
    return;
  }

  AdvertisementReceived adv;
  adv.local_name = it->second.name;
  adv.bluetooth_address = it->second.address;
  adv.rssi_dbm = to_rssi(*rssi);
  received.emit(adv);
}

void BlueZAdvertisementWatcher::handle_disconnected() {
  status_ = AdvertisementWatcherStatus::Aborted;
}

} // namespace platform
} // namespace bluescan
