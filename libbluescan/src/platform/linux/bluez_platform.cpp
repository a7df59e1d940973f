/**
 * @file bluez_platform.cpp
 * @brief BlueZ platform factory and paired device query
 */

#include "bluez.h"
#include <spdlog/spdlog.h>

namespace bluescan {

namespace platform {

// ============================================================================
// Paired Device Query
// ============================================================================

BlueZPairedDeviceQuery::BlueZPairedDeviceQuery(
    std::string adapter_name, std::chrono::milliseconds timeout)
    : adapter_name_(std::move(adapter_name)), timeout_(timeout) {}

std::future<Result<PairedDeviceList>> BlueZPairedDeviceQuery::find_all_paired() {
  std::string adapter_name = adapter_name_;
  int timeout_ms = static_cast<int>(timeout_.count());

  return std::async(std::launch::async, [adapter_name, timeout_ms]()
                                            -> Result<PairedDeviceList> {
    auto conn_result = open_private_system_bus();
    if (conn_result.is_error()) {
      return conn_result.error();
    }
    DBusConnection *conn = conn_result.value().get();

    auto objects = get_managed_objects(conn, BLUEZ_SERVICE, timeout_ms);
    if (objects.is_error()) {
      return objects.error();
    }

    // Paired devices stay listed while the adapter is off, so the
    // adapter is only looked up, not required to be powered
    std::string adapter_path;
    for (const auto &object : objects.value()) {
      if (object.interfaces.count(BLUEZ_ADAPTER_IFACE) == 0) {
        continue;
      }
      auto slash = object.path.rfind('/');
      if (adapter_name.empty() ||
          object.path.compare(slash + 1, std::string::npos, adapter_name) ==
              0) {
        adapter_path = object.path;
        break;
      }
    }

    if (adapter_path.empty()) {
      return Error(ErrorCode::HardwareNotAvailable,
                   "No Bluetooth adapter found");
    }

    PairedDeviceList devices;
    for (const auto &object : objects.value()) {
      if (!is_device_of(object.path, adapter_path)) {
        continue;
      }
      auto device = object.interfaces.find(BLUEZ_DEVICE_IFACE);
      if (device == object.interfaces.end()) {
        continue;
      }

      DeviceInformation info = device_information(object.path, device->second);
      if (info.is_paired) {
        devices.push_back(std::move(info));
      }
    }

    SPDLOG_DEBUG("{} paired device(s) on {}", devices.size(), adapter_path);
    return devices;
  });
}

// ============================================================================
// BlueZ Platform
// ============================================================================

BlueZPlatform::BlueZPlatform(const ScanConfig &config)
    : adapter_name_(config.adapter),
      query_timeout_(config.paired_query_timeout) {}

Result<std::unique_ptr<PairedDeviceQuery>>
BlueZPlatform::create_paired_query() {
  return std::unique_ptr<PairedDeviceQuery>(
      std::make_unique<BlueZPairedDeviceQuery>(adapter_name_, query_timeout_));
}

Result<std::unique_ptr<DeviceWatcher>> BlueZPlatform::create_device_watcher() {
  return std::unique_ptr<DeviceWatcher>(
      std::make_unique<BlueZDeviceWatcher>(adapter_name_));
}

Result<std::unique_ptr<AdvertisementWatcher>>
BlueZPlatform::create_advertisement_watcher() {
  return std::unique_ptr<AdvertisementWatcher>(
      std::make_unique<BlueZAdvertisementWatcher>(adapter_name_));
}

} // namespace platform

std::unique_ptr<BluetoothPlatform> make_bluez_platform(const ScanConfig &config) {
  return std::make_unique<platform::BlueZPlatform>(config);
}

} // namespace bluescan
