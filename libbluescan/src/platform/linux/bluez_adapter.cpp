/**
 * @file bluez_adapter.cpp
 * @brief BlueZ adapter lookup and discovery control
 */

#include "bluez.h"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace bluescan {
namespace platform {

// ============================================================================
// BlueZ Adapter Discovery
// ============================================================================

Result<BlueZAdapter> find_adapter(DBusConnection *conn,
                                  const std::string &name) {
  auto objects = get_managed_objects(conn, BLUEZ_SERVICE);
  if (objects.is_error()) {
    return objects.error();
  }

  for (const auto &object : objects.value()) {
    auto iface = object.interfaces.find(BLUEZ_ADAPTER_IFACE);
    if (iface == object.interfaces.end()) {
      continue;
    }

    if (!name.empty()) {
      auto slash = object.path.rfind('/');
      if (object.path.compare(slash + 1, std::string::npos, name) != 0) {
        continue;
      }
    }

    const PropertyMap &props = iface->second;
    BlueZAdapter adapter;
    adapter.object_path = object.path;
    adapter.address = get_string(props, "Address").value_or("");
    adapter.name = get_string(props, "Name").value_or("");
    adapter.powered = get_bool(props, "Powered").value_or(false);
    adapter.discovering = get_bool(props, "Discovering").value_or(false);

    if (!adapter.powered) {
      return Error(ErrorCode::BluetoothOff,
                   "Bluetooth adapter " + adapter.object_path + " is off");
    }

    SPDLOG_DEBUG("Using adapter {} ({})", adapter.object_path, adapter.address);
    return adapter;
  }

  if (!name.empty()) {
    return Error(ErrorCode::HardwareNotAvailable,
                 "Bluetooth adapter " + name + " not found");
  }
  return Error(ErrorCode::HardwareNotAvailable, "No Bluetooth adapter found");
}

// ============================================================================
// Adapter Control
// ============================================================================

Result<void> set_discovery_filter(DBusConnection *conn,
                                  const std::string &adapter_path,
                                  const char *transport, bool duplicate_data) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, adapter_path.c_str(), BLUEZ_ADAPTER_IFACE,
      "SetDiscoveryFilter"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, dict_iter;
  dbus_message_iter_init_append(msg.get(), &iter);

  dbus_bool_t duplicates = duplicate_data ? TRUE : FALSE;
  bool built = dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}",
                                                &dict_iter) &&
               append_dict_entry(&dict_iter, "Transport", DBUS_TYPE_STRING,
                                 &transport) &&
               append_dict_entry(&dict_iter, "DuplicateData",
                                 DBUS_TYPE_BOOLEAN, &duplicates) &&
               dbus_message_iter_close_container(&iter, &dict_iter);
  if (!built) {
    return Error(ErrorCode::PlatformError, "Out of memory building filter");
  }

  auto reply = send_and_wait(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StartDiscovery");

  if (result.is_error()) {
    // Check if already discovering (not an error)
    if (result.error().message.find("InProgress") != std::string::npos) {
      return Result<void>::ok();
    }
    return Error(ErrorCode::DiscoveryFailed, result.error().message);
  }

  return Result<void>::ok();
}

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StopDiscovery");

  if (result.is_error()) {
    // Not discovering is not an error
    if (result.error().message.find("NotReady") != std::string::npos ||
        result.error().message.find("Failed: No discovery started") !=
            std::string::npos) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

// ============================================================================
// Devices
// ============================================================================

bool is_device_of(const std::string &path, const std::string &adapter_path) {
  const std::string prefix = adapter_path + "/dev_";
  return path.compare(0, prefix.size(), prefix) == 0 &&
         path.find('/', prefix.size()) == std::string::npos;
}

Result<std::vector<ManagedObject>>
get_adapter_devices(DBusConnection *conn, const std::string &adapter_path,
                    int timeout_ms) {
  auto objects = get_managed_objects(conn, BLUEZ_SERVICE, timeout_ms);
  if (objects.is_error()) {
    return objects.error();
  }

  std::vector<ManagedObject> devices;
  for (auto &object : objects.value()) {
    if (is_device_of(object.path, adapter_path) &&
        object.interfaces.count(BLUEZ_DEVICE_IFACE) != 0) {
      devices.push_back(std::move(object));
    }
  }
  return devices;
}

namespace {

// BlueZ falls back to "AA-BB-CC-DD-EE-FF" when a device has no name
bool looks_like_address(const std::string &alias, const std::string &address) {
  if (alias.size() != address.size()) {
    return false;
  }
  for (size_t i = 0; i < alias.size(); ++i) {
    char a = alias[i];
    char b = address[i];
    if (a == '-') {
      a = ':';
    }
    if (std::toupper(static_cast<unsigned char>(a)) !=
        std::toupper(static_cast<unsigned char>(b))) {
      return false;
    }
  }
  return true;
}

} // namespace

DeviceInformation device_information(const std::string &path,
                                     const PropertyMap &props) {
  DeviceInformation info;
  info.id = path;
  info.is_connected = get_bool(props, "Connected");
  info.is_paired = get_bool(props, "Paired").value_or(false);

  auto name = get_string(props, "Name");
  if (name && !name->empty()) {
    info.name = *name;
  } else {
    auto alias = get_string(props, "Alias");
    auto address = get_string(props, "Address").value_or("");
    if (alias && !looks_like_address(*alias, address)) {
      info.name = *alias;
    }
  }

  return info;
}

std::optional<BluetoothAddress> address_from_path(const std::string &path) {
  const std::string marker = "/dev_";
  auto pos = path.rfind(marker);
  if (pos == std::string::npos) {
    return std::nullopt;
  }

  std::string text = path.substr(pos + marker.size());
  std::replace(text.begin(), text.end(), '_', ':');
  return parse_bluetooth_address(text);
}

} // namespace platform
} // namespace bluescan
