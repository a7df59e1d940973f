/**
 * @file signal_loop.cpp
 * @brief BlueZ signal subscription and dispatch thread
 */

#include "bluez.h"
#include <cstring>
#include <exception>
#include <spdlog/spdlog.h>

namespace bluescan {
namespace platform {

namespace {

constexpr int DISPATCH_TIMEOUT_MS = 100;

constexpr const char *INTERFACES_ADDED_MATCH =
    "type='signal',sender='org.bluez',"
    "interface='org.freedesktop.DBus.ObjectManager',member='InterfacesAdded'";

constexpr const char *PROPERTIES_CHANGED_MATCH =
    "type='signal',sender='org.bluez',"
    "interface='org.freedesktop.DBus.Properties',member='PropertiesChanged',"
    "arg0='org.bluez.Device1'";

} // namespace

SignalLoop::~SignalLoop() { close(); }

Result<void> SignalLoop::open() {
  // A loop that died with its connection is reopened from scratch
  close();

  auto conn_result = open_private_system_bus();
  if (conn_result.is_error()) {
    return conn_result.error();
  }
  conn_ = std::move(conn_result).value();

  for (const char *rule : {INTERFACES_ADDED_MATCH, PROPERTIES_CHANGED_MATCH}) {
    DBusErrorWrapper error;
    dbus_bus_add_match(conn_.get(), rule, error.get());
    if (error.is_set()) {
      Error err = error.to_error();
      conn_.reset();
      return err;
    }
  }

  if (!dbus_connection_add_filter(conn_.get(), &SignalLoop::filter, this,
                                  nullptr)) {
    conn_.reset();
    return Error(ErrorCode::PlatformError, "Failed to install D-Bus filter");
  }
  filter_installed_ = true;

  return Result<void>::ok();
}

void SignalLoop::on_interfaces_added(InterfacesAddedHandler handler) {
  interfaces_added_ = std::move(handler);
}

void SignalLoop::on_properties_changed(PropertiesChangedHandler handler) {
  properties_changed_ = std::move(handler);
}

void SignalLoop::on_disconnected(DisconnectedHandler handler) {
  disconnected_ = std::move(handler);
}

void SignalLoop::run() {
  if (!conn_ || running_) {
    return;
  }
  stop_requested_ = false;
  running_ = true;
  event_thread_ = std::thread([this] { loop(); });
}

void SignalLoop::halt() {
  stop_requested_ = true;
  if (event_thread_.joinable()) {
    event_thread_.join();
  }
  running_ = false;
}

void SignalLoop::close() {
  halt();
  if (conn_ && filter_installed_) {
    dbus_connection_remove_filter(conn_.get(), &SignalLoop::filter, this);
    filter_installed_ = false;
  }
  conn_.reset();
}

void SignalLoop::loop() {
  while (!stop_requested_) {
    if (!dbus_connection_read_write_dispatch(conn_.get(), DISPATCH_TIMEOUT_MS)) {
      SPDLOG_WARN("System bus connection lost");
      running_ = false;
      if (disconnected_) {
        disconnected_();
      }
      return;
    }
  }
}

DBusHandlerResult SignalLoop::filter(DBusConnection *conn, DBusMessage *msg,
                                     void *user_data) {
  BLUESCAN_UNUSED(conn);
  auto *self = static_cast<SignalLoop *>(user_data);

  try {
    if (dbus_message_is_signal(msg, DBUS_OBJECT_MANAGER_IFACE,
                               "InterfacesAdded")) {
      self->handle_interfaces_added(msg);
    } else if (dbus_message_is_signal(msg, DBUS_PROPERTIES_IFACE,
                                      "PropertiesChanged")) {
      self->handle_properties_changed(msg);
    }
  } catch (const std::exception &e) {
    SPDLOG_ERROR("BlueZ signal handler failed: {}", e.what());
  }

  // Other filters on the connection may want the same signal
  return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void SignalLoop::handle_interfaces_added(DBusMessage *msg) {
  if (!interfaces_added_) {
    return;
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) {
    return;
  }

  const char *path = nullptr;
  dbus_message_iter_get_basic(&iter, &path);
  dbus_message_iter_next(&iter);
  if (!path) {
    return;
  }

  interfaces_added_(path, read_interface_dict(&iter));
}

void SignalLoop::handle_properties_changed(DBusMessage *msg) {
  if (!properties_changed_) {
    return;
  }

  const char *path = dbus_message_get_path(msg);
  DBusMessageIter iter;
  if (!path || !dbus_message_iter_init(msg, &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) {
    return;
  }

  const char *iface = nullptr;
  dbus_message_iter_get_basic(&iter, &iface);
  if (!iface || std::strcmp(iface, BLUEZ_DEVICE_IFACE) != 0) {
    return;
  }
  dbus_message_iter_next(&iter);

  properties_changed_(path, read_property_dict(&iter));
}

} // namespace platform
} // namespace bluescan
