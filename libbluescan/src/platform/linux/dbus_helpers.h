/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for the Linux platform layer
 *
 * RAII wrappers around libdbus objects plus helpers for the message
 * shapes BlueZ uses (a{sv} property dictionaries, ObjectManager trees).
 */

#ifndef BLUESCAN_PLATFORM_LINUX_DBUS_HELPERS_H
#define BLUESCAN_PLATFORM_LINUX_DBUS_HELPERS_H

#include "bluescan/error.h"
#include <cstdint>
#include <dbus/dbus.h>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bluescan {
namespace platform {

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 *
 * Private connections are closed before the last reference is dropped,
 * as libdbus requires.
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool is_private = false)
      : conn_(conn), private_(is_private) {}

  ~DBusConnectionWrapper() { reset(); }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_), private_(other.private_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      reset();
      conn_ = other.conn_;
      private_ = other.private_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  operator bool() const { return conn_ != nullptr; }

  void reset() {
    if (conn_) {
      if (private_) {
        dbus_connection_close(conn_);
      }
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

private:
  DBusConnection *conn_ = nullptr;
  bool private_ = false;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Map a DBusError onto a BlueScan Error
 *
 * Well-known BlueZ and bus errors get a specific code so callers can tell
 * "adapter off" from "no permission".
 */
inline Error dbus_error_to_bluescan(const DBusError &err) {
  if (!dbus_error_is_set(&err)) {
    return Error();
  }

  std::string name = err.name ? err.name : "";
  std::string message = name.empty() ? "D-Bus error" : name;
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  ErrorCode code = ErrorCode::PlatformError;
  if (name == DBUS_ERROR_ACCESS_DENIED || name == "org.bluez.Error.NotAuthorized" ||
      name == "org.bluez.Error.NotPermitted") {
    code = ErrorCode::PermissionDenied;
  } else if (name == DBUS_ERROR_SERVICE_UNKNOWN ||
             name == DBUS_ERROR_NAME_HAS_NO_OWNER ||
             name == DBUS_ERROR_NO_SERVER || name == DBUS_ERROR_FILE_NOT_FOUND) {
    code = ErrorCode::ServiceUnavailable;
  } else if (name == DBUS_ERROR_NO_REPLY || name == DBUS_ERROR_TIMEOUT) {
    code = ErrorCode::Timeout;
  } else if (name == "org.bluez.Error.NotReady") {
    code = ErrorCode::BluetoothOff;
  } else if (name == "org.bluez.Error.NotSupported") {
    code = ErrorCode::NotSupported;
  }

  return Error(code, message);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_bluescan(err_); }

  const char *name() const { return err_.name; }
  const char *message() const { return err_.message; }

private:
  DBusError err_;
};

// ============================================================================
// Connections
// ============================================================================

/**
 * @brief Open a private system bus connection
 *
 * Each watcher owns its own connection so BlueZ tracks its discovery
 * session separately and its signal filter sees only its own traffic.
 */
inline Result<DBusConnectionWrapper> open_private_system_bus() {
  static std::once_flag threads_once;
  std::call_once(threads_once, [] { dbus_threads_init_default(); });

  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    if (error.is_set()) {
      return error.to_error();
    }
    return Error(ErrorCode::ServiceUnavailable,
                 "Failed to connect to the system bus");
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn, true);
}

// ============================================================================
// Method Calls
// ============================================================================

/**
 * @brief Send a prepared method call and wait for the reply
 * @param timeout_ms Timeout in milliseconds (-1 for default)
 */
inline Result<DBusMessageWrapper> send_and_wait(DBusConnection *conn,
                                                DBusMessage *msg,
                                                int timeout_ms = -1) {
  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg, timeout_ms, error.get());

  if (!reply || error.is_set()) {
    if (reply) {
      dbus_message_unref(reply);
    }
    if (error.is_set()) {
      return error.to_error();
    }
    return Error(ErrorCode::PlatformError, "No reply from D-Bus");
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Call a D-Bus method without arguments and get the reply
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method, int timeout_ms = -1) {

  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  return send_and_wait(conn, msg.get(), timeout_ms);
}

// ============================================================================
// Property Dictionaries
// ============================================================================

/// Value of one a{sv} entry; unsupported types are kept as monostate
using PropertyValue = std::variant<std::monostate, std::string, bool, int64_t>;

using PropertyMap = std::map<std::string, PropertyValue>;

/// Interface name -> properties, as found in InterfacesAdded and
/// GetManagedObjects
using InterfaceMap = std::map<std::string, PropertyMap>;

/**
 * @brief One object from org.freedesktop.DBus.ObjectManager
 */
struct ManagedObject {
  std::string path;
  InterfaceMap interfaces;
};

/**
 * @brief Read the basic value inside a variant iterator
 */
inline PropertyValue read_variant(DBusMessageIter *variant_iter) {
  DBusMessageIter inner;
  dbus_message_iter_recurse(variant_iter, &inner);

  switch (dbus_message_iter_get_arg_type(&inner)) {
  case DBUS_TYPE_STRING:
  case DBUS_TYPE_OBJECT_PATH: {
    const char *value = nullptr;
    dbus_message_iter_get_basic(&inner, &value);
    return std::string(value ? value : "");
  }
  case DBUS_TYPE_BOOLEAN: {
    dbus_bool_t value = FALSE;
    dbus_message_iter_get_basic(&inner, &value);
    return value != FALSE;
  }
  case DBUS_TYPE_BYTE: {
    uint8_t value = 0;
    dbus_message_iter_get_basic(&inner, &value);
    return static_cast<int64_t>(value);
  }
  case DBUS_TYPE_INT16: {
    dbus_int16_t value = 0;
    dbus_message_iter_get_basic(&inner, &value);
    return static_cast<int64_t>(value);
  }
  case DBUS_TYPE_UINT16: {
    dbus_uint16_t value = 0;
    dbus_message_iter_get_basic(&inner, &value);
    return static_cast<int64_t>(value);
  }
  case DBUS_TYPE_INT32: {
    dbus_int32_t value = 0;
    dbus_message_iter_get_basic(&inner, &value);
    return static_cast<int64_t>(value);
  }
  case DBUS_TYPE_UINT32: {
    dbus_uint32_t value = 0;
    dbus_message_iter_get_basic(&inner, &value);
    return static_cast<int64_t>(value);
  }
  default:
    return std::monostate{};
  }
}

/**
 * @brief Parse an a{sv} dictionary the iterator points at
 */
inline PropertyMap read_property_dict(DBusMessageIter *iter) {
  PropertyMap props;
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return props;
  }

  DBusMessageIter dict_iter;
  dbus_message_iter_recurse(iter, &dict_iter);

  while (dbus_message_iter_get_arg_type(&dict_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter;
    dbus_message_iter_recurse(&dict_iter, &entry_iter);

    const char *key = nullptr;
    if (dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_STRING) {
      dbus_message_iter_get_basic(&entry_iter, &key);
      dbus_message_iter_next(&entry_iter);
      if (key &&
          dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_VARIANT) {
        props[key] = read_variant(&entry_iter);
      }
    }

    dbus_message_iter_next(&dict_iter);
  }

  return props;
}

/**
 * @brief Parse an a{sa{sv}} interface dictionary
 */
inline InterfaceMap read_interface_dict(DBusMessageIter *iter) {
  InterfaceMap interfaces;
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
    return interfaces;
  }

  DBusMessageIter dict_iter;
  dbus_message_iter_recurse(iter, &dict_iter);

  while (dbus_message_iter_get_arg_type(&dict_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter;
    dbus_message_iter_recurse(&dict_iter, &entry_iter);

    const char *iface = nullptr;
    if (dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_STRING) {
      dbus_message_iter_get_basic(&entry_iter, &iface);
      dbus_message_iter_next(&entry_iter);
      if (iface) {
        interfaces[iface] = read_property_dict(&entry_iter);
      }
    }

    dbus_message_iter_next(&dict_iter);
  }

  return interfaces;
}

/**
 * @brief Call GetManagedObjects and parse the whole object tree
 */
inline Result<std::vector<ManagedObject>>
get_managed_objects(DBusConnection *conn, const char *dest,
                    int timeout_ms = -1) {
  auto reply = call_method(conn, dest, "/",
                           "org.freedesktop.DBus.ObjectManager",
                           "GetManagedObjects", timeout_ms);
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter)) {
    return Error(ErrorCode::PlatformError, "Empty reply from GetManagedObjects");
  }

  if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
    return Error(ErrorCode::PlatformError, "Unexpected reply format");
  }

  std::vector<ManagedObject> objects;
  DBusMessageIter dict_iter;
  dbus_message_iter_recurse(&iter, &dict_iter);

  while (dbus_message_iter_get_arg_type(&dict_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter;
    dbus_message_iter_recurse(&dict_iter, &entry_iter);

    const char *path = nullptr;
    if (dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_OBJECT_PATH) {
      dbus_message_iter_get_basic(&entry_iter, &path);
      dbus_message_iter_next(&entry_iter);
      if (path) {
        objects.push_back(ManagedObject{path, read_interface_dict(&entry_iter)});
      }
    }

    dbus_message_iter_next(&dict_iter);
  }

  return objects;
}

// ============================================================================
// Property Access
// ============================================================================

inline std::optional<std::string> get_string(const PropertyMap &props,
                                             const std::string &key) {
  auto it = props.find(key);
  if (it == props.end() || !std::holds_alternative<std::string>(it->second)) {
    return std::nullopt;
  }
  return std::get<std::string>(it->second);
}

inline std::optional<bool> get_bool(const PropertyMap &props,
                                    const std::string &key) {
  auto it = props.find(key);
  if (it == props.end() || !std::holds_alternative<bool>(it->second)) {
    return std::nullopt;
  }
  return std::get<bool>(it->second);
}

inline std::optional<int64_t> get_int(const PropertyMap &props,
                                      const std::string &key) {
  auto it = props.find(key);
  if (it == props.end() || !std::holds_alternative<int64_t>(it->second)) {
    return std::nullopt;
  }
  return std::get<int64_t>(it->second);
}

// ============================================================================
// Dictionary Building
// ============================================================================

/**
 * @brief Append one {sv} entry with a basic value to an open a{sv}
 */
inline bool append_dict_entry(DBusMessageIter *dict_iter, const char *key,
                              int type, const void *value) {
  DBusMessageIter entry_iter, variant_iter;
  char type_sig[2] = {static_cast<char>(type), '\0'};

  return dbus_message_iter_open_container(dict_iter, DBUS_TYPE_DICT_ENTRY,
                                          nullptr, &entry_iter) &&
         dbus_message_iter_append_basic(&entry_iter, DBUS_TYPE_STRING, &key) &&
         dbus_message_iter_open_container(&entry_iter, DBUS_TYPE_VARIANT,
                                          type_sig, &variant_iter) &&
         dbus_message_iter_append_basic(&variant_iter, type, value) &&
         dbus_message_iter_close_container(&entry_iter, &variant_iter) &&
         dbus_message_iter_close_container(dict_iter, &entry_iter);
}

} // namespace platform
} // namespace bluescan

#endif // BLUESCAN_PLATFORM_LINUX_DBUS_HELPERS_H
