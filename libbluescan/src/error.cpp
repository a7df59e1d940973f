/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "bluescan/error.h"
#include <sstream>

namespace bluescan {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";

  case ErrorCode::DiscoveryFailed:
    return "DiscoveryFailed";
  case ErrorCode::BluetoothOff:
    return "BluetoothOff";
  case ErrorCode::BluetoothNotSupported:
    return "BluetoothNotSupported";
  case ErrorCode::BleScanFailed:
    return "BleScanFailed";
  case ErrorCode::WatcherFailed:
    return "WatcherFailed";

  case ErrorCode::SessionInProgress:
    return "SessionInProgress";
  case ErrorCode::SessionFailed:
    return "SessionFailed";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";
  case ErrorCode::HardwareNotAvailable:
    return "HardwareNotAvailable";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::NotFound:
    return "Requested object not found";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";

  case ErrorCode::DiscoveryFailed:
    return "Device discovery failed";
  case ErrorCode::BluetoothOff:
    return "Bluetooth is disabled";
  case ErrorCode::BluetoothNotSupported:
    return "Bluetooth not supported on this device";
  case ErrorCode::BleScanFailed:
    return "BLE scanning failed";
  case ErrorCode::WatcherFailed:
    return "Device watcher failed";

  case ErrorCode::SessionInProgress:
    return "A scan session is already in progress";
  case ErrorCode::SessionFailed:
    return "Scan session failed";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::PermissionDenied:
    return "Permission denied";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";
  case ErrorCode::HardwareNotAvailable:
    return "Required hardware not available";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace bluescan
