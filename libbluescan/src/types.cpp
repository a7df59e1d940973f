/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "bluescan/types.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace bluescan {

// ============================================================================
// Placeholder Names
// ============================================================================

bool is_placeholder_name(const std::string &name) {
  if (name.empty()) {
    return true;
  }

  std::string lowered(name.size(), '\0');
  std::transform(name.begin(), name.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lowered.find("unknown") != std::string::npos;
}

// ============================================================================
// Bluetooth Addresses
// ============================================================================

std::string format_bluetooth_address(BluetoothAddress address) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0') << std::setw(12)
      << (address & 0xFFFFFFFFFFFFULL);
  return oss.str();
}

std::optional<BluetoothAddress>
parse_bluetooth_address(const std::string &text) {
  // "AA:BB:CC:DD:EE:FF"
  if (text.size() != 17) {
    return std::nullopt;
  }

  BluetoothAddress address = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (i % 3 == 2) {
      if (c != ':') {
        return std::nullopt;
      }
      continue;
    }

    int nibble;
    if (c >= '0' && c <= '9') {
      nibble = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      nibble = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      nibble = c - 'A' + 10;
    } else {
      return std::nullopt;
    }
    address = (address << 4) | static_cast<BluetoothAddress>(nibble);
  }

  return address;
}

std::string format_signal_status(int rssi_dbm) {
  return "Signal: " + std::to_string(rssi_dbm) + " dBm";
}

} // namespace bluescan
