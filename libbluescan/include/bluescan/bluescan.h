/**
 * @file bluescan.h
 * @brief Main BlueScan API Header
 *
 * BlueScan discovers nearby Bluetooth devices over two channels at once,
 * classic/paired enumeration and BLE advertisement listening, and merges
 * both into one deduplicated device list per scan session.
 *
 * Quick Start:
 * @code
 *   #include <bluescan/bluescan.h>
 *
 *   bluescan::ScanConfig config;
 *   auto platform = bluescan::make_bluez_platform(config);
 *
 *   bluescan::ScanSession session(*platform);
 *   session.init(config);
 *
 *   auto report = session.run();
 *   for (const auto &d : report.value().records) {
 *       std::cout << d.name << " " << d.status << std::endl;
 *   }
 * @endcode
 */

#ifndef BLUESCAN_BLUESCAN_H
#define BLUESCAN_BLUESCAN_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "ble_source.h"
#include "bluetooth.h"
#include "classic_source.h"
#include "config.h"
#include "device_store.h"
#include "event.h"
#include "intake.h"
#include "logging.h"
#include "scan_session.h"
#include "state_machine.h"

#endif // BLUESCAN_BLUESCAN_H
