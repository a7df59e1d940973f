/**
 * @file ble_source.cpp
 * @brief BLE advertisement source implementation
 */

#include "bluescan/ble_source.h"
#include <spdlog/spdlog.h>

namespace bluescan {

BleAdvertisementSource::BleAdvertisementSource(BluetoothPlatform &platform,
                                               ObservationSink sink,
                                               const ScanConfig &config)
    : platform_(platform), sink_(std::move(sink)), config_(config) {}

BleAdvertisementSource::~BleAdvertisementSource() {
  auto result = stop();
  if (result.is_error()) {
    SPDLOG_WARN("BLE discovery stop failed: {}", result.error().to_string());
  }
}

Observation
BleAdvertisementSource::from_advertisement(const AdvertisementReceived &adv,
                                           const std::string &unknown_name) {
  return Observation::upsert(
      format_bluetooth_address(adv.bluetooth_address),
      adv.local_name.empty() ? unknown_name : adv.local_name,
      format_signal_status(adv.rssi_dbm));
}

Result<void> BleAdvertisementSource::start() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (watcher_) {
    return Error(ErrorCode::InvalidState, "BLE discovery already started");
  }

  auto created = platform_.create_advertisement_watcher();
  if (created.is_error()) {
    return created.error();
  }
  watcher_ = std::move(created).value();
  watcher_->set_scanning_mode(config_.scanning_mode);

  received_token_ =
      watcher_->received += [this](const AdvertisementReceived &adv) {
        Observation observation =
            from_advertisement(adv, config_.unknown_ble_device_name);
        if (!sink_(observation)) {
          SPDLOG_DEBUG("Intake closed, dropping advertisement from {}",
                       observation.id);
        }
      };

  auto started = watcher_->start();
  if (started.is_error()) {
    watcher_->received.remove(received_token_);
    watcher_.reset();
    return started.error();
  }

  SPDLOG_DEBUG("BLE advertisement watcher started ({} scanning)",
               scanning_mode_name(config_.scanning_mode));
  return Result<void>::ok();
}

Result<void> BleAdvertisementSource::stop() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!watcher_) {
    return Result<void>::ok();
  }

  watcher_->received.remove(received_token_);

  Result<void> result;
  if (watcher_->status() == AdvertisementWatcherStatus::Started) {
    result = watcher_->stop();
  } else {
    SPDLOG_DEBUG("BLE watcher not running ({}), skipping stop",
                 advertisement_watcher_status_name(watcher_->status()));
  }

  watcher_.reset();
  return result;
}

bool BleAdvertisementSource::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watcher_ != nullptr;
}

} // namespace bluescan
