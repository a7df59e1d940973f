/**
 * @file classic_source.cpp
 * @brief Classic/paired discovery source implementation
 */

#include "bluescan/classic_source.h"
#include <spdlog/spdlog.h>

namespace bluescan {

ClassicDiscoverySource::ClassicDiscoverySource(BluetoothPlatform &platform,
                                               ObservationSink sink,
                                               const ScanConfig &config)
    : platform_(platform), sink_(std::move(sink)), config_(config) {}

ClassicDiscoverySource::~ClassicDiscoverySource() {
  auto result = stop();
  if (result.is_error()) {
    SPDLOG_WARN("Classic discovery stop failed: {}",
                result.error().to_string());
  }
}

// ============================================================================
// Normalization
// ============================================================================

Observation ClassicDiscoverySource::from_added(const DeviceInformation &info,
                                               const std::string &unknown_name) {
  const char *status = (info.is_connected.has_value() && *info.is_connected)
                           ? STATUS_CONNECTED
                           : STATUS_AVAILABLE;
  return Observation::upsert(info.id,
                             info.name.empty() ? unknown_name : info.name,
                             status);
}

std::optional<Observation>
ClassicDiscoverySource::from_update(const DeviceInformationUpdate &update) {
  if (!update.is_connected.has_value()) {
    return std::nullopt;
  }
  return Observation::status_update(
      update.id, *update.is_connected ? STATUS_CONNECTED : STATUS_AVAILABLE);
}

Observation
ClassicDiscoverySource::from_paired(const DeviceInformation &info,
                                    const std::string &unknown_name) {
  return Observation::upsert(
      info.id, info.name.empty() ? unknown_name : info.name, STATUS_PAIRED);
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> ClassicDiscoverySource::start() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (watcher_ || paired_query_) {
    return Error(ErrorCode::InvalidState, "Classic discovery already started");
  }

  // The paired query runs even if the watcher is unavailable
  auto watcher_result = start_watcher();
  run_paired_query();

  return watcher_result;
}

Result<void> ClassicDiscoverySource::start_watcher() {
  auto created = platform_.create_device_watcher();
  if (created.is_error()) {
    return created.error();
  }
  watcher_ = std::move(created).value();

  added_token_ = watcher_->added += [this](const DeviceInformation &info) {
    SPDLOG_DEBUG("Watcher added {} ({})", info.id, info.name);
    post(from_added(info, config_.unknown_device_name));
  };

  updated_token_ =
      watcher_->updated += [this](const DeviceInformationUpdate &update) {
        auto observation = from_update(update);
        if (observation) {
          SPDLOG_DEBUG("Watcher updated {} -> {}", update.id,
                       observation->status);
          post(std::move(*observation));
        }
      };

  completed_token_ = watcher_->enumeration_completed +=
      [] { SPDLOG_DEBUG("Classic enumeration completed"); };

  stopped_token_ = watcher_->stopped +=
      [] { SPDLOG_DEBUG("Classic device watcher stopped"); };

  auto started = watcher_->start();
  if (started.is_error()) {
    unregister_handlers();
    watcher_.reset();
    return started.error();
  }

  SPDLOG_DEBUG("Classic device watcher started");
  return Result<void>::ok();
}

void ClassicDiscoverySource::run_paired_query() {
  auto created = platform_.create_paired_query();
  if (created.is_error()) {
    SPDLOG_WARN("Paired device query unavailable: {}",
                created.error().to_string());
    return;
  }
  paired_query_ = std::move(created).value();

  // The platform bounds the query; its answer is always awaited
  auto result = paired_query_->find_all_paired().get();
  if (result.is_error()) {
    SPDLOG_WARN("Paired device query failed: {}", result.error().to_string());
    return;
  }

  SPDLOG_INFO("Found {} paired device(s)", result.value().size());
  for (const auto &info : result.value()) {
    post(from_paired(info, config_.unknown_device_name));
  }
}

void ClassicDiscoverySource::post(Observation observation) {
  if (!sink_(observation)) {
    SPDLOG_DEBUG("Intake closed, dropping observation for {}", observation.id);
  }
}

void ClassicDiscoverySource::unregister_handlers() {
  if (!watcher_) {
    return;
  }

  watcher_->added.remove(added_token_);
  watcher_->updated.remove(updated_token_);
  watcher_->enumeration_completed.remove(completed_token_);
  watcher_->stopped.remove(stopped_token_);
}

Result<void> ClassicDiscoverySource::stop() {
  std::lock_guard<std::mutex> lock(mutex_);

  paired_query_.reset();

  if (!watcher_) {
    return Result<void>::ok();
  }

  unregister_handlers();

  Result<void> result;
  WatcherStatus status = watcher_->status();
  if (status == WatcherStatus::Started ||
      status == WatcherStatus::EnumerationCompleted) {
    result = watcher_->stop();
  } else {
    SPDLOG_DEBUG("Device watcher not running ({}), skipping stop",
                 watcher_status_name(status));
  }

  watcher_.reset();
  return result;
}

bool ClassicDiscoverySource::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watcher_ != nullptr;
}

} // namespace bluescan
