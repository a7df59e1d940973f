/**
 * @file scan_session.cpp
 * @brief Scan session controller implementation
 */

#include "bluescan/scan_session.h"
#include "bluescan/ble_source.h"
#include "bluescan/classic_source.h"
#include "bluescan/intake.h"
#include <exception>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>

namespace bluescan {

// ============================================================================
// ScanReport
// ============================================================================

std::string ScanReport::message() const {
  if (records.empty()) {
    return NO_DEVICES_MESSAGE;
  }
  return "Found " + std::to_string(records.size()) + " Device(s):";
}

// ============================================================================
// ScanSession Implementation
// ============================================================================

class ScanSession::Impl {
public:
  explicit Impl(BluetoothPlatform &p) : platform(p), intake(store) {}

  BluetoothPlatform &platform;
  ScanConfig config;
  bool initialized = false;

  // The intake applies to the store, so the store is declared first
  DeviceRecordStore store;
  ObservationIntake intake;
  SessionStateMachine state;

  std::mutex callback_mutex;
  std::function<void(const ScanReport &)> completed_cb;
  std::function<void(const SessionError &)> error_cb;

  Result<ScanReport> run_cycle();
  void start_source(const char *label,
                    const std::function<Result<void>()> &start);
  void fail(const Error &error);
  void notify_completed(const ScanReport &report);
};

Result<ScanReport> ScanSession::Impl::run_cycle() {
  store.clear();
  SPDLOG_INFO("Scan session started ({} ms)", config.scan_duration.count());

  ClassicDiscoverySource classic(platform, intake.sink(), config);
  BleAdvertisementSource ble(platform, intake.sink(), config);

  // Each source is on its own; one failing never stops the other
  start_source("Classic", [&classic] { return classic.start(); });
  start_source("BLE", [&ble] { return ble.start(); });

  if (!classic.is_running() && !ble.is_running()) {
    SPDLOG_WARN("No live discovery source is running");
  }

  std::this_thread::sleep_for(config.scan_duration);

  BLUESCAN_TRY(state.transition(SessionState::Finalizing));

  auto classic_stopped = classic.stop();
  if (classic_stopped.is_error()) {
    SPDLOG_WARN("Classic discovery stop failed: {}",
                classic_stopped.error().to_string());
  }

  auto ble_stopped = ble.stop();
  if (ble_stopped.is_error()) {
    SPDLOG_WARN("BLE discovery stop failed: {}",
                ble_stopped.error().to_string());
  }

  // Handlers are gone; apply whatever they posted before removal
  intake.drain();

  ScanReport report{store.snapshot()};

  BLUESCAN_TRY(state.transition(SessionState::Idle));

  SPDLOG_INFO("Scan session finished: {} device(s)", report.count());
  return report;
}

void ScanSession::Impl::start_source(
    const char *label, const std::function<Result<void>()> &start) {
  try {
    auto started = start();
    if (started.is_error()) {
      SPDLOG_WARN("{} discovery unavailable: {}", label,
                  started.error().to_string());
    }
  } catch (const std::exception &e) {
    SPDLOG_WARN("{} discovery failed to start: {}", label, e.what());
  }
}

void ScanSession::Impl::fail(const Error &error) {
  intake.drain();
  state.reset();

  SessionError session_error;
  session_error.error = error;
  session_error.message = "Error scanning for devices: " +
                          (error.message.empty()
                               ? std::string(error_code_description(error.code))
                               : error.message);

  SPDLOG_ERROR("{}", session_error.message);

  std::function<void(const SessionError &)> callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex);
    callback = error_cb;
  }
  if (callback) {
    callback(session_error);
  }
}

void ScanSession::Impl::notify_completed(const ScanReport &report) {
  std::function<void(const ScanReport &)> callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex);
    callback = completed_cb;
  }
  if (callback) {
    callback(report);
  }
}

// ============================================================================
// ScanSession
// ============================================================================

ScanSession::ScanSession(BluetoothPlatform &platform)
    : impl_(std::make_unique<Impl>(platform)) {}

ScanSession::~ScanSession() = default;

Result<void> ScanSession::init(const ScanConfig &config) {
  if (impl_->initialized) {
    return Error(ErrorCode::AlreadyInitialized, "Scan session already initialized");
  }

  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  impl_->config = config;
  impl_->initialized = true;
  return Result<void>::ok();
}

bool ScanSession::is_initialized() const { return impl_->initialized; }

const ScanConfig &ScanSession::config() const { return impl_->config; }

Result<ScanReport> ScanSession::run() {
  if (!impl_->initialized) {
    return Error(ErrorCode::NotInitialized, "Scan session not initialized");
  }

  // Only an Idle session may begin; this rejects overlapping runs
  auto begin = impl_->state.transition(SessionState::Scanning);
  if (begin.is_error()) {
    SPDLOG_WARN("Scan requested while session is {}",
                session_state_name(impl_->state.current()));
    return Error(ErrorCode::SessionInProgress,
                 "A scan session is already in progress");
  }

  Result<ScanReport> result = Error(ErrorCode::SessionFailed);
  try {
    result = impl_->run_cycle();
  } catch (const std::exception &e) {
    result = Error(ErrorCode::SessionFailed, e.what());
  }

  if (result.is_error()) {
    impl_->fail(result.error());
    return result;
  }

  impl_->notify_completed(result.value());
  return result;
}

SessionState ScanSession::state() const { return impl_->state.current(); }

bool ScanSession::is_scanning() const {
  return impl_->state.current() == SessionState::Scanning;
}

const DeviceRecordStore &ScanSession::store() const { return impl_->store; }

void ScanSession::on_state_changed(
    SessionStateMachine::StateChangedCallback callback) {
  impl_->state.on_state_changed(std::move(callback));
}

void ScanSession::on_completed(
    std::function<void(const ScanReport &)> callback) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->completed_cb = std::move(callback);
}

void ScanSession::on_error(std::function<void(const SessionError &)> callback) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->error_cb = std::move(callback);
}

void ScanSession::on_devices_changed(std::function<void()> callback) {
  impl_->store.on_changed(std::move(callback));
}

} // namespace bluescan
