/**
 * @file intake.cpp
 * @brief Observation intake implementation
 */

#include "bluescan/intake.h"
#include <exception>
#include <spdlog/spdlog.h>

namespace bluescan {

ObservationIntake::ObservationIntake(DeviceRecordStore &store)
    : store_(store), dispatch_thread_([this] { run(); }) {}

ObservationIntake::~ObservationIntake() { close(); }

bool ObservationIntake::post(Observation observation) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(observation));
    ++posted_;
  }

  work_cv_.notify_one();
  return true;
}

void ObservationIntake::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  const uint64_t target = posted_;
  drained_cv_.wait(lock, [&] { return applied_ >= target; });
}

void ObservationIntake::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }

  work_cv_.notify_one();
  if (dispatch_thread_.joinable()) {
    dispatch_thread_.join();
  }
}

bool ObservationIntake::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

ObservationSink ObservationIntake::sink() {
  return [this](Observation observation) {
    return post(std::move(observation));
  };
}

uint64_t ObservationIntake::applied_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return applied_;
}

// ============================================================================
// Dispatch Thread
// ============================================================================

void ObservationIntake::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  for (;;) {
    work_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });

    // Queue is drained before exit so close() never loses observations
    if (queue_.empty()) {
      break;
    }

    Observation observation = std::move(queue_.front());
    queue_.pop_front();

    lock.unlock();
    apply(observation);
    lock.lock();

    ++applied_;
    drained_cv_.notify_all();
  }
}

void ObservationIntake::apply(const Observation &observation) {
  try {
    switch (observation.kind) {
    case Observation::Kind::Upsert:
      store_.upsert(observation.id, observation.name, observation.status);
      break;
    case Observation::Kind::StatusUpdate:
      if (!store_.update_status(observation.id, observation.status)) {
        SPDLOG_DEBUG("Dropping status update for unseen device {}",
                     observation.id);
      }
      break;
    }
  } catch (const std::exception &e) {
    SPDLOG_ERROR("Failed to apply observation for {}: {}", observation.id,
                 e.what());
  }
}

} // namespace bluescan
