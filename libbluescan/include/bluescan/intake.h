/**
 * @file intake.h
 * @brief Serialized intake point between discovery sources and the store
 */

#ifndef BLUESCAN_INTAKE_H
#define BLUESCAN_INTAKE_H

#include "device_store.h"
#include "platform.h"
#include "types.h"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace bluescan {

/// Callable a discovery source posts its observations to
using ObservationSink = std::function<bool(Observation)>;

/**
 * @brief Queue that applies observations to a store on one thread
 *
 * Discovery sources post from whatever thread their platform delivers
 * events on. A single dispatch thread applies the observations to the
 * store in arrival order, so per-source ordering is preserved.
 *
 * The store must outlive the intake.
 */
class BLUESCAN_API ObservationIntake {
public:
  explicit ObservationIntake(DeviceRecordStore &store);
  ~ObservationIntake();

  // Non-copyable
  ObservationIntake(const ObservationIntake &) = delete;
  ObservationIntake &operator=(const ObservationIntake &) = delete;

  /**
   * @brief Enqueue an observation
   * @return false if the intake is closed
   */
  bool post(Observation observation);

  /**
   * @brief Block until everything posted before this call is applied
   */
  void drain();

  /**
   * @brief Drain and stop the dispatch thread
   *
   * Idempotent. Later posts are rejected.
   */
  void close();

  bool is_closed() const;

  /// Sink bound to this intake, for handing to a source
  ObservationSink sink();

  /// Number of observations applied since construction
  uint64_t applied_count() const;

private:
  void run();
  void apply(const Observation &observation);

  DeviceRecordStore &store_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable drained_cv_;
  std::deque<Observation> queue_;
  uint64_t posted_ = 0;
  uint64_t applied_ = 0;
  bool closed_ = false;

  std::thread dispatch_thread_;
};

} // namespace bluescan

#endif // BLUESCAN_INTAKE_H
