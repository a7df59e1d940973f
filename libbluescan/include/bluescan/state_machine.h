/**
 * @file state_machine.h
 * @brief Scan session state machine for BlueScan
 *
 * Manages session states with validated transitions and callbacks.
 */

#ifndef BLUESCAN_STATE_MACHINE_H
#define BLUESCAN_STATE_MACHINE_H

#include "error.h"
#include "platform.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>

namespace bluescan {

/**
 * @brief Lifecycle state of a scan session
 */
enum class SessionState : uint8_t {
  /// No session running; a new one may begin
  Idle = 0,

  /// Both sources started, waiting out the scan duration
  Scanning = 1,

  /// Sources being stopped and results collected
  Finalizing = 2
};

/**
 * @brief Get human-readable name for session state
 */
BLUESCAN_API const char *session_state_name(SessionState state);

// ============================================================================
// Session State Machine
// ============================================================================

/**
 * @brief Manages state transitions for scan sessions
 *
 * Thread-safe. transition() is the gate that keeps a second session from
 * starting while one is in progress: only Idle may move to Scanning.
 *
 * @code
 *   SessionStateMachine sm;
 *   sm.transition(SessionState::Scanning);   // ok
 *   sm.transition(SessionState::Scanning);   // InvalidState
 *   sm.transition(SessionState::Finalizing); // ok
 *   sm.transition(SessionState::Idle);       // ok
 * @endcode
 */
class BLUESCAN_API SessionStateMachine {
public:
  SessionStateMachine();

  SessionState current() const;

  /**
   * @brief Attempt to transition to a new state
   * @return Success or InvalidState if the transition is not allowed
   */
  Result<void> transition(SessionState to);

  bool can_transition(SessionState to) const;
  std::set<SessionState> valid_transitions() const;

  /// True while Scanning or Finalizing
  bool is_active() const;

  /**
   * @brief Return to Idle from any state
   *
   * Used when a session fails part way through.
   */
  void reset();

  using StateChangedCallback =
      std::function<void(SessionState from, SessionState to)>;

  /**
   * @brief Register callback for state changes
   *
   * Called after each successful transition, outside the lock.
   */
  void on_state_changed(StateChangedCallback callback);

private:
  void notify(SessionState from, SessionState to);

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::Idle;
  StateChangedCallback state_changed_cb_;

  static const std::map<SessionState, std::set<SessionState>>
      valid_transitions_;
};

} // namespace bluescan

#endif // BLUESCAN_STATE_MACHINE_H
