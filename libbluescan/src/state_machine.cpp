/**
 * @file state_machine.cpp
 * @brief Scan session state machine implementation
 */

#include "bluescan/state_machine.h"
#include <string>

namespace bluescan {

const char *session_state_name(SessionState state) {
  switch (state) {
  case SessionState::Idle:
    return "Idle";
  case SessionState::Scanning:
    return "Scanning";
  case SessionState::Finalizing:
    return "Finalizing";
  default:
    return "Unknown";
  }
}

// ============================================================================
// Session State Machine
// ============================================================================

const std::map<SessionState, std::set<SessionState>>
    SessionStateMachine::valid_transitions_ = {
        // Idle -> Scanning
        {SessionState::Idle, {SessionState::Scanning}},

        // Scanning -> Finalizing, Idle (session failure)
        {SessionState::Scanning, {SessionState::Finalizing, SessionState::Idle}},

        // Finalizing -> Idle
        {SessionState::Finalizing, {SessionState::Idle}}};

SessionStateMachine::SessionStateMachine() : state_(SessionState::Idle) {}

SessionState SessionStateMachine::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

Result<void> SessionStateMachine::transition(SessionState to) {
  SessionState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = valid_transitions_.find(state_);
    if (it == valid_transitions_.end() ||
        it->second.find(to) == it->second.end()) {
      return Error(ErrorCode::InvalidState,
                   std::string("Invalid session transition: ") +
                       session_state_name(state_) + " -> " +
                       session_state_name(to));
    }

    from = state_;
    state_ = to;
  }

  notify(from, to);
  return Result<void>::ok();
}

bool SessionStateMachine::can_transition(SessionState to) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return false;
  }
  return it->second.find(to) != it->second.end();
}

std::set<SessionState> SessionStateMachine::valid_transitions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return {};
  }
  return it->second;
}

bool SessionStateMachine::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == SessionState::Scanning ||
         state_ == SessionState::Finalizing;
}

void SessionStateMachine::reset() {
  SessionState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = state_;
    state_ = SessionState::Idle;
  }

  if (from != SessionState::Idle) {
    notify(from, SessionState::Idle);
  }
}

void SessionStateMachine::on_state_changed(StateChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_changed_cb_ = std::move(callback);
}

void SessionStateMachine::notify(SessionState from, SessionState to) {
  StateChangedCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = state_changed_cb_;
  }

  if (callback) {
    callback(from, to);
  }
}

} // namespace bluescan
