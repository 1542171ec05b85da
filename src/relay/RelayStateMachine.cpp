#include "RelayStateMachine.h"
#include "../app/Logger.h"

RelayStateMachine::RelayStateMachine(const std::string &sessionId)
    : sessionId_(sessionId) {}

RelayState RelayStateMachine::getState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool RelayStateMachine::isLegal(RelayState from, RelayState to) {
  switch (from) {
  case RelayState::CONNECTING:
    return to == RelayState::AUTHENTICATED || to == RelayState::CLOSED;
  case RelayState::AUTHENTICATED:
    return to == RelayState::STREAMING || to == RelayState::FAILED;
  case RelayState::STREAMING:
    return to == RelayState::STOPPING || to == RelayState::FAILED;
  case RelayState::STOPPING:
    // The backend can still fail while draining.
    return to == RelayState::CLOSED || to == RelayState::FAILED;
  case RelayState::FAILED:
    return to == RelayState::CLOSED;
  case RelayState::CLOSED:
    return false;
  }
  return false;
}

bool RelayStateMachine::transition(RelayState newState) {
  RelayState old;
  StateCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == newState)
      return true;
    if (!isLegal(state_, newState)) {
      LOG_WARN("[" << sessionId_ << "] illegal relay transition "
                   << name(state_) << " -> " << name(newState));
      return false;
    }
    old = state_;
    state_ = newState;
    cb = callback_;
  }

  LOG_DEBUG("[" << sessionId_ << "] relay state " << name(old) << " -> "
                << name(newState));
  if (cb)
    cb(old, newState);
  return true;
}

void RelayStateMachine::setCallback(StateCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = cb;
}

bool RelayStateMachine::isTerminal() const {
  return getState() == RelayState::CLOSED;
}

const char *RelayStateMachine::name(RelayState state) {
  switch (state) {
  case RelayState::CONNECTING:
    return "CONNECTING";
  case RelayState::AUTHENTICATED:
    return "AUTHENTICATED";
  case RelayState::STREAMING:
    return "STREAMING";
  case RelayState::STOPPING:
    return "STOPPING";
  case RelayState::FAILED:
    return "FAILED";
  case RelayState::CLOSED:
    return "CLOSED";
  }
  return "UNKNOWN";
}
