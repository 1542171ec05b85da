#pragma once

#include <functional>
#include <mutex>
#include <string>

enum class RelayState {
  CONNECTING,
  AUTHENTICATED,
  STREAMING,
  STOPPING,
  FAILED,
  CLOSED
};

class RelayStateMachine {
public:
  using StateCallback = std::function<void(RelayState, RelayState)>; // old, new

  explicit RelayStateMachine(const std::string &sessionId);

  RelayState getState() const;
  // Returns false and leaves the state alone on an illegal transition.
  bool transition(RelayState newState);

  void setCallback(StateCallback cb);

  bool isTerminal() const;
  static bool isLegal(RelayState from, RelayState to);
  static const char *name(RelayState state);

private:
  std::string sessionId_;
  mutable std::mutex mutex_;
  RelayState state_ = RelayState::CONNECTING;
  StateCallback callback_;
};
