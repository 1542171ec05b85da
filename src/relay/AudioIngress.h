#pragma once

#include "BridgeQueue.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

enum class StopReason {
  CLIENT_STOP,
  CLIENT_DISCONNECT,
  IDLE_TIMEOUT,
  UPSTREAM_FINISHED,
  SHUTDOWN
};

const char *stopReasonName(StopReason reason);

// Inbound half of a relay: audio frames go onto the bridge queue, text frames
// are control messages. Runs on the connection's serialized context.
class AudioIngress {
public:
  using StopHandler = std::function<void(StopReason)>;
  // Called with true on pause and false on resume.
  using PauseHandler = std::function<void(bool)>;

  AudioIngress(BridgeQueue &queue, const std::string &sessionId,
               StopHandler onStop, PauseHandler onPause = nullptr);

  void onBinary(std::string payload);
  void onText(const std::string &text);
  void onDisconnect();

  // Ends ingress without a stop request, e.g. after the backend finished.
  void finish();

  bool finished() const { return finished_; }
  bool paused() const { return paused_; }
  uint64_t forwardedFrames() const { return forwarded_; }
  uint64_t discardedFrames() const { return discarded_; }

private:
  void end(StopReason reason);

  BridgeQueue &queue_;
  std::string sessionId_;
  StopHandler onStop_;
  PauseHandler onPause_;

  std::atomic<bool> finished_{false};
  std::atomic<bool> paused_{false};
  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> discarded_{0};
};
