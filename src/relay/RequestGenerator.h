#pragma once

#include "../app/Config.h"
#include "BridgeQueue.h"
#include "speech.pb.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Pull-based request sequence for one StreamingRecognize call: the config
// request first, then one audio request per queued payload until the
// end-of-input sentinel. Not restartable.
class RequestGenerator {
public:
  using IdleCallback = std::function<void()>;

  // A zero idleTimeout disables idle detection.
  RequestGenerator(BridgeQueue &queue, const SpeechSettings &settings,
                   std::chrono::milliseconds idleTimeout,
                   IdleCallback onIdle = nullptr);

  std::optional<scribe::speech::v1::StreamingRecognizeRequest> next();

  // While suspended, silence is not idleness. Every call restarts the idle
  // clock. Thread-safe.
  void setIdleSuspended(bool suspended);

  bool finished() const { return stage_ == Stage::DONE; }
  uint64_t audioRequests() const { return audioRequests_; }
  uint64_t audioBytes() const { return audioBytes_; }

  static scribe::speech::v1::StreamingRecognizeRequest
  makeConfigRequest(const SpeechSettings &settings);

private:
  BridgeItem nextItem();

  enum class Stage { CONFIG, AUDIO, DONE };

  BridgeQueue &queue_;
  const SpeechSettings &settings_;
  std::chrono::milliseconds idleTimeout_;
  IdleCallback onIdle_;
  bool idleReported_ = false;
  std::atomic<bool> idleSuspended_{false};
  std::atomic<uint64_t> idleEpoch_{0};

  Stage stage_ = Stage::CONFIG;
  uint64_t audioRequests_ = 0;
  uint64_t audioBytes_ = 0;
};
