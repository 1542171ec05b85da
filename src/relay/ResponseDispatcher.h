#pragma once

#include "../protocol/ClientProtocol.h"
#include "../transcript/TranscriptAccumulator.h"
#include "speech.pb.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Turns backend responses into client messages, in backend order. Final
// hypotheses are also appended to the session transcript.
class ResponseDispatcher {
public:
  using Sender = std::function<void(const std::string &)>;

  ResponseDispatcher(const std::string &sessionId, Sender sender,
                     TranscriptAccumulator &accumulator);

  void dispatch(const scribe::speech::v1::StreamingRecognizeResponse &response);

  uint64_t responses() const { return responses_; }
  uint64_t finals() const { return finals_; }

  static std::optional<VadEvent> classifyEvent(
      scribe::speech::v1::StreamingRecognizeResponse::SpeechEventType type);
  // nullopt for results without alternatives.
  static std::optional<TranscriptHypothesis>
  topHypothesis(const scribe::speech::v1::StreamingRecognitionResult &result);

private:
  std::string sessionId_;
  Sender sender_;
  TranscriptAccumulator &accumulator_;

  std::atomic<uint64_t> responses_{0};
  std::atomic<uint64_t> finals_{0};
};
