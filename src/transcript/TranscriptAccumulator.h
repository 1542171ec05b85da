#pragma once

#include "TranscriptRepository.h"
#include <mutex>
#include <string>

// Finalized text of one session for the lifetime of one relay. Writes go
// through to the repository; reads come from the local mirror.
class TranscriptAccumulator {
public:
  TranscriptAccumulator(TranscriptRepository &repository,
                        const std::string &sessionId);

  // Surrounding whitespace is trimmed; blank text is ignored. A failed
  // repository write is logged and the mirror keeps the segment.
  void append(const std::string &text);
  std::string get();

  const std::string &sessionId() const { return sessionId_; }
  size_t appendedSegments();

private:
  TranscriptRepository &repository_;
  std::string sessionId_;

  std::mutex mutex_;
  std::string text_;
  size_t segments_ = 0;
};
