#include "TranscriptAccumulator.h"
#include "../app/Logger.h"

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return std::string();
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

} // namespace

TranscriptAccumulator::TranscriptAccumulator(TranscriptRepository &repository,
                                             const std::string &sessionId)
    : repository_(repository), sessionId_(sessionId),
      text_(repository.get(sessionId)) {}

void TranscriptAccumulator::append(const std::string &text) {
  std::string segment = trim(text);
  if (segment.empty())
    return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!text_.empty())
    text_ += ' ';
  text_ += segment;
  ++segments_;

  if (!repository_.append(sessionId_, segment)) {
    LOG_ERROR("[" << sessionId_ << "] transcript segment kept in memory only");
  }
}

std::string TranscriptAccumulator::get() {
  std::lock_guard<std::mutex> lock(mutex_);
  return text_;
}

size_t TranscriptAccumulator::appendedSegments() {
  std::lock_guard<std::mutex> lock(mutex_);
  return segments_;
}
