#include "InMemoryTranscriptRepository.h"

bool InMemoryTranscriptRepository::append(const std::string &sessionId,
                                          const std::string &text) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++appendCalls_;
  auto &stored = records_[sessionId].text;
  if (!stored.empty())
    stored += ' ';
  stored += text;
  return true;
}

std::string InMemoryTranscriptRepository::get(const std::string &sessionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(sessionId);
  return it != records_.end() ? it->second.text : std::string();
}

bool InMemoryTranscriptRepository::setStatus(const std::string &sessionId,
                                             TranscriptStatus status,
                                             const std::string &errorMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &rec = records_[sessionId];
  rec.status = status;
  rec.errorMessage = errorMessage;
  return true;
}

TranscriptRecord
InMemoryTranscriptRepository::record(const std::string &sessionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(sessionId);
  return it != records_.end() ? it->second : TranscriptRecord{};
}

size_t InMemoryTranscriptRepository::appendCalls() {
  std::lock_guard<std::mutex> lock(mutex_);
  return appendCalls_;
}
