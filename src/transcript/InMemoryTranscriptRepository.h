#pragma once

#include "TranscriptRepository.h"
#include <map>
#include <mutex>

class InMemoryTranscriptRepository : public TranscriptRepository {
public:
  bool append(const std::string &sessionId, const std::string &text) override;
  std::string get(const std::string &sessionId) override;
  bool setStatus(const std::string &sessionId, TranscriptStatus status,
                 const std::string &errorMessage = "") override;
  TranscriptRecord record(const std::string &sessionId) override;

  size_t appendCalls();

private:
  std::mutex mutex_;
  std::map<std::string, TranscriptRecord> records_;
  size_t appendCalls_ = 0;
};
