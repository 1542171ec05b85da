#pragma once

#include "TranscriptRepository.h"
#include <mutex>
#include <string>

// One directory, two files per session: <stem>.txt holds the space-joined
// finalized text, <stem>.status holds the status name and an optional error
// line.
class FileTranscriptRepository : public TranscriptRepository {
public:
  explicit FileTranscriptRepository(const std::string &directory);

  bool append(const std::string &sessionId, const std::string &text) override;
  std::string get(const std::string &sessionId) override;
  bool setStatus(const std::string &sessionId, TranscriptStatus status,
                 const std::string &errorMessage = "") override;
  TranscriptRecord record(const std::string &sessionId) override;
  bool canStore(const std::string &sessionId) const override;

  // File name stem for a session id: [A-Za-z0-9_-] kept, every other byte
  // written as %XX. Empty when the id is empty or the name would be too long.
  static std::string fileStem(const std::string &sessionId);

private:
  std::string textPath(const std::string &sessionId) const;
  std::string statusPath(const std::string &sessionId) const;

  std::string directory_;
  std::mutex mutex_;
};
