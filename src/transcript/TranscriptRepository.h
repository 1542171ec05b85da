#pragma once

#include <optional>
#include <string>

enum class TranscriptStatus { IN_PROGRESS, PAUSED, COMPLETED, FAILED };

struct TranscriptRecord {
  std::string text;
  std::optional<TranscriptStatus> status;
  std::string errorMessage;
};

// Durable per-session transcript store shared with the report generator.
class TranscriptRepository {
public:
  virtual ~TranscriptRepository() = default;

  // Appends text to the stored transcript, space-joined with what is there.
  virtual bool append(const std::string &sessionId, const std::string &text) = 0;
  virtual std::string get(const std::string &sessionId) = 0;

  virtual bool setStatus(const std::string &sessionId, TranscriptStatus status,
                         const std::string &errorMessage = "") = 0;
  virtual TranscriptRecord record(const std::string &sessionId) = 0;

  // False when this store cannot hold a transcript under the given id.
  virtual bool canStore(const std::string &sessionId) const {
    return !sessionId.empty();
  }

  static const char *statusName(TranscriptStatus status);
  static std::optional<TranscriptStatus> parseStatus(const std::string &name);
};
