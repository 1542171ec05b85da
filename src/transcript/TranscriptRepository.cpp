#include "TranscriptRepository.h"

const char *TranscriptRepository::statusName(TranscriptStatus status) {
  switch (status) {
  case TranscriptStatus::IN_PROGRESS:
    return "IN_PROGRESS";
  case TranscriptStatus::PAUSED:
    return "PAUSED";
  case TranscriptStatus::COMPLETED:
    return "COMPLETED";
  case TranscriptStatus::FAILED:
    return "FAILED";
  }
  return "UNKNOWN";
}

std::optional<TranscriptStatus>
TranscriptRepository::parseStatus(const std::string &name) {
  if (name == "IN_PROGRESS")
    return TranscriptStatus::IN_PROGRESS;
  if (name == "PAUSED")
    return TranscriptStatus::PAUSED;
  if (name == "COMPLETED")
    return TranscriptStatus::COMPLETED;
  if (name == "FAILED")
    return TranscriptStatus::FAILED;
  return std::nullopt;
}
