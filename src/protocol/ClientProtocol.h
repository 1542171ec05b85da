#pragma once

#include <cstdint>
#include <string>

enum class ControlType { STOP, PAUSE, RESUME };

struct ControlMessage {
  ControlType type;
};

enum class VadEvent { SPEECH_START, SPEECH_END };

struct TranscriptHypothesis {
  std::string text;
  bool isFinal = false;
  float confidence = 0.0f;
  // Language the backend detected; omitted on the wire when empty.
  std::string languageCode;
};

// JSON wire format spoken with the client. Inbound text frames are validated
// here before anything else sees them.
class ClientProtocol {
public:
  // Throws MalformedControlMessage.
  static ControlMessage parseControl(const std::string &text);

  static std::string connected(const std::string &sessionId);
  static std::string vadEvent(VadEvent event);
  static std::string transcript(const TranscriptHypothesis &hypothesis);
  static std::string error(const std::string &message,
                           const std::string &code = "");
  static std::string completed(uint64_t totalResponses,
                               const std::string &fullTranscript);

  static const char *controlName(ControlType type);
  static const char *vadEventName(VadEvent event);
};
