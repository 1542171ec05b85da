#include "ClientProtocol.h"
#include "../relay/RelayErrors.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ControlMessage ClientProtocol::parseControl(const std::string &text) {
  json msg;
  try {
    msg = json::parse(text);
  } catch (const json::parse_error &e) {
    throw MalformedControlMessage(std::string("not JSON: ") + e.what());
  }

  if (!msg.is_object())
    throw MalformedControlMessage("control message must be an object");

  auto it = msg.find("type");
  if (it == msg.end() || !it->is_string())
    throw MalformedControlMessage("control message without string 'type'");

  const std::string type = it->get<std::string>();
  if (type == "stop")
    return ControlMessage{ControlType::STOP};
  if (type == "pause")
    return ControlMessage{ControlType::PAUSE};
  if (type == "resume")
    return ControlMessage{ControlType::RESUME};

  throw MalformedControlMessage("unknown control type '" + type + "'");
}

std::string ClientProtocol::connected(const std::string &sessionId) {
  return json{{"type", "connected"},
              {"session_id", sessionId},
              {"message", "Transcription service ready"}}
      .dump();
}

std::string ClientProtocol::vadEvent(VadEvent event) {
  return json{{"type", "vad_event"},
              {"event", vadEventName(event)},
              {"message", event == VadEvent::SPEECH_START ? "Speech detected"
                                                          : "Speech ended"}}
      .dump();
}

std::string ClientProtocol::transcript(const TranscriptHypothesis &hypothesis) {
  double confidence = std::min(1.0, std::max(0.0, double(hypothesis.confidence)));
  json msg{{"type", "transcript"},
           {"transcript", hypothesis.text},
           {"is_final", hypothesis.isFinal},
           {"confidence", confidence}};
  if (!hypothesis.languageCode.empty())
    msg["language_code"] = hypothesis.languageCode;
  return msg.dump();
}

std::string ClientProtocol::error(const std::string &message,
                                  const std::string &code) {
  json msg{{"type", "error"}, {"message", message}};
  if (!code.empty())
    msg["code"] = code;
  return msg.dump();
}

std::string ClientProtocol::completed(uint64_t totalResponses,
                                      const std::string &fullTranscript) {
  return json{{"type", "completed"},
              {"message", "Transcription finished successfully"},
              {"total_responses", totalResponses},
              {"full_transcript", fullTranscript}}
      .dump();
}

const char *ClientProtocol::controlName(ControlType type) {
  switch (type) {
  case ControlType::STOP:
    return "stop";
  case ControlType::PAUSE:
    return "pause";
  case ControlType::RESUME:
    return "resume";
  }
  return "unknown";
}

const char *ClientProtocol::vadEventName(VadEvent event) {
  return event == VadEvent::SPEECH_START ? "speech_start" : "speech_end";
}
