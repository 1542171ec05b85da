#include "ResponseDispatcher.h"
#include "../app/Logger.h"

using scribe::speech::v1::StreamingRecognitionResult;
using scribe::speech::v1::StreamingRecognizeResponse;

ResponseDispatcher::ResponseDispatcher(const std::string &sessionId,
                                       Sender sender,
                                       TranscriptAccumulator &accumulator)
    : sessionId_(sessionId), sender_(std::move(sender)),
      accumulator_(accumulator) {}

std::optional<VadEvent> ResponseDispatcher::classifyEvent(
    StreamingRecognizeResponse::SpeechEventType type) {
  switch (type) {
  case StreamingRecognizeResponse::SPEECH_ACTIVITY_BEGIN:
    return VadEvent::SPEECH_START;
  case StreamingRecognizeResponse::SPEECH_ACTIVITY_END:
    return VadEvent::SPEECH_END;
  default:
    return std::nullopt;
  }
}

std::optional<TranscriptHypothesis>
ResponseDispatcher::topHypothesis(const StreamingRecognitionResult &result) {
  if (result.alternatives_size() == 0)
    return std::nullopt;

  const auto &top = result.alternatives(0);
  TranscriptHypothesis hypothesis;
  hypothesis.text = top.transcript();
  hypothesis.isFinal = result.is_final();
  hypothesis.confidence = top.confidence();
  hypothesis.languageCode = result.language_code();
  return hypothesis;
}

void ResponseDispatcher::dispatch(const StreamingRecognizeResponse &response) {
  ++responses_;

  if (auto event = classifyEvent(response.speech_event_type())) {
    LOG_INFO("[" << sessionId_ << "] VAD event "
                 << ClientProtocol::vadEventName(*event));
    sender_(ClientProtocol::vadEvent(*event));
  } else if (response.speech_event_type() !=
             StreamingRecognizeResponse::SPEECH_EVENT_TYPE_UNSPECIFIED) {
    LOG_DEBUG("[" << sessionId_ << "] ignoring speech event "
                  << response.speech_event_type());
  }

  for (const auto &result : response.results()) {
    auto hypothesis = topHypothesis(result);
    if (!hypothesis)
      continue;

    LOG_DEBUG("[" << sessionId_ << "] transcript '" << hypothesis->text
                  << "' final=" << hypothesis->isFinal
                  << " confidence=" << hypothesis->confidence);
    sender_(ClientProtocol::transcript(*hypothesis));

    if (hypothesis->isFinal) {
      ++finals_;
      accumulator_.append(hypothesis->text);
    }
  }
}
