#include "RequestGenerator.h"
#include "../app/Logger.h"

using scribe::speech::v1::ExplicitDecodingConfig;
using scribe::speech::v1::StreamingRecognizeRequest;

RequestGenerator::RequestGenerator(BridgeQueue &queue,
                                   const SpeechSettings &settings,
                                   std::chrono::milliseconds idleTimeout,
                                   IdleCallback onIdle)
    : queue_(queue), settings_(settings), idleTimeout_(idleTimeout),
      onIdle_(std::move(onIdle)) {}

StreamingRecognizeRequest
RequestGenerator::makeConfigRequest(const SpeechSettings &settings) {
  StreamingRecognizeRequest request;
  request.set_recognizer(settings.recognizer);

  auto *streaming = request.mutable_streaming_config();
  auto *config = streaming->mutable_config();
  auto *decoding = config->mutable_explicit_decoding_config();
  decoding->set_encoding(ExplicitDecodingConfig::LINEAR16);
  decoding->set_sample_rate_hertz(settings.sampleRateHertz);
  decoding->set_audio_channel_count(settings.channelCount);
  config->set_model(settings.model);
  for (const auto &code : settings.languageCodes) {
    config->add_language_codes(code);
  }

  auto *features = streaming->mutable_streaming_features();
  features->set_interim_results(settings.interimResults);
  features->set_enable_voice_activity_events(settings.voiceActivityEvents);
  return request;
}

std::optional<StreamingRecognizeRequest> RequestGenerator::next() {
  switch (stage_) {
  case Stage::CONFIG:
    stage_ = Stage::AUDIO;
    return makeConfigRequest(settings_);

  case Stage::AUDIO: {
    BridgeItem item = nextItem();
    if (item.isEndOfInput()) {
      stage_ = Stage::DONE;
      LOG_DEBUG("Request stream drained: " << audioRequests_
                                           << " audio requests, "
                                           << audioBytes_ << " bytes");
      return std::nullopt;
    }
    StreamingRecognizeRequest request;
    audioBytes_ += item.payload().size();
    ++audioRequests_;
    request.set_audio(item.takePayload());
    return request;
  }

  case Stage::DONE:
    break;
  }
  return std::nullopt;
}

void RequestGenerator::setIdleSuspended(bool suspended) {
  idleSuspended_ = suspended;
  ++idleEpoch_;
}

BridgeItem RequestGenerator::nextItem() {
  if (idleTimeout_.count() <= 0)
    return queue_.pop();

  while (true) {
    uint64_t epoch = idleEpoch_;
    auto item = queue_.pop(idleTimeout_);
    if (item)
      return std::move(*item);
    if (idleSuspended_ || idleEpoch_ != epoch)
      continue;

    if (!idleReported_) {
      idleReported_ = true;
      LOG_WARN("No audio for " << idleTimeout_.count()
                               << " ms, requesting end of input");
      if (onIdle_)
        onIdle_();
    }
  }
}
