#include "AudioIngress.h"
#include "../app/Logger.h"
#include "../protocol/ClientProtocol.h"
#include "RelayErrors.h"

const char *stopReasonName(StopReason reason) {
  switch (reason) {
  case StopReason::CLIENT_STOP:
    return "client_stop";
  case StopReason::CLIENT_DISCONNECT:
    return "client_disconnect";
  case StopReason::IDLE_TIMEOUT:
    return "idle_timeout";
  case StopReason::UPSTREAM_FINISHED:
    return "upstream_finished";
  case StopReason::SHUTDOWN:
    return "shutdown";
  }
  return "unknown";
}

AudioIngress::AudioIngress(BridgeQueue &queue, const std::string &sessionId,
                           StopHandler onStop, PauseHandler onPause)
    : queue_(queue), sessionId_(sessionId), onStop_(std::move(onStop)),
      onPause_(std::move(onPause)) {}

void AudioIngress::onBinary(std::string payload) {
  if (finished_ || paused_) {
    ++discarded_;
    return;
  }
  if (payload.empty())
    return;

  size_t size = payload.size();
  if (!queue_.push(std::move(payload))) {
    ++discarded_;
    LOG_DEBUG("[" << sessionId_ << "] audio after end of input discarded");
    return;
  }
  uint64_t n = ++forwarded_;
  LOG_DEBUG("[" << sessionId_ << "] queued " << size << " bytes (frame " << n
                << ")");
}

void AudioIngress::onText(const std::string &text) {
  ControlMessage control;
  try {
    control = ClientProtocol::parseControl(text);
  } catch (const MalformedControlMessage &e) {
    LOG_WARN("[" << sessionId_ << "] ignoring control message: " << e.what());
    return;
  }

  if (finished_) {
    LOG_DEBUG("[" << sessionId_ << "] '" << ClientProtocol::controlName(control.type)
                  << "' after end of ingress ignored");
    return;
  }

  switch (control.type) {
  case ControlType::STOP:
    LOG_INFO("[" << sessionId_ << "] stop requested by client after "
                 << forwarded_ << " frames");
    end(StopReason::CLIENT_STOP);
    break;
  case ControlType::PAUSE:
    if (!paused_.exchange(true)) {
      LOG_INFO("[" << sessionId_ << "] paused");
      if (onPause_)
        onPause_(true);
    }
    break;
  case ControlType::RESUME:
    if (paused_.exchange(false)) {
      LOG_INFO("[" << sessionId_ << "] resumed");
      if (onPause_)
        onPause_(false);
    }
    break;
  }
}

void AudioIngress::onDisconnect() {
  if (finished_)
    return;
  LOG_INFO("[" << sessionId_ << "] client disconnected");
  end(StopReason::CLIENT_DISCONNECT);
}

void AudioIngress::finish() { finished_ = true; }

void AudioIngress::end(StopReason reason) {
  if (finished_.exchange(true))
    return;
  if (onStop_)
    onStop_(reason);
}
