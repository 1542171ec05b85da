#include "RelaySession.h"
#include "../app/Logger.h"
#include "../protocol/ClientProtocol.h"

RelaySession::RelaySession(const std::string &sessionId,
                           const std::string &principalId,
                           std::shared_ptr<ClientChannel> channel,
                           SpeechClient &speech,
                           TranscriptRepository &transcripts,
                           const RelaySettings &settings)
    : sessionId_(sessionId), principalId_(principalId),
      channel_(std::move(channel)), transcripts_(transcripts),
      stateMachine_(sessionId),
      queue_(settings.queueCapacity, settings.backpressure),
      accumulator_(transcripts, sessionId),
      generator_(queue_, speech.settings(),
                 std::chrono::seconds(settings.idleTimeoutSec),
                 [this]() { requestStop(StopReason::IDLE_TIMEOUT); }),
      dispatcher_(sessionId,
                  [this](const std::string &text) { send(text); },
                  accumulator_),
      ingress_(queue_, sessionId,
               [this](StopReason reason) {
                 requestStop(reason);
                 ingressDone_ = true;
                 maybeClose();
               },
               [this](bool paused) { generator_.setIdleSuspended(paused); }),
      driver_(speech, generator_, sessionId) {
  driver_.setResponseHandler(
      [this](const scribe::speech::v1::StreamingRecognizeResponse &response) {
        dispatcher_.dispatch(response);
      });
  driver_.setReadsDoneHandler(
      [this]() { requestStop(StopReason::UPSTREAM_FINISHED); });
}

RelaySession::~RelaySession() {
  // Unblocks the writer if the relay is torn down mid-stream.
  queue_.pushEndOfInput();
  LOG_DEBUG("[" << sessionId_ << "] relay destroyed");
}

void RelaySession::markAuthenticated() {
  stateMachine_.transition(RelayState::AUTHENTICATED);
}

void RelaySession::start() {
  if (!stateMachine_.transition(RelayState::STREAMING))
    return;

  if (!transcripts_.setStatus(sessionId_, TranscriptStatus::IN_PROGRESS)) {
    LOG_WARN("[" << sessionId_ << "] could not record IN_PROGRESS status");
  }

  std::weak_ptr<RelaySession> weak = shared_from_this();
  auto channel = channel_;
  try {
    // The worker holds no strong reference to the relay; completion is
    // handed back to the connection's context.
    driver_.start([weak, channel]() {
      channel->post([weak]() {
        if (auto self = weak.lock())
          self->onDriverFinished();
      });
    });
  } catch (const std::exception &e) {
    LOG_ERROR("[" << sessionId_ << "] failed to start recognition worker: "
                  << e.what());
    requestStop(StopReason::UPSTREAM_FINISHED);
    ingress_.finish();
    ingressDone_ = true;
    driverDone_ = true;
    fail("Transcription service unavailable");
    maybeClose();
    return;
  }

  LOG_INFO("[" << sessionId_ << "] relay streaming for principal "
               << principalId_ << " from " << channel_->remoteAddress());
}

void RelaySession::onBinary(std::string payload) {
  ingress_.onBinary(std::move(payload));
}

void RelaySession::onText(const std::string &text) { ingress_.onText(text); }

void RelaySession::onDisconnect() {
  clientGone_ = true;
  ingress_.onDisconnect();
}

void RelaySession::requestStop(StopReason reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopReason_)
      return;
    stopReason_ = reason;
  }

  LOG_INFO("[" << sessionId_ << "] stopping input: " << stopReasonName(reason));
  if (stateMachine_.getState() == RelayState::STREAMING)
    stateMachine_.transition(RelayState::STOPPING);
  queue_.pushEndOfInput();
}

void RelaySession::abort() {
  LOG_WARN("[" << sessionId_ << "] aborting recognition call");
  requestStop(StopReason::SHUTDOWN);
  driver_.cancel();
}

std::optional<StopReason> RelaySession::getStopReason() {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopReason_;
}

void RelaySession::send(const std::string &text) {
  if (clientGone_ || closed_ || failed_)
    return;
  channel_->sendText(text);
}

void RelaySession::onDriverFinished() {
  std::optional<std::string> error;
  try {
    driver_.result();
  } catch (const UpstreamError &e) {
    LOG_ERROR("[" << sessionId_ << "] upstream failure ("
                  << upstreamErrorKindName(e.kind()) << "): " << e.what());
    error = e.what();
  } catch (const std::exception &e) {
    LOG_ERROR("[" << sessionId_ << "] recognition worker failed: " << e.what());
    error = std::string("Internal error: ") + e.what();
  }

  driverDone_ = true;
  // Covers the backend ending on its own; a no-op when input already ended.
  requestStop(StopReason::UPSTREAM_FINISHED);
  if (error)
    fail(*error);

  if (!ingressDone_) {
    ingress_.finish();
    ingressDone_ = true;
  }
  maybeClose();
}

void RelaySession::fail(const std::string &message) {
  stateMachine_.transition(RelayState::FAILED);
  if (!transcripts_.setStatus(sessionId_, TranscriptStatus::FAILED, message)) {
    LOG_WARN("[" << sessionId_ << "] could not record FAILED status");
  }
  if (!clientGone_ && !errorSent_.exchange(true))
    channel_->sendText(ClientProtocol::error(message));
  failed_ = true;
}

void RelaySession::maybeClose() {
  if (!ingressDone_ || !driverDone_ || closed_.exchange(true))
    return;

  CloseCode code = CloseCode::NORMAL;
  if (failed_) {
    code = CloseCode::INTERNAL_ERROR;
  } else {
    auto reason = getStopReason();
    bool disconnected = clientGone_ || reason == StopReason::CLIENT_DISCONNECT;
    TranscriptStatus status =
        disconnected ? TranscriptStatus::PAUSED : TranscriptStatus::COMPLETED;
    if (!transcripts_.setStatus(sessionId_, status)) {
      LOG_WARN("[" << sessionId_ << "] could not record final status");
    }
    if (!clientGone_) {
      channel_->sendText(ClientProtocol::completed(dispatcher_.responses(),
                                                   accumulator_.get()));
    }
  }

  stateMachine_.transition(RelayState::CLOSED);
  LOG_INFO("[" << sessionId_ << "] relay closed: " << ingress_.forwardedFrames()
               << " frames in, " << dispatcher_.responses() << " responses, "
               << dispatcher_.finals() << " final segments, "
               << queue_.droppedCount() << " frames dropped");

  channel_->close(code, failed_ ? "recognition failed" : "transcription finished");

  if (closedCb_)
    closedCb_(sessionId_);
}
