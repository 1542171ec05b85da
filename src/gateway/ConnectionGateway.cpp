#include "ConnectionGateway.h"
#include "../app/Logger.h"
#include "../protocol/ClientProtocol.h"
#include "../relay/RelayErrors.h"

ConnectionGateway::ConnectionGateway(TokenVerifier &verifier,
                                     SessionRepository &sessions,
                                     RelayRegistry &registry,
                                     SpeechClient &speech,
                                     TranscriptRepository &transcripts,
                                     const RelaySettings &settings)
    : verifier_(verifier), sessions_(sessions), registry_(registry),
      speech_(speech), transcripts_(transcripts), settings_(settings) {}

void ConnectionGateway::refuse(ClientChannel &channel,
                               const std::string &sessionId,
                               const std::string &code,
                               const std::string &message,
                               CloseCode closeCode) {
  ++refused_;
  LOG_WARN("[" << sessionId << "] refused connection from "
               << channel.remoteAddress() << ": " << code << " (" << message
               << ")");
  channel.sendText(ClientProtocol::error(message, code));
  channel.close(closeCode, code);
}

std::shared_ptr<RelaySession>
ConnectionGateway::admit(std::shared_ptr<ClientChannel> channel,
                         const std::string &token,
                         const std::string &sessionId) {
  Principal principal;
  try {
    principal = verifier_.verify(token);
  } catch (const AuthenticationError &e) {
    refuse(*channel, sessionId, "AUTHENTICATION_FAILED", e.what(),
           CloseCode::POLICY_VIOLATION);
    return nullptr;
  }

  Session session;
  try {
    session = sessions_.getSession(sessionId, principal.userId);
  } catch (const NotFoundError &e) {
    refuse(*channel, sessionId, "SESSION_NOT_FOUND", e.what(),
           CloseCode::POLICY_VIOLATION);
    return nullptr;
  }

  if (session.status != SessionStatus::ACTIVE &&
      session.status != SessionStatus::PAUSED) {
    refuse(*channel, sessionId, "SESSION_NOT_ACTIVE",
           std::string("Session is ") +
               SessionRepository::statusName(session.status),
           CloseCode::POLICY_VIOLATION);
    return nullptr;
  }

  if (!transcripts_.canStore(sessionId)) {
    refuse(*channel, sessionId, "INVALID_SESSION_ID",
           "Session id cannot be used for a transcript",
           CloseCode::POLICY_VIOLATION);
    return nullptr;
  }

  switch (registry_.reserve(sessionId)) {
  case AdmitResult::DUPLICATE:
    refuse(*channel, sessionId, "SESSION_BUSY",
           "Session already has an active transcription stream",
           CloseCode::POLICY_VIOLATION);
    return nullptr;
  case AdmitResult::FULL:
    refuse(*channel, sessionId, "SERVER_BUSY",
           "Too many active transcription streams",
           CloseCode::TRY_AGAIN_LATER);
    return nullptr;
  case AdmitResult::ADDED:
    break;
  }

  std::shared_ptr<RelaySession> relay;
  try {
    relay = std::make_shared<RelaySession>(sessionId, principal.userId, channel,
                                           speech_, transcripts_, settings_);
  } catch (const std::exception &e) {
    registry_.removeRelay(sessionId);
    LOG_ERROR("[" << sessionId << "] failed to create relay: " << e.what());
    refuse(*channel, sessionId, "INTERNAL_ERROR",
           "Transcription service unavailable", CloseCode::INTERNAL_ERROR);
    return nullptr;
  }
  registry_.attach(sessionId, relay);

  RelayRegistry &registry = registry_;
  const RelaySession *raw = relay.get();
  relay->setClosedCallback([&registry, raw](const std::string &id) {
    registry.removeRelay(id, raw);
  });
  relay->markAuthenticated();

  ++admitted_;
  LOG_INFO("[" << sessionId << "] accepted " << principal.userId << " from "
               << channel->remoteAddress() << " (" << registry_.count()
               << " active)");

  channel->sendText(ClientProtocol::connected(sessionId));
  relay->start();
  return relay;
}
