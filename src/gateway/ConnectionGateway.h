#pragma once

#include "../app/Config.h"
#include "../grpc/SpeechClient.h"
#include "../relay/RelayRegistry.h"
#include "../relay/RelaySession.h"
#include "../transcript/TranscriptRepository.h"
#include "../ws/ClientChannel.h"
#include "SessionRepository.h"
#include "TokenVerifier.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

// Admission control for new client connections: token, session ownership and
// status, one relay per session, relay capacity. A refused connection gets
// one error payload with a code and is closed; nothing else is created.
class ConnectionGateway {
public:
  ConnectionGateway(TokenVerifier &verifier, SessionRepository &sessions,
                    RelayRegistry &registry, SpeechClient &speech,
                    TranscriptRepository &transcripts,
                    const RelaySettings &settings);

  // Call on the channel's context. Returns the started relay, or nullptr
  // after the channel was refused and closed.
  std::shared_ptr<RelaySession> admit(std::shared_ptr<ClientChannel> channel,
                                      const std::string &token,
                                      const std::string &sessionId);

  uint64_t admitted() const { return admitted_; }
  uint64_t refused() const { return refused_; }

private:
  void refuse(ClientChannel &channel, const std::string &sessionId,
              const std::string &code, const std::string &message,
              CloseCode closeCode);

  TokenVerifier &verifier_;
  SessionRepository &sessions_;
  RelayRegistry &registry_;
  SpeechClient &speech_;
  TranscriptRepository &transcripts_;
  RelaySettings settings_;

  std::atomic<uint64_t> admitted_{0};
  std::atomic<uint64_t> refused_{0};
};
