#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../app/Config.h"
#include "../grpc/SpeechClient.h"
#include "../transcript/TranscriptAccumulator.h"
#include "../ws/ClientChannel.h"
#include "AudioIngress.h"
#include "BridgeQueue.h"
#include "RecognitionDriver.h"
#include "RelayStateMachine.h"
#include "RequestGenerator.h"
#include "ResponseDispatcher.h"

// One relay between a client connection and one StreamingRecognize call.
// Owns the ingress/driver pair and coordinates their shutdown: the first side
// to end queues the sentinel, the connection is closed once both have ended,
// and at most one error message reaches the client.
class RelaySession : public std::enable_shared_from_this<RelaySession> {
public:
  using ClosedCallback = std::function<void(const std::string &sessionId)>;

  RelaySession(const std::string &sessionId, const std::string &principalId,
               std::shared_ptr<ClientChannel> channel, SpeechClient &speech,
               TranscriptRepository &transcripts, const RelaySettings &settings);
  ~RelaySession();

  const std::string &getSessionId() const { return sessionId_; }
  const std::string &getPrincipalId() const { return principalId_; }

  void setClosedCallback(ClosedCallback cb) { closedCb_ = cb; }

  // Gateway accepted the connection.
  void markAuthenticated();
  // Starts the recognition worker. Call on the channel's context.
  void start();

  // Inbound traffic, on the channel's context.
  void onBinary(std::string payload);
  void onText(const std::string &text);
  void onDisconnect();

  // Ends the audio input. Thread-safe; only the first reason is kept.
  void requestStop(StopReason reason);
  // Cancels the recognition call in flight (process shutdown past grace).
  void abort();
  // Blocks until the recognition worker has returned.
  void awaitWorker() { driver_.wait(); }

  RelayState getState() const { return stateMachine_.getState(); }
  bool isClosed() const { return closed_; }
  std::optional<StopReason> getStopReason();
  std::string getTranscript() { return accumulator_.get(); }
  uint64_t getResponseCount() const { return dispatcher_.responses(); }
  uint64_t getForwardedFrames() const { return ingress_.forwardedFrames(); }

private:
  void send(const std::string &text);
  void onDriverFinished();
  void fail(const std::string &message);
  void maybeClose();

  std::string sessionId_;
  std::string principalId_;
  std::shared_ptr<ClientChannel> channel_;
  TranscriptRepository &transcripts_;

  RelayStateMachine stateMachine_;
  BridgeQueue queue_;
  TranscriptAccumulator accumulator_;
  RequestGenerator generator_;
  ResponseDispatcher dispatcher_;
  AudioIngress ingress_;
  RecognitionDriver driver_;

  std::mutex mutex_;
  std::optional<StopReason> stopReason_;

  std::atomic<bool> clientGone_{false};
  std::atomic<bool> errorSent_{false};
  std::atomic<bool> closed_{false};
  bool ingressDone_ = false;
  bool driverDone_ = false;
  std::atomic<bool> failed_{false};

  ClosedCallback closedCb_;
};
