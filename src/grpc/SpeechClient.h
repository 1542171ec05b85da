#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "../app/Config.h"
#include "speech.grpc.pb.h"
#include "speech.pb.h"
#include <grpcpp/grpcpp.h>

using RecognizeStream =
    grpc::ClientReaderWriter<scribe::speech::v1::StreamingRecognizeRequest,
                             scribe::speech::v1::StreamingRecognizeResponse>;

// Process-wide handle on the recognition backend. Built once at startup and
// shared by reference; channel and stub are safe for concurrent calls.
class SpeechClient {
public:
  explicit SpeechClient(const SpeechSettings &settings);
  // Uses an existing channel, e.g. an in-process one.
  SpeechClient(std::shared_ptr<grpc::Channel> channel,
               const SpeechSettings &settings);

  std::unique_ptr<RecognizeStream> openStream(grpc::ClientContext *context);

  // Best-effort connectivity check used at startup.
  bool waitForConnected(std::chrono::milliseconds timeout);

  const SpeechSettings &settings() const { return settings_; }
  const std::string &target() const { return settings_.target; }

private:
  static std::shared_ptr<grpc::ChannelCredentials>
  makeCredentials(const SpeechSettings &settings);

  SpeechSettings settings_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<scribe::speech::v1::Recognizer::Stub> stub_;
};
