#pragma once

/**
 * FakeRecognizer.h - In-process Recognizer service for relay tests
 */

#include "speech.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <mutex>
#include <string>

enum class FakeMode {
  // Interim "hel" after the first audio request; final "hello" once the
  // client half-closes, if any audio was seen.
  TRANSCRIBE,
  // Fails with RESOURCE_EXHAUSTED right after the config request.
  QUOTA_EXHAUSTED,
  // Interim "hel" after the first audio request, then RESOURCE_EXHAUSTED.
  QUOTA_EXHAUSTED_MID_STREAM
};

class FakeRecognizer final : public scribe::speech::v1::Recognizer::Service {
public:
  using Request = scribe::speech::v1::StreamingRecognizeRequest;
  using Response = scribe::speech::v1::StreamingRecognizeResponse;

  void setMode(FakeMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
  }

  grpc::Status
  StreamingRecognize(grpc::ServerContext *,
                     grpc::ServerReaderWriter<Response, Request> *stream)
      override {
    FakeMode mode;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      mode = mode_;
      ++calls_;
    }

    Request request;
    if (!stream->Read(&request))
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "empty stream");
    {
      std::lock_guard<std::mutex> lock(mutex_);
      firstWasConfig_ = request.has_streaming_config();
      recognizer_ = request.recognizer();
      if (firstWasConfig_)
        languageCodes_ =
            request.streaming_config().config().language_codes_size();
    }

    if (mode == FakeMode::QUOTA_EXHAUSTED)
      return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                          "quota exceeded for project");

    int audio = 0;
    while (stream->Read(&request)) {
      if (request.streaming_request_case() != Request::kAudio)
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "config sent twice");
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++audioRequests_;
        audioBytes_ += request.audio().size();
      }
      if (mode == FakeMode::QUOTA_EXHAUSTED_MID_STREAM) {
        stream->Write(result("hel", false, 0.4f));
        return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                            "quota exceeded for project");
      }
      if (audio++ == 0) {
        Response begin;
        begin.set_speech_event_type(Response::SPEECH_ACTIVITY_BEGIN);
        stream->Write(begin);
        stream->Write(result("hel", false, 0.4f));
      }
    }

    if (audio > 0) {
      stream->Write(result("hello", true, 0.93f));
      Response end;
      end.set_speech_event_type(Response::SPEECH_ACTIVITY_END);
      stream->Write(end);
    }
    return grpc::Status::OK;
  }

  int calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  int audioRequests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return audioRequests_;
  }
  size_t audioBytes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return audioBytes_;
  }
  bool firstWasConfig() {
    std::lock_guard<std::mutex> lock(mutex_);
    return firstWasConfig_;
  }
  std::string recognizer() {
    std::lock_guard<std::mutex> lock(mutex_);
    return recognizer_;
  }
  int languageCodes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return languageCodes_;
  }

private:
  static Response result(const std::string &text, bool isFinal,
                         float confidence) {
    Response response;
    auto *r = response.add_results();
    r->set_is_final(isFinal);
    auto *alt = r->add_alternatives();
    alt->set_transcript(text);
    alt->set_confidence(confidence);
    return response;
  }

  std::mutex mutex_;
  FakeMode mode_ = FakeMode::TRANSCRIBE;
  int calls_ = 0;
  int audioRequests_ = 0;
  size_t audioBytes_ = 0;
  bool firstWasConfig_ = false;
  std::string recognizer_;
  int languageCodes_ = 0;
};

// Fake service served over an in-process channel.
class FakeRecognizerServer {
public:
  FakeRecognizerServer() {
    grpc::ServerBuilder builder;
    builder.RegisterService(&service_);
    server_ = builder.BuildAndStart();
  }

  ~FakeRecognizerServer() { server_->Shutdown(); }

  std::shared_ptr<grpc::Channel> channel() {
    grpc::ChannelArguments args;
    return server_->InProcessChannel(args);
  }

  FakeRecognizer &service() { return service_; }

private:
  FakeRecognizer service_;
  std::unique_ptr<grpc::Server> server_;
};
