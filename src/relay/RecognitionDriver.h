#pragma once

#include "../grpc/SpeechClient.h"
#include "RelayErrors.h"
#include "RequestGenerator.h"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

// Runs one blocking StreamingRecognize call. Requests are written from a
// writer thread pulling the RequestGenerator; responses are read on the
// driver's worker thread and handed to onResponse in backend order.
class RecognitionDriver {
public:
  using ResponseHandler = std::function<void(
      const scribe::speech::v1::StreamingRecognizeResponse &)>;
  using ReadsDoneHandler = std::function<void()>;
  using FinishedHandler = std::function<void()>;

  RecognitionDriver(SpeechClient &client, RequestGenerator &generator,
                    const std::string &sessionId);
  ~RecognitionDriver();

  void setResponseHandler(ResponseHandler handler) { onResponse_ = handler; }
  // Called once the response stream is exhausted, before waiting on the
  // writer; must make the generator reach its end.
  void setReadsDoneHandler(ReadsDoneHandler handler) { onReadsDone_ = handler; }

  // Blocking. Throws UpstreamError on a non-OK final status.
  void run();

  // Launches run() on a worker thread. onFinished is invoked on that thread
  // when run() has returned or thrown; collect the outcome with result().
  void start(FinishedHandler onFinished);
  // Waits for the worker and rethrows its exception, if any.
  void result();
  // Waits for the worker without consuming its outcome.
  void wait();
  bool started() const { return future_.valid(); }

  // Aborts the call in flight.
  void cancel();

  static UpstreamError classify(const grpc::Status &status);

private:
  void writerLoop(RecognizeStream &stream);

  SpeechClient &client_;
  RequestGenerator &generator_;
  std::string sessionId_;

  ResponseHandler onResponse_;
  ReadsDoneHandler onReadsDone_;

  std::mutex contextMutex_;
  std::unique_ptr<grpc::ClientContext> context_;
  std::atomic<bool> cancelled_{false};

  std::future<void> future_;
};
