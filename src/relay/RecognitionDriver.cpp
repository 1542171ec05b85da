#include "RecognitionDriver.h"
#include "../app/Logger.h"
#include <thread>

using scribe::speech::v1::StreamingRecognizeResponse;

const char *upstreamErrorKindName(UpstreamErrorKind kind) {
  switch (kind) {
  case UpstreamErrorKind::QUOTA_EXHAUSTED:
    return "quota_exhausted";
  case UpstreamErrorKind::INVALID_ARGUMENT:
    return "invalid_argument";
  case UpstreamErrorKind::UNAVAILABLE:
    return "unavailable";
  case UpstreamErrorKind::DEADLINE_EXCEEDED:
    return "deadline_exceeded";
  case UpstreamErrorKind::PERMISSION_DENIED:
    return "permission_denied";
  case UpstreamErrorKind::CANCELLED:
    return "cancelled";
  case UpstreamErrorKind::INTERNAL:
    return "internal";
  }
  return "internal";
}

RecognitionDriver::RecognitionDriver(SpeechClient &client,
                                     RequestGenerator &generator,
                                     const std::string &sessionId)
    : client_(client), generator_(generator), sessionId_(sessionId) {}

RecognitionDriver::~RecognitionDriver() {
  if (future_.valid()) {
    cancel();
    future_.wait();
  }
}

UpstreamError RecognitionDriver::classify(const grpc::Status &status) {
  UpstreamErrorKind kind;
  std::string prefix;
  switch (status.error_code()) {
  case grpc::StatusCode::RESOURCE_EXHAUSTED:
    kind = UpstreamErrorKind::QUOTA_EXHAUSTED;
    prefix = "Recognition quota exceeded";
    break;
  case grpc::StatusCode::INVALID_ARGUMENT:
  case grpc::StatusCode::FAILED_PRECONDITION:
  case grpc::StatusCode::OUT_OF_RANGE:
    kind = UpstreamErrorKind::INVALID_ARGUMENT;
    prefix = "Recognition request rejected";
    break;
  case grpc::StatusCode::UNAVAILABLE:
    kind = UpstreamErrorKind::UNAVAILABLE;
    prefix = "Recognition service unavailable";
    break;
  case grpc::StatusCode::DEADLINE_EXCEEDED:
    kind = UpstreamErrorKind::DEADLINE_EXCEEDED;
    prefix = "Recognition timed out";
    break;
  case grpc::StatusCode::PERMISSION_DENIED:
  case grpc::StatusCode::UNAUTHENTICATED:
    kind = UpstreamErrorKind::PERMISSION_DENIED;
    prefix = "Recognition service denied access";
    break;
  case grpc::StatusCode::CANCELLED:
    kind = UpstreamErrorKind::CANCELLED;
    prefix = "Recognition cancelled";
    break;
  default:
    kind = UpstreamErrorKind::INTERNAL;
    prefix = "Recognition service error";
    break;
  }

  std::string message = prefix;
  if (!status.error_message().empty())
    message += ": " + status.error_message();
  return UpstreamError(kind, message);
}

void RecognitionDriver::writerLoop(RecognizeStream &stream) {
  uint64_t written = 0;
  while (auto request = generator_.next()) {
    if (!stream.Write(*request)) {
      LOG_WARN("[" << sessionId_ << "] recognition stream refused write #"
                   << written << ", stopping writer");
      break;
    }
    ++written;
  }
  if (!stream.WritesDone()) {
    LOG_DEBUG("[" << sessionId_ << "] WritesDone on a closed stream");
  }
  LOG_DEBUG("[" << sessionId_ << "] writer finished after " << written
                << " requests");
}

void RecognitionDriver::run() {
  grpc::ClientContext *context;
  {
    std::lock_guard<std::mutex> lock(contextMutex_);
    context_ = std::make_unique<grpc::ClientContext>();
    context = context_.get();
    if (cancelled_)
      context->TryCancel();
  }

  auto stream = client_.openStream(context);
  if (!stream)
    throw UpstreamError(UpstreamErrorKind::UNAVAILABLE,
                        "Recognition stream could not be opened");

  LOG_INFO("[" << sessionId_ << "] recognition stream opened to "
               << client_.target());

  std::thread writer(&RecognitionDriver::writerLoop, this, std::ref(*stream));

  StreamingRecognizeResponse response;
  try {
    while (stream->Read(&response)) {
      if (onResponse_)
        onResponse_(response);
    }
  } catch (const std::exception &e) {
    LOG_ERROR("[" << sessionId_ << "] response handling failed: " << e.what());
    context->TryCancel();
    if (onReadsDone_)
      onReadsDone_();
    writer.join();
    grpc::Status status = stream->Finish();
    LOG_DEBUG("[" << sessionId_ << "] cancelled stream finished with status "
                  << status.error_code());
    throw UpstreamError(UpstreamErrorKind::INTERNAL,
                        std::string("Response handling failed: ") + e.what());
  }

  if (onReadsDone_)
    onReadsDone_();
  writer.join();

  grpc::Status status = stream->Finish();
  if (!status.ok()) {
    LOG_WARN("[" << sessionId_ << "] recognition ended with status "
                 << status.error_code() << ": " << status.error_message());
    throw classify(status);
  }
  LOG_INFO("[" << sessionId_ << "] recognition stream completed");
}

void RecognitionDriver::start(FinishedHandler onFinished) {
  future_ = std::async(std::launch::async, [this, onFinished]() {
    try {
      run();
    } catch (...) {
      if (onFinished)
        onFinished();
      throw;
    }
    if (onFinished)
      onFinished();
  });
}

void RecognitionDriver::result() {
  if (future_.valid())
    future_.get();
}

void RecognitionDriver::wait() {
  if (future_.valid())
    future_.wait();
}

void RecognitionDriver::cancel() {
  std::lock_guard<std::mutex> lock(contextMutex_);
  cancelled_ = true;
  if (context_)
    context_->TryCancel();
}
