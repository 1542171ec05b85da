#include "SpeechClient.h"
#include "../app/Logger.h"
#include <fstream>
#include <sstream>

SpeechClient::SpeechClient(const SpeechSettings &settings)
    : settings_(settings) {
  channel_ = grpc::CreateChannel(settings_.target, makeCredentials(settings_));
  stub_ = scribe::speech::v1::Recognizer::NewStub(channel_);
  LOG_INFO("Speech client created for " << settings_.target
                                        << (settings_.useTls ? " (TLS)" : ""));
}

SpeechClient::SpeechClient(std::shared_ptr<grpc::Channel> channel,
                           const SpeechSettings &settings)
    : settings_(settings), channel_(std::move(channel)) {
  stub_ = scribe::speech::v1::Recognizer::NewStub(channel_);
}

std::shared_ptr<grpc::ChannelCredentials>
SpeechClient::makeCredentials(const SpeechSettings &settings) {
  if (!settings.useTls)
    return grpc::InsecureChannelCredentials();

  grpc::SslCredentialsOptions options;
  if (!settings.rootCertsPath.empty()) {
    std::ifstream in(settings.rootCertsPath);
    if (in.is_open()) {
      std::ostringstream ss;
      ss << in.rdbuf();
      options.pem_root_certs = ss.str();
    } else {
      LOG_WARN("Cannot read speech.root_certs " << settings.rootCertsPath
                                                << ", using system roots");
    }
  }
  return grpc::SslCredentials(options);
}

std::unique_ptr<RecognizeStream>
SpeechClient::openStream(grpc::ClientContext *context) {
  return stub_->StreamingRecognize(context);
}

bool SpeechClient::waitForConnected(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::system_clock::now() + timeout;
  return channel_->WaitForConnected(deadline);
}
