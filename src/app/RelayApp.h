#pragma once

#include "../gateway/ConnectionGateway.h"
#include "../gateway/JwtTokenVerifier.h"
#include "../gateway/YamlSessionRepository.h"
#include "../grpc/SpeechClient.h"
#include "../relay/RelayRegistry.h"
#include "../transcript/FileTranscriptRepository.h"
#include "../ws/WsServer.h"
#include <atomic>
#include <boost/asio.hpp>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

class RelayApp {
public:
  RelayApp();
  ~RelayApp();

  bool init(const std::string &configPath);
  void run();

private:
  void cliLoop();
  void listRelays();
  void shutdown();
  // Polls until no relay is left or the timeout passes.
  bool waitForRelays(std::chrono::milliseconds timeout);

  // Outlives every relay and connection below it.
  boost::asio::io_context ioc_;
  std::optional<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>
      work_;

  std::unique_ptr<SpeechClient> speech_;
  std::unique_ptr<JwtTokenVerifier> verifier_;
  std::unique_ptr<YamlSessionRepository> sessions_;
  std::unique_ptr<FileTranscriptRepository> transcripts_;
  std::unique_ptr<RelayRegistry> registry_;
  std::unique_ptr<ConnectionGateway> gateway_;

  std::unique_ptr<WsServer> server_;
  std::vector<std::thread> ioThreads_;

  std::atomic<bool> running_{false};
  std::thread cliThread_;
};
