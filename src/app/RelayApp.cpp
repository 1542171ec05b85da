#include "RelayApp.h"
#include "Config.h"
#include "Logger.h"
#include "SignalHandler.h"
#include <iostream>
#include <poll.h>
#include <unistd.h>

RelayApp::RelayApp() {}

RelayApp::~RelayApp() {
  running_ = false;
  if (cliThread_.joinable())
    cliThread_.join();
  if (!ioThreads_.empty())
    shutdown();
}

bool RelayApp::init(const std::string &configPath) {
  if (!Config::instance().load(configPath))
    return false;

  auto &config = Config::instance();

  if (!Logger::instance().setLevel(config.logLevel)) {
    LOG_WARN("Unknown log_level " << config.logLevel << ", using INFO");
  }

  try {
    speech_ = std::make_unique<SpeechClient>(config.speech);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create recognition client: " << e.what());
    return false;
  }
  if (!speech_->waitForConnected(std::chrono::seconds(2))) {
    LOG_WARN("Recognition backend " << speech_->target()
                                    << " not reachable yet");
  }

  verifier_ = std::make_unique<JwtTokenVerifier>(config.jwtSecret);

  sessions_ = std::make_unique<YamlSessionRepository>(config.sessionsFile);
  if (!sessions_->load())
    return false;

  try {
    transcripts_ =
        std::make_unique<FileTranscriptRepository>(config.transcriptsDir);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to open transcripts directory " << config.transcriptsDir
                                                      << ": " << e.what());
    return false;
  }

  registry_ = std::make_unique<RelayRegistry>(config.maxRelays);
  gateway_ = std::make_unique<ConnectionGateway>(
      *verifier_, *sessions_, *registry_, *speech_, *transcripts_,
      config.relay);

  server_ = std::make_unique<WsServer>(ioc_, config.bindIp, config.wsPort,
                                       config.pathPrefix, *gateway_);
  if (!server_->start())
    return false;

  work_.emplace(boost::asio::make_work_guard(ioc_));
  for (int i = 0; i < config.ioThreads; ++i) {
    ioThreads_.emplace_back([this, i]() {
      try {
        ioc_.run();
      } catch (const std::exception &e) {
        LOG_ERROR("I/O thread " << i << " terminated: " << e.what());
        SignalHandler::setExit();
      }
    });
  }
  LOG_INFO("Started " << config.ioThreads << " I/O threads");
  return true;
}

void RelayApp::run() {
  running_ = true;
  cliThread_ = std::thread(&RelayApp::cliLoop, this);

  LOG_INFO("Relay running. Press Ctrl+C to exit.");

  while (running_ && !SignalHandler::shouldExit()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (SignalHandler::lastSignal() != 0) {
    LOG_INFO("Received signal " << SignalHandler::lastSignal());
  }
  running_ = false;
  LOG_INFO("Shutting down...");
  shutdown();
}

bool RelayApp::waitForRelays(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (registry_->count() > 0) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return true;
}

void RelayApp::shutdown() {
  if (server_)
    server_->stop();

  if (registry_) {
    auto relays = registry_->getAllRelays();
    if (!relays.empty()) {
      LOG_INFO("Stopping " << relays.size() << " active relays");
    }
    for (auto &relay : relays)
      relay->requestStop(StopReason::SHUTDOWN);

    auto grace = std::chrono::seconds(Config::instance().relay.shutdownGraceSec);
    if (!waitForRelays(grace)) {
      LOG_WARN(registry_->count()
               << " relays still running after grace period, cancelling");
      for (auto &relay : registry_->getAllRelays())
        relay->abort();
      if (!waitForRelays(std::chrono::seconds(2))) {
        LOG_WARN(registry_->count() << " relays did not close");
      }
    }
  }

  work_.reset();
  ioc_.stop();
  for (auto &t : ioThreads_) {
    if (t.joinable())
      t.join();
  }
  ioThreads_.clear();

  // Workers must be gone before their connections are torn down with the
  // io_context.
  if (registry_) {
    for (auto &relay : registry_->getAllRelays()) {
      relay->abort();
      relay->awaitWorker();
    }
  }
  LOG_INFO("Shutdown complete");
}

void RelayApp::listRelays() {
  auto relays = registry_->getAllRelays();
  LOG_INFO("Active relays: " << relays.size() << "/" << registry_->capacity());
  for (const auto &relay : relays) {
    LOG_INFO("  " << relay->getSessionId() << " principal="
                  << relay->getPrincipalId() << " state="
                  << RelayStateMachine::name(relay->getState())
                  << " frames=" << relay->getForwardedFrames()
                  << " responses=" << relay->getResponseCount());
  }
}

void RelayApp::cliLoop() {
  std::string line;
  while (running_) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, 200) <= 0)
      continue;
    if (!std::getline(std::cin, line))
      break;

    if (line == "list") {
      listRelays();
    } else if (line.find("cut ") == 0) {
      std::string id = line.substr(4);
      auto relay = registry_->getRelay(id);
      if (relay) {
        relay->requestStop(StopReason::SHUTDOWN);
        LOG_INFO("Cut relay " << id);
      } else {
        LOG_WARN("No active relay for session " << id);
      }
    } else if (line == "exit" || line == "quit") {
      SignalHandler::setExit();
    } else if (!line.empty()) {
      LOG_WARN("Unknown command: " << line << " (list, cut <id>, quit)");
    }
  }
}
