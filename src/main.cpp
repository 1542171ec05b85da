#include "app/Config.h"
#include "app/RelayApp.h"
#include "app/SignalHandler.h"
#include "gateway/JwtTokenVerifier.h"
#include <iostream>

namespace {

int issueToken(const std::string &userId, int64_t ttl) {
  auto &config = Config::instance();
  JwtTokenVerifier verifier(config.jwtSecret);
  std::cout << verifier.issue(userId, ttl) << std::endl;
  return 0;
}

void usage(const char *prog) {
  std::cerr << "usage: " << prog
            << " [--config <file>] [--issue-token <user_id> [--ttl <sec>]]"
            << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = "../config/relay.yaml";
  std::string tokenUser;
  int64_t ttl = 3600;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--issue-token" && i + 1 < argc) {
      tokenUser = argv[++i];
    } else if (arg == "--ttl" && i + 1 < argc) {
      try {
        ttl = std::stoll(argv[++i]);
      } catch (const std::exception &) {
        std::cerr << "Invalid --ttl value" << std::endl;
        return 2;
      }
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  if (!tokenUser.empty()) {
    if (!Config::instance().load(configPath)) {
      std::cerr << "Failed to load " << configPath << std::endl;
      return 1;
    }
    return issueToken(tokenUser, ttl);
  }

  SignalHandler::init();

  RelayApp app;
  if (!app.init(configPath)) {
    std::cerr << "Failed to initialize relay" << std::endl;
    return 1;
  }

  app.run();
  return 0;
}
