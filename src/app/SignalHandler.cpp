#include "SignalHandler.h"
#include <csignal>

std::atomic<bool> SignalHandler::exitFlag_(false);
std::atomic<int> SignalHandler::lastSignal_(0);

void SignalHandler::init() {
  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);
  std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::shouldExit() { return exitFlag_; }

int SignalHandler::lastSignal() { return lastSignal_; }

void SignalHandler::handleSignal(int signum) {
  // Nothing here may allocate or lock.
  lastSignal_ = signum;
  exitFlag_ = true;
}

void SignalHandler::setExit() { exitFlag_ = true; }
