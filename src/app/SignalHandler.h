#pragma once

#include <atomic>

// SIGINT/SIGTERM only raise a flag; the main loop does the shutdown work.
class SignalHandler {
public:
  static void init();
  static bool shouldExit();
  static void setExit();
  // Number of the signal that requested exit, 0 if none.
  static int lastSignal();

private:
  static void handleSignal(int signum);
  static std::atomic<bool> exitFlag_;
  static std::atomic<int> lastSignal_;
};
