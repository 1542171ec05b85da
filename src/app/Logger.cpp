#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <thread>

Logger &Logger::instance() {
  static Logger instance;
  return instance;
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  currentLevel_ = level;
}

bool Logger::setLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG")
    setLevel(LogLevel::DEBUG);
  else if (upper == "INFO")
    setLevel(LogLevel::INFO);
  else if (upper == "WARN" || upper == "WARNING")
    setLevel(LogLevel::WARN);
  else if (upper == "ERROR")
    setLevel(LogLevel::ERROR);
  else
    return false;
  return true;
}

const char *Logger::levelTag(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "[DEBUG] ";
  case LogLevel::INFO:
    return "[INFO]  ";
  case LogLevel::WARN:
    return "[WARN]  ";
  case LogLevel::ERROR:
    return "[ERROR] ";
  }
  return "[?]     ";
}

void Logger::log(LogLevel level, const std::string &msg) {
  auto now = std::chrono::system_clock::now();
  auto in_time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&in_time_t, &local);

  std::lock_guard<std::mutex> lock(mutex_);
  // Errors go to stderr so they survive stdout redirection in containers.
  std::ostream &out = level == LogLevel::ERROR ? std::cerr : std::cout;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << " "
      << levelTag(level) << "(" << std::this_thread::get_id() << ") " << msg
      << std::endl;
}

bool Logger::isEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= currentLevel_;
}
