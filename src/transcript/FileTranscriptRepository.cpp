#include "FileTranscriptRepository.h"
#include "../app/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>

FileTranscriptRepository::FileTranscriptRepository(const std::string &directory)
    : directory_(directory) {
  try {
    std::filesystem::create_directories(directory_);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create transcript directory " << directory_ << ": "
                                                       << e.what());
  }
}

std::string FileTranscriptRepository::fileStem(const std::string &sessionId) {
  static const char *hex = "0123456789ABCDEF";
  std::string stem;
  for (char c : sessionId) {
    bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                 (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (plain) {
      stem += c;
    } else {
      auto byte = static_cast<unsigned char>(c);
      stem += '%';
      stem += hex[byte >> 4];
      stem += hex[byte & 0x0F];
    }
  }
  // Leaves room for the ".status.tmp" suffix under NAME_MAX.
  if (stem.size() > 240)
    return std::string();
  return stem;
}

bool FileTranscriptRepository::canStore(const std::string &sessionId) const {
  return !fileStem(sessionId).empty();
}

std::string FileTranscriptRepository::textPath(const std::string &sessionId) const {
  return directory_ + "/" + fileStem(sessionId) + ".txt";
}

std::string
FileTranscriptRepository::statusPath(const std::string &sessionId) const {
  return directory_ + "/" + fileStem(sessionId) + ".status";
}

bool FileTranscriptRepository::append(const std::string &sessionId,
                                      const std::string &text) {
  if (!canStore(sessionId)) {
    LOG_ERROR("Refusing transcript append for session id '" << sessionId
                                                          << "'");
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  auto existing = std::filesystem::file_size(textPath(sessionId), ec);
  bool needsSeparator = !ec && existing > 0;

  std::ofstream out(textPath(sessionId), std::ios::binary | std::ios::app);
  if (!out.is_open()) {
    LOG_ERROR("Failed to open transcript file " << textPath(sessionId));
    return false;
  }
  if (needsSeparator)
    out << ' ';
  out << text;
  out.flush();
  if (!out) {
    LOG_ERROR("Failed to write transcript file " << textPath(sessionId));
    return false;
  }
  return true;
}

std::string FileTranscriptRepository::get(const std::string &sessionId) {
  if (!canStore(sessionId))
    return std::string();

  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(textPath(sessionId), std::ios::binary);
  if (!in.is_open())
    return std::string();
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool FileTranscriptRepository::setStatus(const std::string &sessionId,
                                         TranscriptStatus status,
                                         const std::string &errorMessage) {
  if (!canStore(sessionId))
    return false;

  std::lock_guard<std::mutex> lock(mutex_);
  std::string tmpPath = statusPath(sessionId) + ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::trunc);
    if (!out.is_open()) {
      LOG_ERROR("Failed to open status file " << tmpPath);
      return false;
    }
    out << statusName(status) << "\n";
    if (!errorMessage.empty())
      out << errorMessage << "\n";
  }

  std::error_code ec;
  std::filesystem::rename(tmpPath, statusPath(sessionId), ec);
  if (ec) {
    LOG_ERROR("Failed to update status for session " << sessionId << ": "
                                                     << ec.message());
    return false;
  }
  return true;
}

TranscriptRecord FileTranscriptRepository::record(const std::string &sessionId) {
  TranscriptRecord rec;
  rec.text = get(sessionId);
  if (!canStore(sessionId))
    return rec;

  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(statusPath(sessionId));
  std::string line;
  if (in.is_open() && std::getline(in, line)) {
    rec.status = parseStatus(line);
    std::getline(in, rec.errorMessage);
  }
  return rec;
}
