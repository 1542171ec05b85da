#include "YamlSessionRepository.h"
#include "../app/Logger.h"
#include "../relay/RelayErrors.h"
#include <yaml-cpp/yaml.h>

YamlSessionRepository::YamlSessionRepository(const std::string &path)
    : path_(path) {}

bool YamlSessionRepository::load() {
  try {
    YAML::Node root = YAML::LoadFile(path_);
    if (!loadFromNode(root))
      return false;
    std::lock_guard<std::mutex> lock(mutex_);
    loadedAt_ = std::filesystem::last_write_time(path_);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to load sessions file " << path_ << ": " << e.what());
    return false;
  }
  LOG_INFO("Loaded " << count() << " sessions from " << path_);
  return true;
}

bool YamlSessionRepository::loadFromNode(const YAML::Node &root) {
  std::map<std::string, Session> sessions;
  try {
    YAML::Node list = root["sessions"];
    if (list) {
      if (!list.IsSequence()) {
        LOG_ERROR("'sessions' must be a list");
        return false;
      }
      for (const auto &entry : list) {
        Session session;
        session.id = entry["id"].as<std::string>("");
        session.ownerId = entry["owner"].as<std::string>("");
        std::string status = entry["status"].as<std::string>("CREATED");
        if (session.id.empty() || session.ownerId.empty()) {
          LOG_WARN("Skipping session entry without id or owner");
          continue;
        }
        if (!parseStatus(status, session.status)) {
          LOG_WARN("Skipping session " << session.id
                                       << " with unknown status " << status);
          continue;
        }
        sessions[session.id] = session;
      }
    }
  } catch (const YAML::Exception &e) {
    LOG_ERROR("Invalid sessions document: " << e.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.swap(sessions);
  return true;
}

void YamlSessionRepository::reloadIfChanged() {
  if (path_.empty())
    return;
  std::error_code ec;
  auto mtime = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    LOG_WARN("Sessions file " << path_ << " unavailable: " << ec.message());
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mtime == loadedAt_)
      return;
    loadedAt_ = mtime;
  }
  LOG_INFO("Sessions file changed, reloading");
  if (!load()) {
    LOG_WARN("Keeping previous session table");
  }
}

Session YamlSessionRepository::getSession(const std::string &sessionId,
                                          const std::string &principalId) {
  reloadIfChanged();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(sessionId);
  if (it == sessions_.end() || it->second.ownerId != principalId)
    throw NotFoundError("Session not found or access denied");
  return it->second;
}

size_t YamlSessionRepository::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}
