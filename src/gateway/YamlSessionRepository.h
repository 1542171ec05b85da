#pragma once

#include "SessionRepository.h"
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace YAML {
class Node;
}

// Sessions listed in a YAML file:
//
//   sessions:
//     - id: 6f1c...
//       owner: dr-mehta
//       status: ACTIVE
//
// The file is re-read when its modification time changes.
class YamlSessionRepository : public SessionRepository {
public:
  explicit YamlSessionRepository(const std::string &path);

  bool load();
  // Replaces the table from an already parsed document.
  bool loadFromNode(const YAML::Node &root);

  Session getSession(const std::string &sessionId,
                     const std::string &principalId) override;

  size_t count();

private:
  void reloadIfChanged();

  std::string path_;
  std::filesystem::file_time_type loadedAt_{};
  std::mutex mutex_;
  std::map<std::string, Session> sessions_;
};
