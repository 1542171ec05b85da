#pragma once

#include <string>

enum class SessionStatus { CREATED, ACTIVE, PAUSED, ENDED };

struct Session {
  std::string id;
  SessionStatus status = SessionStatus::CREATED;
  std::string ownerId;
};

// Read-only view of clinical sessions.
class SessionRepository {
public:
  virtual ~SessionRepository() = default;

  // Throws NotFoundError when the session does not exist or belongs to
  // someone else; both look the same to the caller.
  virtual Session getSession(const std::string &sessionId,
                             const std::string &principalId) = 0;

  static const char *statusName(SessionStatus status);
  static bool parseStatus(const std::string &name, SessionStatus &out);
};
