#include "SessionRepository.h"
#include <algorithm>
#include <cctype>

const char *SessionRepository::statusName(SessionStatus status) {
  switch (status) {
  case SessionStatus::CREATED:
    return "CREATED";
  case SessionStatus::ACTIVE:
    return "ACTIVE";
  case SessionStatus::PAUSED:
    return "PAUSED";
  case SessionStatus::ENDED:
    return "ENDED";
  }
  return "UNKNOWN";
}

bool SessionRepository::parseStatus(const std::string &name,
                                    SessionStatus &out) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (SessionStatus s : {SessionStatus::CREATED, SessionStatus::ACTIVE,
                          SessionStatus::PAUSED, SessionStatus::ENDED}) {
    if (upper == statusName(s)) {
      out = s;
      return true;
    }
  }
  return false;
}
