#pragma once

#include "RelaySession.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class AdmitResult { ADDED, DUPLICATE, FULL };

// Live relays by session id. At most one relay per session, reserved before
// the relay is built.
class RelayRegistry {
public:
  explicit RelayRegistry(size_t maxRelays);

  // Claims the session before a relay exists for it; release the claim with
  // removeRelay() if no relay gets attached.
  AdmitResult reserve(const std::string &sessionId);
  void attach(const std::string &sessionId, std::shared_ptr<RelaySession> relay);
  std::shared_ptr<RelaySession> getRelay(const std::string &sessionId);
  void removeRelay(const std::string &sessionId);

  // Only removes the entry if it still points at relay.
  void removeRelay(const std::string &sessionId, const RelaySession *relay);

  size_t count();
  size_t capacity() const { return maxRelays_; }
  std::vector<std::string> getAllSessionIds();
  std::vector<std::shared_ptr<RelaySession>> getAllRelays();

private:
  size_t maxRelays_;
  std::map<std::string, std::shared_ptr<RelaySession>> relays_;
  std::mutex mutex_;
};
