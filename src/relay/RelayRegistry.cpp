#include "RelayRegistry.h"

RelayRegistry::RelayRegistry(size_t maxRelays) : maxRelays_(maxRelays) {}

AdmitResult RelayRegistry::reserve(const std::string &sessionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (relays_.find(sessionId) != relays_.end())
    return AdmitResult::DUPLICATE;
  if (relays_.size() >= maxRelays_)
    return AdmitResult::FULL;
  relays_[sessionId] = nullptr;
  return AdmitResult::ADDED;
}

void RelayRegistry::attach(const std::string &sessionId,
                           std::shared_ptr<RelaySession> relay) {
  std::lock_guard<std::mutex> lock(mutex_);
  relays_[sessionId] = relay;
}

std::shared_ptr<RelaySession>
RelayRegistry::getRelay(const std::string &sessionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = relays_.find(sessionId);
  if (it != relays_.end())
    return it->second;
  return nullptr;
}

void RelayRegistry::removeRelay(const std::string &sessionId) {
  std::shared_ptr<RelaySession> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = relays_.find(sessionId);
    if (it == relays_.end())
      return;
    removed = std::move(it->second);
    relays_.erase(it);
  }
  // Released outside the lock; the last reference may tear the relay down.
}

void RelayRegistry::removeRelay(const std::string &sessionId,
                                const RelaySession *relay) {
  std::shared_ptr<RelaySession> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = relays_.find(sessionId);
    if (it == relays_.end() || it->second.get() != relay)
      return;
    removed = std::move(it->second);
    relays_.erase(it);
  }
}

size_t RelayRegistry::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return relays_.size();
}

std::vector<std::string> RelayRegistry::getAllSessionIds() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  for (const auto &pair : relays_) {
    ids.push_back(pair.first);
  }
  return ids;
}

std::vector<std::shared_ptr<RelaySession>> RelayRegistry::getAllRelays() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<RelaySession>> relays;
  for (const auto &pair : relays_) {
    if (pair.second)
      relays.push_back(pair.second);
  }
  return relays;
}
