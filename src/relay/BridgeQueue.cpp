#include "BridgeQueue.h"
#include "../app/Logger.h"

BridgeQueue::BridgeQueue(size_t capacity, BackpressurePolicy policy)
    : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

bool BridgeQueue::push(std::string payload) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (endQueued_)
    return false;

  if (items_.size() >= capacity_) {
    if (policy_ == BackpressurePolicy::BLOCK) {
      notFull_.wait(lock,
                    [this] { return endQueued_ || items_.size() < capacity_; });
      if (endQueued_)
        return false;
    } else {
      // Only audio can be in the queue here, the sentinel ends pushes.
      items_.pop_front();
      if (dropped_++ % 100 == 0) {
        LOG_WARN("Bridge queue full (" << capacity_
                                       << " frames), dropping oldest audio; "
                                       << dropped_ << " dropped so far");
      }
    }
  }

  items_.push_back(BridgeItem::audio(std::move(payload)));
  lock.unlock();
  notEmpty_.notify_one();
  return true;
}

bool BridgeQueue::pushEndOfInput() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (endQueued_)
      return false;
    endQueued_ = true;
    items_.push_back(BridgeItem::endOfInput());
  }
  notEmpty_.notify_all();
  notFull_.notify_all();
  return true;
}

BridgeItem BridgeQueue::pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  notEmpty_.wait(lock, [this] { return !items_.empty(); });
  BridgeItem item = takeFront();
  lock.unlock();
  notFull_.notify_one();
  return item;
}

std::optional<BridgeItem> BridgeQueue::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!notEmpty_.wait_for(lock, timeout, [this] { return !items_.empty(); }))
    return std::nullopt;
  BridgeItem item = takeFront();
  lock.unlock();
  notFull_.notify_one();
  return item;
}

BridgeItem BridgeQueue::takeFront() {
  BridgeItem item = std::move(items_.front());
  items_.pop_front();
  return item;
}

size_t BridgeQueue::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

uint64_t BridgeQueue::droppedCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

bool BridgeQueue::endOfInputQueued() {
  std::lock_guard<std::mutex> lock(mutex_);
  return endQueued_;
}
