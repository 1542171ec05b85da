#pragma once

#include "../app/Config.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

// One element of the bridge: either an audio payload or the end-of-input
// sentinel.
class BridgeItem {
public:
  static BridgeItem audio(std::string payload) {
    return BridgeItem(false, std::move(payload));
  }
  static BridgeItem endOfInput() { return BridgeItem(true, std::string()); }

  bool isEndOfInput() const { return endOfInput_; }
  const std::string &payload() const { return payload_; }
  std::string takePayload() { return std::move(payload_); }

private:
  BridgeItem(bool endOfInput, std::string payload)
      : endOfInput_(endOfInput), payload_(std::move(payload)) {}

  bool endOfInput_;
  std::string payload_;
};

// Single-producer/single-consumer audio FIFO between the connection side and
// the recognition request writer. Bounded; overflow handled per policy. The
// sentinel bypasses the bound and can be queued once.
class BridgeQueue {
public:
  BridgeQueue(size_t capacity, BackpressurePolicy policy);

  // False once the sentinel has been queued (payload discarded).
  bool push(std::string payload);
  // True only for the call that actually queued the sentinel.
  bool pushEndOfInput();

  // Blocks until an item is available.
  BridgeItem pop();
  // nullopt on timeout.
  std::optional<BridgeItem> pop(std::chrono::milliseconds timeout);

  size_t size();
  size_t capacity() const { return capacity_; }
  uint64_t droppedCount();
  bool endOfInputQueued();

private:
  BridgeItem takeFront();

  const size_t capacity_;
  const BackpressurePolicy policy_;

  std::mutex mutex_;
  std::condition_variable notEmpty_;
  std::condition_variable notFull_;
  std::deque<BridgeItem> items_;
  bool endQueued_ = false;
  uint64_t dropped_ = 0;
};
