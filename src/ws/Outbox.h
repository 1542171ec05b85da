#pragma once

#include <cstddef>
#include <deque>
#include <string>

// Outbound text frames of one connection. At most one frame is in flight, and
// it stays at the front until its write completes. Not thread-safe; used on
// the connection's strand.
class Outbox {
public:
  // Returns true when the caller must start writing front().
  bool push(std::string frame);
  const std::string &front() const { return frames_.front(); }

  // Completion of the in-flight write. Returns true when the next frame must
  // be written.
  bool writeDone();

  // Drops queued frames; the one in flight is kept until writeDone().
  void dropPending();

  bool writing() const { return writing_; }
  bool empty() const { return frames_.empty(); }
  size_t size() const { return frames_.size(); }

private:
  std::deque<std::string> frames_;
  bool writing_ = false;
};
