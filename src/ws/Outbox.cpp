#include "Outbox.h"

bool Outbox::push(std::string frame) {
  frames_.push_back(std::move(frame));
  if (writing_)
    return false;
  writing_ = true;
  return true;
}

bool Outbox::writeDone() {
  if (!frames_.empty())
    frames_.pop_front();
  writing_ = !frames_.empty();
  return writing_;
}

void Outbox::dropPending() {
  if (frames_.empty())
    return;
  if (writing_)
    frames_.erase(frames_.begin() + 1, frames_.end());
  else
    frames_.clear();
}
