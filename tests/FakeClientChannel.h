#pragma once

/**
 * FakeClientChannel.h - Client connection stand-in with its own serial
 * executor thread
 */

#include "ws/ClientChannel.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class FakeClientChannel : public ClientChannel {
public:
  FakeClientChannel() : worker_(&FakeClientChannel::loop, this) {}

  ~FakeClientChannel() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
      worker_.join();
  }

  void sendText(const std::string &text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return;
    sent_.push_back(text);
  }

  void close(CloseCode code, const std::string &) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++closeCalls_;
      if (closed_)
        return;
      closed_ = true;
      closeCode_ = code;
    }
    cv_.notify_all();
  }

  void post(std::function<void()> task) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      tasks_.push_back(std::move(task));
    }
    cv_.notify_all();
  }

  bool isOpen() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
  }

  std::string remoteAddress() const override { return "127.0.0.1:0"; }

  // Runs fn on the executor and waits for it.
  void runSync(std::function<void()> fn) {
    auto done = std::make_shared<std::promise<void>>();
    auto result = done->get_future();
    post([fn, done]() {
      fn();
      done->set_value();
    });
    result.wait();
  }

  bool waitClosed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return closed_; });
  }

  std::vector<nlohmann::json> messages() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    for (const auto &text : sent_)
      out.push_back(nlohmann::json::parse(text));
    return out;
  }

  size_t count(const std::string &type) {
    size_t n = 0;
    for (const auto &msg : messages()) {
      if (msg["type"] == type)
        ++n;
    }
    return n;
  }

  std::optional<CloseCode> closeCode() {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeCode_;
  }

  int closeCalls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeCalls_;
  }

private:
  void loop() {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty())
          return;
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      task();
    }
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  bool stopping_ = false;
  std::vector<std::string> sent_;
  bool closed_ = false;
  int closeCalls_ = 0;
  std::optional<CloseCode> closeCode_;
  std::thread worker_;
};
