#pragma once

#include <cstdint>
#include <functional>
#include <string>

enum class CloseCode : uint16_t {
  NORMAL = 1000,
  GOING_AWAY = 1001,
  POLICY_VIOLATION = 1008,
  INTERNAL_ERROR = 1011,
  TRY_AGAIN_LATER = 1013
};

// Outbound half of a client connection as seen by the relay. All methods are
// callable from any thread; text frames go out in call order and a close is
// sent after every frame queued before it.
class ClientChannel {
public:
  virtual ~ClientChannel() = default;

  virtual void sendText(const std::string &text) = 0;
  virtual void close(CloseCode code, const std::string &reason) = 0;

  // Runs task on the connection's serialized context, after any inbound
  // message currently being handled.
  virtual void post(std::function<void()> task) = 0;

  virtual bool isOpen() const = 0;
  virtual std::string remoteAddress() const = 0;
};
