#pragma once

#include <stdexcept>
#include <string>

class RelayError : public std::runtime_error {
public:
  explicit RelayError(const std::string &what) : std::runtime_error(what) {}
};

// Token missing, malformed, badly signed or expired.
class AuthenticationError : public RelayError {
public:
  explicit AuthenticationError(const std::string &what) : RelayError(what) {}
};

// Session missing, not owned by the principal, or not ACTIVE/PAUSED.
class NotFoundError : public RelayError {
public:
  explicit NotFoundError(const std::string &what) : RelayError(what) {}
};

enum class UpstreamErrorKind {
  QUOTA_EXHAUSTED,
  INVALID_ARGUMENT,
  UNAVAILABLE,
  DEADLINE_EXCEEDED,
  PERMISSION_DENIED,
  CANCELLED,
  INTERNAL
};

class UpstreamError : public RelayError {
public:
  UpstreamError(UpstreamErrorKind kind, const std::string &what)
      : RelayError(what), kind_(kind) {}

  UpstreamErrorKind kind() const { return kind_; }

private:
  UpstreamErrorKind kind_;
};

// The client went away; never reported back to the client.
class TransportError : public RelayError {
public:
  explicit TransportError(const std::string &what) : RelayError(what) {}
};

class MalformedControlMessage : public RelayError {
public:
  explicit MalformedControlMessage(const std::string &what)
      : RelayError(what) {}
};

const char *upstreamErrorKindName(UpstreamErrorKind kind);
