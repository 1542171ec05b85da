#pragma once

#include <string>

struct Principal {
  std::string userId;
};

class TokenVerifier {
public:
  virtual ~TokenVerifier() = default;

  // Throws AuthenticationError.
  virtual Principal verify(const std::string &token) = 0;
};
