#pragma once

#include "TokenVerifier.h"
#include <cstdint>
#include <string>
#include <vector>

// HS256 JSON Web Tokens signed with a shared secret. The user id is the "sub"
// claim; "exp" is mandatory.
class JwtTokenVerifier : public TokenVerifier {
public:
  explicit JwtTokenVerifier(const std::string &secret);

  Principal verify(const std::string &token) override;

  std::string issue(const std::string &userId, int64_t ttlSeconds) const;

  static std::string base64UrlEncode(const std::string &data);
  // Returns false on characters outside the base64url alphabet.
  static bool base64UrlDecode(const std::string &input, std::string &out);

private:
  std::string sign(const std::string &signingInput) const;

  std::string secret_;
};
