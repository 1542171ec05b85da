#include "JwtTokenVerifier.h"
#include "../relay/RelayErrors.h"
#include <ctime>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

using json = nlohmann::json;

JwtTokenVerifier::JwtTokenVerifier(const std::string &secret)
    : secret_(secret) {}

std::string JwtTokenVerifier::base64UrlEncode(const std::string &data) {
  std::vector<unsigned char> buf(4 * ((data.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(buf.data(),
                            reinterpret_cast<const unsigned char *>(data.data()),
                            static_cast<int>(data.size()));
  std::string out(reinterpret_cast<char *>(buf.data()), len);
  for (auto &c : out) {
    if (c == '+')
      c = '-';
    else if (c == '/')
      c = '_';
  }
  while (!out.empty() && out.back() == '=')
    out.pop_back();
  return out;
}

bool JwtTokenVerifier::base64UrlDecode(const std::string &input,
                                       std::string &out) {
  std::string b64 = input;
  for (auto &c : b64) {
    if (c == '-')
      c = '+';
    else if (c == '_')
      c = '/';
    else if (c == '+' || c == '/' || c == '=')
      return false;
  }
  size_t padding = (4 - b64.size() % 4) % 4;
  if (padding == 3)
    return false;
  b64.append(padding, '=');

  std::vector<unsigned char> buf(b64.size() / 4 * 3 + 1);
  int len = EVP_DecodeBlock(buf.data(),
                            reinterpret_cast<const unsigned char *>(b64.data()),
                            static_cast<int>(b64.size()));
  if (len < 0)
    return false;
  // EVP_DecodeBlock keeps the bytes produced by padding.
  out.assign(reinterpret_cast<char *>(buf.data()), len - padding);
  return true;
}

std::string JwtTokenVerifier::sign(const std::string &signingInput) const {
  unsigned int len = 0;
  unsigned char mac[EVP_MAX_MD_SIZE];
  HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
       reinterpret_cast<const unsigned char *>(signingInput.data()),
       signingInput.size(), mac, &len);
  return std::string(reinterpret_cast<char *>(mac), len);
}

std::string JwtTokenVerifier::issue(const std::string &userId,
                                    int64_t ttlSeconds) const {
  int64_t now = static_cast<int64_t>(std::time(nullptr));
  json header = {{"alg", "HS256"}, {"typ", "JWT"}};
  json payload = {{"sub", userId}, {"iat", now}, {"exp", now + ttlSeconds}};

  std::string signingInput =
      base64UrlEncode(header.dump()) + "." + base64UrlEncode(payload.dump());
  return signingInput + "." + base64UrlEncode(sign(signingInput));
}

Principal JwtTokenVerifier::verify(const std::string &token) {
  if (token.empty())
    throw AuthenticationError("Missing token");

  auto dot1 = token.find('.');
  auto dot2 = dot1 == std::string::npos ? dot1 : token.find('.', dot1 + 1);
  if (dot2 == std::string::npos || token.find('.', dot2 + 1) != std::string::npos)
    throw AuthenticationError("Malformed token");

  std::string headerB64 = token.substr(0, dot1);
  std::string payloadB64 = token.substr(dot1 + 1, dot2 - dot1 - 1);
  std::string signingInput = token.substr(0, dot2);

  std::string signature;
  if (!base64UrlDecode(token.substr(dot2 + 1), signature))
    throw AuthenticationError("Malformed token signature");
  std::string expected = sign(signingInput);
  if (signature.size() != expected.size() ||
      CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0)
    throw AuthenticationError("Invalid token signature");

  std::string headerText, payloadText;
  if (!base64UrlDecode(headerB64, headerText) ||
      !base64UrlDecode(payloadB64, payloadText))
    throw AuthenticationError("Malformed token");

  json header = json::parse(headerText, nullptr, false);
  json payload = json::parse(payloadText, nullptr, false);
  if (!header.is_object() || !payload.is_object())
    throw AuthenticationError("Malformed token");

  if (!header.contains("alg") || !header["alg"].is_string() ||
      header["alg"].get<std::string>() != "HS256")
    throw AuthenticationError("Unsupported token algorithm");

  if (!payload.contains("exp") || !payload["exp"].is_number_integer())
    throw AuthenticationError("Token has no expiry");
  const json &exp = payload["exp"];
  int64_t now = static_cast<int64_t>(std::time(nullptr));
  bool expired = exp.is_number_unsigned()
                     ? exp.get<uint64_t>() <= static_cast<uint64_t>(now)
                     : exp.get<int64_t>() <= now;
  if (expired)
    throw AuthenticationError("Token expired");

  if (!payload.contains("sub") || !payload["sub"].is_string() ||
      payload["sub"].get<std::string>().empty())
    throw AuthenticationError("Token has no subject");

  return Principal{payload["sub"].get<std::string>()};
}
