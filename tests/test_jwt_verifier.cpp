/**
 * test_jwt_verifier.cpp - HS256 token issue and verification
 */

#include "app/Logger.h"
#include "gateway/JwtTokenVerifier.h"
#include "relay/RelayErrors.h"
#include <cassert>
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

using json = nlohmann::json;

static const std::string kSecret = "unit-test-secret";

static bool rejected(JwtTokenVerifier &verifier, const std::string &token) {
  try {
    verifier.verify(token);
  } catch (const AuthenticationError &) {
    return true;
  }
  return false;
}

// Header and payload segments of a token, without a signature.
static std::string unsignedParts(const json &header, const json &payload) {
  return JwtTokenVerifier::base64UrlEncode(header.dump()) + "." +
         JwtTokenVerifier::base64UrlEncode(payload.dump());
}

// A correctly signed token carrying arbitrary claims.
static std::string signedToken(const json &payload) {
  std::string input = unsignedParts({{"alg", "HS256"}, {"typ", "JWT"}}, payload);
  unsigned int len = 0;
  unsigned char mac[EVP_MAX_MD_SIZE];
  HMAC(EVP_sha256(), kSecret.data(), static_cast<int>(kSecret.size()),
       reinterpret_cast<const unsigned char *>(input.data()), input.size(), mac,
       &len);
  return input + "." +
         JwtTokenVerifier::base64UrlEncode(
             std::string(reinterpret_cast<char *>(mac), len));
}

void test_issue_and_verify() {
  JwtTokenVerifier verifier(kSecret);
  std::string token = verifier.issue("dr-mehta", 300);
  Principal principal = verifier.verify(token);
  assert(principal.userId == "dr-mehta");

  std::cout << "[PASS] test_issue_and_verify" << std::endl;
}

void test_wrong_secret_rejected() {
  JwtTokenVerifier issuer("another-secret");
  JwtTokenVerifier verifier(kSecret);
  assert(rejected(verifier, issuer.issue("dr-mehta", 300)));

  std::cout << "[PASS] test_wrong_secret_rejected" << std::endl;
}

void test_expired_rejected() {
  JwtTokenVerifier verifier(kSecret);
  assert(rejected(verifier, verifier.issue("dr-mehta", -10)));

  std::cout << "[PASS] test_expired_rejected" << std::endl;
}

void test_expiry_must_be_integer() {
  JwtTokenVerifier verifier(kSecret);
  int64_t now = static_cast<int64_t>(std::time(nullptr));

  assert(verifier.verify(signedToken({{"sub", "dr-mehta"}, {"exp", now + 300}}))
             .userId == "dr-mehta");
  assert(rejected(verifier, signedToken({{"sub", "dr-mehta"}, {"exp", 1e300}})));
  assert(rejected(verifier,
                  signedToken({{"sub", "dr-mehta"}, {"exp", double(now + 300)}})));
  assert(rejected(verifier, signedToken({{"sub", "dr-mehta"}, {"exp", "never"}})));
  assert(rejected(verifier, signedToken({{"sub", "dr-mehta"}})));
  // Far-future unsigned expiry stays valid.
  assert(verifier
             .verify(signedToken({{"sub", "dr-mehta"},
                                  {"exp", uint64_t(18000000000000000000ULL)}}))
             .userId == "dr-mehta");

  std::cout << "[PASS] test_expiry_must_be_integer" << std::endl;
}

void test_tampered_payload_rejected() {
  JwtTokenVerifier verifier(kSecret);
  std::string token = verifier.issue("dr-mehta", 300);
  auto dot1 = token.find('.');
  auto dot2 = token.find('.', dot1 + 1);

  int64_t now = static_cast<int64_t>(std::time(nullptr));
  json forged = {{"sub", "dr-rao"}, {"exp", now + 300}};
  std::string tampered = token.substr(0, dot1 + 1) +
                         JwtTokenVerifier::base64UrlEncode(forged.dump()) +
                         token.substr(dot2);
  assert(rejected(verifier, tampered));

  std::cout << "[PASS] test_tampered_payload_rejected" << std::endl;
}

void test_malformed_rejected() {
  JwtTokenVerifier verifier(kSecret);
  assert(rejected(verifier, ""));
  assert(rejected(verifier, "abc"));
  assert(rejected(verifier, "a.b"));
  assert(rejected(verifier, "a.b.c.d"));
  assert(rejected(verifier, "###.###.###"));

  int64_t now = static_cast<int64_t>(std::time(nullptr));
  // Unsigned token claiming alg "none".
  std::string unsigned_ =
      unsignedParts({{"alg", "none"}, {"typ", "JWT"}},
                    {{"sub", "dr-mehta"}, {"exp", now + 300}}) +
      ".";
  assert(rejected(verifier, unsigned_));

  std::cout << "[PASS] test_malformed_rejected" << std::endl;
}

void test_base64url() {
  assert(JwtTokenVerifier::base64UrlEncode("") == "");
  assert(JwtTokenVerifier::base64UrlEncode("f") == "Zg");
  assert(JwtTokenVerifier::base64UrlEncode("fo") == "Zm8");
  assert(JwtTokenVerifier::base64UrlEncode("foo") == "Zm9v");
  assert(JwtTokenVerifier::base64UrlEncode("\xfb\xff") == "-_8");

  std::string out;
  assert(JwtTokenVerifier::base64UrlDecode("Zm8", out) && out == "fo");
  assert(JwtTokenVerifier::base64UrlDecode("-_8", out) && out == "\xfb\xff");
  assert(!JwtTokenVerifier::base64UrlDecode("Zm8=", out));
  assert(!JwtTokenVerifier::base64UrlDecode("Z", out));

  std::cout << "[PASS] test_base64url" << std::endl;
}

int main() {
  std::cout << "=== JwtTokenVerifier Tests ===" << std::endl;
  Logger::instance().setLevel(LogLevel::ERROR);

  test_issue_and_verify();
  test_wrong_secret_rejected();
  test_expired_rejected();
  test_expiry_must_be_integer();
  test_tampered_payload_rejected();
  test_malformed_rejected();
  test_base64url();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}
