// src/tts/edge_auth.h
// Module implementation.
#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdint.h>
#include <string>

#include "net/http_transport.h"

// Provider credential: regional endpoint identity + bearer token (+ expiry, unix seconds).
struct EdgeCredential {
  std::string region;
  std::string token; // ★秘密：ログに出さない
  int64_t expiresAt = 0;
};

// Process-wide credential cache for the Edge/Translator TTS endpoint.
//
// - acquire() returns the cached credential while now < expiresAt - skew
// - otherwise one caller runs the signed handshake; concurrent callers wait for it
//   and share its outcome
// - handshake failure keeps serving the previous (stale) credential if there is one;
//   with nothing cached the caller gets false and the slot stays empty
//
// One instance is shared by reference by every request handler.
class EdgeAuth {
public:
  using Clock = std::function<int64_t()>;       // unix seconds
  using NonceFn = std::function<std::string()>; // 32 hex digits

  enum class State : uint8_t { Absent, Valid, Stale };

  static constexpr const char* kEndpointUrl =
      "https://dev.microsofttranslator.com/apps/endpoint?api-version=1.0";

  // clock / nonce default to the system clock and trRandomHex32().
  explicit EdgeAuth(HttpTransport& http, Clock clock = Clock(), NonceFn nonce = NonceFn());

  EdgeAuth(const EdgeAuth&) = delete;
  EdgeAuth& operator=(const EdgeAuth&) = delete;

  bool acquire(EdgeCredential* out, std::string* err);

  State state() const;
  uint32_t handshakeCount() const;

  void setRefreshSkewSec(int64_t sec);

  // "MSTranslatorAndroidApp::<b64 hmac>::<date>::<nonce>"; empty if HMAC failed.
  static std::string buildSignature(const std::string& url, const std::string& date,
                                    const std::string& nonce);

  // {"r": region, "t": token} + exp claim of the token.
  static bool parseEndpointResponse(const std::string& body, EdgeCredential* out,
                                    std::string* err);

  // exp claim from the JWT payload segment.
  static bool decodeJwtExp(const std::string& token, int64_t* outExp);

private:
  bool handshake_(EdgeCredential* out, std::string* err);
  bool freshLocked_(int64_t now) const;

  HttpTransport& http_;
  Clock clock_;
  NonceFn nonce_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  EdgeCredential cred_;
  bool has_ = false;
  bool refreshing_ = false;
  uint64_t gen_ = 0;
  std::string lastErr_;
  uint32_t handshakes_ = 0;
  int64_t skewSec_;
};
