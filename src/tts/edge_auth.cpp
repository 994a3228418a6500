// src/tts/edge_auth.cpp
// Module implementation.
#include "tts/edge_auth.h"

#include <ArduinoJson.h>
#include <chrono>
#include <vector>

#include "config/config.h"
#include "config/tr_config_store.h"
#include "utils/logging.h"
#include "utils/tr_crypto.h"
#include "utils/tr_text_utils.h"

namespace {

// Fixed client identity of the Translator Android app.
static const char* kAppName = "MSTranslatorAndroidApp";
static const char* kSharedKeyB64 =
    "oik6PdDdMnOXemTbwvMn9de/h9lFnfBaCWbGMMZqqoSaQaqUOqjVGm5NqsmjcBI1x+sS9ugjB55HEJWRiFXYFw==";

static int64_t systemNowSec_() {
  using namespace std::chrono;
  return (int64_t)duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// "https://host/path?q" -> "host/path?q"
static std::string stripScheme_(const std::string& url) {
  const size_t p = url.find("://");
  return (p == std::string::npos) ? url : url.substr(p + 3);
}

} // namespace

EdgeAuth::EdgeAuth(HttpTransport& http, Clock clock, NonceFn nonce)
    : http_(http),
      clock_(clock ? clock : Clock(&systemNowSec_)),
      nonce_(nonce ? nonce : NonceFn(&trRandomHex32)),
      skewSec_(TR_TOKEN_REFRESH_SKEW_SEC) {}

void EdgeAuth::setRefreshSkewSec(int64_t sec) {
  std::lock_guard<std::mutex> lk(mu_);
  skewSec_ = sec;
}

bool EdgeAuth::freshLocked_(int64_t now) const {
  return has_ && now < cred_.expiresAt - skewSec_;
}

EdgeAuth::State EdgeAuth::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!has_) return State::Absent;
  return freshLocked_(clock_()) ? State::Valid : State::Stale;
}

uint32_t EdgeAuth::handshakeCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return handshakes_;
}

bool EdgeAuth::acquire(EdgeCredential* out, std::string* err) {
  if (!out) return false;

  std::unique_lock<std::mutex> lk(mu_);
  if (freshLocked_(clock_())) {
    *out = cred_;
    return true;
  }

  if (refreshing_) {
    // someone else is already talking to the handshake endpoint: share its result
    const uint64_t gen = gen_;
    cv_.wait(lk, [&]() { return gen_ != gen; });
    if (has_) {
      *out = cred_;
      return true;
    }
    if (err) *err = lastErr_;
    return false;
  }

  refreshing_ = true;
  handshakes_++;
  lk.unlock();

  EdgeCredential fresh;
  std::string herr;
  const bool ok = handshake_(&fresh, &herr);

  lk.lock();
  refreshing_ = false;
  gen_++;
  if (ok) {
    cred_ = fresh;
    has_ = true;
    lastErr_.clear();
  } else {
    lastErr_ = herr;
  }
  cv_.notify_all();

  if (ok) {
    TR_EVT("AUTH", "refresh ok region=%s exp_in=%llds",
           cred_.region.c_str(), (long long)(cred_.expiresAt - clock_()));
    *out = cred_;
    return true;
  }
  if (has_) {
    // 古いトークンでも無いよりまし（次のアクセスで再取得を試みる）
    TR_LOGW("AUTH", "refresh failed (%s) -> serving stale credential", herr.c_str());
    *out = cred_;
    return true;
  }
  TR_LOGE("AUTH", "refresh failed (%s), no credential cached", herr.c_str());
  if (err) *err = herr;
  return false;
}

std::string EdgeAuth::buildSignature(const std::string& url, const std::string& date,
                                     const std::string& nonce) {
  std::vector<uint8_t> key;
  if (!trBase64Decode(kSharedKeyB64, &key)) return "";

  const std::string toSign =
      trToLowerAscii(std::string(kAppName) + trUrlEncodeComponent(stripScheme_(url)) + date + nonce);

  std::vector<uint8_t> mac;
  if (!trHmacSha256(key, toSign, &mac)) return "";

  std::string sig = kAppName;
  sig += "::";
  sig += trBase64Encode(mac);
  sig += "::";
  sig += date;
  sig += "::";
  sig += nonce;
  return sig;
}

bool EdgeAuth::decodeJwtExp(const std::string& token, int64_t* outExp) {
  if (!outExp) return false;
  const size_t a = token.find('.');
  if (a == std::string::npos) return false;
  const size_t b = token.find('.', a + 1);
  const std::string payload = token.substr(a + 1, (b == std::string::npos) ? std::string::npos : b - a - 1);

  std::vector<uint8_t> raw;
  if (payload.empty() || !trBase64UrlDecode(payload, &raw)) return false;

  DynamicJsonDocument doc(1024 + raw.size() * 2);
  DeserializationError e = deserializeJson(doc, reinterpret_cast<const char*>(raw.data()), raw.size());
  if (e) return false;

  JsonVariantConst exp = doc["exp"];
  if (!exp.is<double>()) return false;
  *outExp = (int64_t)exp.as<double>();
  return true;
}

bool EdgeAuth::parseEndpointResponse(const std::string& body, EdgeCredential* out,
                                     std::string* err) {
  if (!out) return false;
  DynamicJsonDocument doc(2048 + body.size() * 2);
  DeserializationError e = deserializeJson(doc, body);
  if (e) {
    if (err) *err = std::string("json:") + e.c_str();
    return false;
  }
  JsonVariantConst r = doc["r"];
  JsonVariantConst t = doc["t"];
  if (!r.is<const char*>() || !t.is<const char*>()) {
    if (err) *err = "missing_r_t";
    return false;
  }

  EdgeCredential c;
  c.region = r.as<const char*>();
  c.token = t.as<const char*>();
  if (c.region.empty() || c.token.empty()) {
    if (err) *err = "empty_r_t";
    return false;
  }
  if (!decodeJwtExp(c.token, &c.expiresAt)) {
    if (err) *err = "jwt_exp";
    return false;
  }
  *out = c;
  return true;
}

bool EdgeAuth::handshake_(EdgeCredential* out, std::string* err) {
  const std::string date = trHttpDate(clock_());
  const std::string sigNonce = nonce_();
  const std::string traceId = nonce_();
  if (sigNonce.empty() || traceId.empty()) {
    *err = "nonce";
    return false;
  }

  const std::string signature = buildSignature(kEndpointUrl, date, sigNonce);
  if (signature.empty()) {
    *err = "signature";
    return false;
  }

  HttpRequest req;
  req.url = kEndpointUrl;
  req.timeoutMs = trCfgTokenTimeoutMs();
  req.acceptGzip = true;
  req.headers = {
      {"Accept-Language", "zh-Hans"},
      {"X-ClientVersion", "4.0.530a 5fe1dc6c"},
      {"X-UserId", "0f04d16a175c411e"},
      {"X-HomeGeographicRegion", "zh-Hans-CN"},
      {"X-ClientTraceId", traceId},
      {"X-MT-Signature", signature},
      {"User-Agent", trCfgUserAgent()},
      {"Content-Type", "application/json; charset=utf-8"},
  };

  const uint32_t t0 = trMillis();
  HttpResponse res = http_.post(req);
  if (res.status == 0) {
    *err = "transport:" + res.err;
    return false;
  }
  if (res.status < 200 || res.status >= 300) {
    // 本文はトークン系の可能性があるので先頭だけ
    TR_LOGD("AUTH", "handshake HTTP %d head=%s", res.status,
            trLogHead(res.body, TR_LOG_HEAD_BYTES_TOKEN_ERR).c_str());
    *err = "http_" + std::to_string(res.status);
    return false;
  }
  if (!parseEndpointResponse(res.body, out, err)) return false;

  TR_LOGD("AUTH", "handshake ok took=%ums", (unsigned)(trMillis() - t0));
  return true;
}
