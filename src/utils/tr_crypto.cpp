// src/utils/tr_crypto.cpp
// Module implementation.
#include "utils/tr_crypto.h"

#include <mbedtls/base64.h>
#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/md.h>

#include <mutex>
#include <stdio.h>
#include <time.h>

#include "utils/logging.h"

bool trHmacSha256(const std::vector<uint8_t>& key, const std::string& data,
                  std::vector<uint8_t>* out) {
  if (!out) return false;
  const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
  if (!info) return false;
  out->assign(32, 0);
  int rc = mbedtls_md_hmac(info,
                           key.data(), key.size(),
                           reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                           out->data());
  if (rc != 0) {
    TR_LOGE("CRYPTO", "hmac failed rc=%d", rc);
    out->clear();
    return false;
  }
  return true;
}

std::string trBase64Encode(const uint8_t* data, size_t len) {
  size_t need = 0;
  // first call reports the required size (BUFFER_TOO_SMALL)
  (void)mbedtls_base64_encode(nullptr, 0, &need, data, len);
  if (need == 0) return "";
  std::string out(need, '\0');
  size_t olen = 0;
  if (mbedtls_base64_encode(reinterpret_cast<unsigned char*>(&out[0]), out.size(), &olen,
                            data, len) != 0) {
    return "";
  }
  out.resize(olen);
  return out;
}

bool trBase64Decode(const std::string& in, std::vector<uint8_t>* out) {
  if (!out) return false;
  out->clear();
  if (in.empty()) return true;
  const unsigned char* src = reinterpret_cast<const unsigned char*>(in.data());
  size_t need = 0;
  int rc = mbedtls_base64_decode(nullptr, 0, &need, src, in.size());
  if (rc == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) return false;
  if (need == 0) return true;
  out->assign(need, 0);
  size_t olen = 0;
  rc = mbedtls_base64_decode(out->data(), out->size(), &olen, src, in.size());
  if (rc != 0) {
    out->clear();
    return false;
  }
  out->resize(olen);
  return true;
}

bool trBase64UrlDecode(const std::string& in, std::vector<uint8_t>* out) {
  std::string s;
  s.reserve(in.size() + 3);
  for (char c : in) {
    if (c == '-') s += '+';
    else if (c == '_') s += '/';
    else if (c == '=') continue; // re-padded below
    else s += c;
  }
  if (s.size() % 4 == 1) return false;
  while (s.size() % 4 != 0) s += '=';
  return trBase64Decode(s, out);
}

// ---- random ----
namespace {
struct DrbgState {
  std::mutex mu;
  bool seeded = false;
  bool failed = false;
  mbedtls_entropy_context entropy;
  mbedtls_ctr_drbg_context ctr;
};

DrbgState& drbg_() {
  static DrbgState s;
  return s;
}
} // namespace

std::string trRandomHex32() {
  DrbgState& s = drbg_();
  std::lock_guard<std::mutex> lock(s.mu);
  if (!s.seeded && !s.failed) {
    mbedtls_entropy_init(&s.entropy);
    mbedtls_ctr_drbg_init(&s.ctr);
    static const char kPers[] = "tts_relay_nonce";
    int rc = mbedtls_ctr_drbg_seed(&s.ctr, mbedtls_entropy_func, &s.entropy,
                                   reinterpret_cast<const unsigned char*>(kPers),
                                   sizeof(kPers) - 1);
    if (rc != 0) {
      TR_LOGE("CRYPTO", "ctr_drbg seed failed rc=%d", rc);
      mbedtls_ctr_drbg_free(&s.ctr);
      mbedtls_entropy_free(&s.entropy);
      s.failed = true;
    } else {
      s.seeded = true;
    }
  }
  if (!s.seeded) return "";

  unsigned char raw[16];
  if (mbedtls_ctr_drbg_random(&s.ctr, raw, sizeof(raw)) != 0) return "";

  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(32);
  for (unsigned char b : raw) {
    out += kHex[b >> 4];
    out += kHex[b & 0x0F];
  }
  return out;
}

// ---- text encodings ----
std::string trUrlEncodeComponent(const std::string& s) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    const bool unreserved =
        (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '!' || c == '~' ||
        c == '*' || c == '\'' || c == '(' || c == ')';
    if (unreserved) {
      out += (char)c;
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string trHttpDate(int64_t unixSeconds) {
  static const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  time_t t = (time_t)unixSeconds;
  struct tm g;
  if (!gmtime_r(&t, &g)) return "";
  char buf[40];
  snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
           kDays[g.tm_wday % 7], g.tm_mday, kMonths[g.tm_mon % 12], g.tm_year + 1900,
           g.tm_hour, g.tm_min, g.tm_sec);
  return buf;
}

std::string trToLowerAscii(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
  }
  return out;
}
