// src/utils/tr_crypto.h
// Module implementation.
#pragma once
// tr_crypto: mbedTLS-backed helpers for the credential handshake.
#include <stdint.h>
#include <string>
#include <vector>

// HMAC-SHA256(key, data). Returns false if mbedTLS rejects the call.
bool trHmacSha256(const std::vector<uint8_t>& key, const std::string& data,
                  std::vector<uint8_t>* out);

std::string trBase64Encode(const uint8_t* data, size_t len);
inline std::string trBase64Encode(const std::vector<uint8_t>& data) {
  return trBase64Encode(data.data(), data.size());
}
inline std::string trBase64Encode(const std::string& data) {
  return trBase64Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

// Standard alphabet, padding required. false on malformed input.
bool trBase64Decode(const std::string& in, std::vector<uint8_t>* out);

// URL-safe alphabet ('-', '_'), padding optional (JWT segments).
bool trBase64UrlDecode(const std::string& in, std::vector<uint8_t>* out);

// 32 lowercase hex digits from the CTR-DRBG (UUID without dashes).
// Empty string if the generator could not be seeded.
std::string trRandomHex32();

// Same escaping rules as JavaScript encodeURIComponent (uppercase hex).
std::string trUrlEncodeComponent(const std::string& s);

// RFC 1123 date in GMT: "Mon, 19 Oct 2026 08:15:00 GMT".
std::string trHttpDate(int64_t unixSeconds);

std::string trToLowerAscii(const std::string& s);
