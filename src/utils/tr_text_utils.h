// src/utils/tr_text_utils.h
// Module implementation.
#pragma once
// tr_text_utils: small, side-effect-free std::string helpers
// - UTF-8 safe byte clamping (do not cut in the middle of a multi-byte sequence)
// - code point decode / count / slicing (chunk lengths are counted in code points)
// - One-line sanitization for logs
#include <stddef.h>
#include <stdint.h>
#include <string>

// Length of the UTF-8 sequence introduced by lead byte c (invalid lead -> 1).
size_t trUtf8SeqLen(uint8_t c);

// Decode the code point starting at s[pos]; *outLen receives the byte length consumed.
// Malformed sequences decode as U+FFFD with length 1.
uint32_t trUtf8Decode(const std::string& s, size_t pos, size_t* outLen);

// Number of code points in s.
size_t trUtf8Length(const std::string& s);

// Byte offset of the cpIndex-th code point (s.size() if past the end).
size_t trUtf8Offset(const std::string& s, size_t cpIndex);

// Clamp to max_bytes without breaking UTF-8 sequences.
// If s is already <= max_bytes, returns s as-is.
std::string trUtf8ClampBytes(const std::string& s, size_t max_bytes);

// ASCII whitespace (space, \t, \n, \v, \f, \r).
bool trIsSpace(char c);

// White_Space code points (ECMAScript \s): ASCII \t..\r and space, NBSP, U+1680,
// U+2000..U+200A, U+2028/2029, U+202F, U+205F, U+3000, U+FEFF.
bool trIsUnicodeSpace(uint32_t cp);

// Byte length of the whitespace code point at s[pos] (0 if none).
size_t trUnicodeSpaceLen(const std::string& s, size_t pos);

// Trim whitespace (trIsUnicodeSpace) on both ends.
std::string trTrim(const std::string& s);

// Sanitize for logs: make it one-line without destroying UTF-8.
// - \r, \n, \t => space
// - trim
// - collapse 2+ spaces => 1 space
std::string trSanitizeOneLine(const std::string& s);

// Convenience for logs: trUtf8ClampBytes(trSanitizeOneLine(s), max_bytes)
std::string trLogHead(const std::string& s, size_t max_bytes);
