// src/utils/tr_text_utils.cpp
#include "utils/tr_text_utils.h"

size_t trUtf8SeqLen(uint8_t c) {
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return 2;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return 4;
  return 1; // invalid lead -> treat as 1
}

uint32_t trUtf8Decode(const std::string& s, size_t pos, size_t* outLen) {
  const size_t n = s.size();
  if (pos >= n) {
    if (outLen) *outLen = 0;
    return 0;
  }
  const uint8_t c = (uint8_t)s[pos];
  const size_t L = trUtf8SeqLen(c);
  if (L == 1) {
    if (outLen) *outLen = 1;
    return (c < 0x80) ? c : 0xFFFD;
  }
  if (pos + L > n) {
    if (outLen) *outLen = 1;
    return 0xFFFD;
  }
  uint32_t cp = c & (0x7F >> L);
  for (size_t k = 1; k < L; k++) {
    const uint8_t cc = (uint8_t)s[pos + k];
    if ((cc & 0xC0) != 0x80) {
      if (outLen) *outLen = 1;
      return 0xFFFD;
    }
    cp = (cp << 6) | (cc & 0x3F);
  }
  if (outLen) *outLen = L;
  return cp;
}

size_t trUtf8Length(const std::string& s) {
  size_t count = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t L = 0;
    (void)trUtf8Decode(s, i, &L);
    i += L;
    count++;
  }
  return count;
}

size_t trUtf8Offset(const std::string& s, size_t cpIndex) {
  size_t i = 0;
  size_t cp = 0;
  while (i < s.size() && cp < cpIndex) {
    size_t L = 0;
    (void)trUtf8Decode(s, i, &L);
    i += L;
    cp++;
  }
  return i;
}

std::string trUtf8ClampBytes(const std::string& s, size_t max_bytes) {
  const size_t n = s.size(); // bytes
  if (n <= max_bytes) return s;
  if (max_bytes == 0) return "";

  size_t i = 0;
  while (i < n && i < max_bytes) {
    const uint8_t c = (uint8_t)s[i];
    const size_t L = trUtf8SeqLen(c);
    if (i + L > max_bytes) break;

    bool ok = true;
    for (size_t k = 1; k < L; k++) {
      if (i + k >= n) { ok = false; break; }
      const uint8_t cc = (uint8_t)s[i + k];
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
    }
    if (!ok) break;

    i += L;
  }
  return s.substr(0, i);
}

bool trIsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

bool trIsUnicodeSpace(uint32_t cp) {
  if (cp < 0x80) return trIsSpace((char)cp);
  switch (cp) {
    case 0x00A0: case 0x1680: case 0x2028: case 0x2029:
    case 0x202F: case 0x205F: case 0x3000: case 0xFEFF:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

size_t trUnicodeSpaceLen(const std::string& s, size_t pos) {
  if (pos >= s.size()) return 0;
  const uint8_t c = (uint8_t)s[pos];
  if (c < 0x80) return trIsSpace((char)c) ? 1 : 0;
  size_t L = 0;
  const uint32_t cp = trUtf8Decode(s, pos, &L);
  return trIsUnicodeSpace(cp) ? L : 0;
}

std::string trTrim(const std::string& s) {
  size_t b = 0;
  size_t L = 0;
  while ((L = trUnicodeSpaceLen(s, b)) > 0) b += L;
  // forward scan; e = end of the last non-space code point
  size_t e = b;
  size_t i = b;
  while (i < s.size()) {
    L = trUnicodeSpaceLen(s, i);
    if (L > 0) {
      i += L;
      continue;
    }
    (void)trUtf8Decode(s, i, &L);
    i += L;
    e = i;
  }
  return s.substr(b, e - b);
}

std::string trSanitizeOneLine(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\r' || c == '\n' || c == '\t') c = ' ';
    if (c == ' ' && !out.empty() && out.back() == ' ') continue;
    out += c;
  }
  return trTrim(out);
}

std::string trLogHead(const std::string& s, size_t max_bytes) {
  return trUtf8ClampBytes(trSanitizeOneLine(s), max_bytes);
}
