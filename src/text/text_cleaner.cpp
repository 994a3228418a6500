// src/text/text_cleaner.cpp
// Module implementation.
#include "text/text_cleaner.h"

#include <algorithm>
#include <regex>
#include <string.h>
#include <vector>

#include "utils/logging.h"
#include "utils/tr_text_utils.h"

namespace {

struct CpRange {
  uint32_t lo;
  uint32_t hi;
};

// Unicode Emoji_Presentation=Yes (emoji-data.txt, 15.0). Sorted, non-overlapping.
static const CpRange kEmojiPresentation[] = {
  {0x231A, 0x231B}, {0x23E9, 0x23EC}, {0x23F0, 0x23F0}, {0x23F3, 0x23F3},
  {0x25FD, 0x25FE}, {0x2614, 0x2615}, {0x2648, 0x2653}, {0x267F, 0x267F},
  {0x2693, 0x2693}, {0x26A1, 0x26A1}, {0x26AA, 0x26AB}, {0x26BD, 0x26BE},
  {0x26C4, 0x26C5}, {0x26CE, 0x26CE}, {0x26D4, 0x26D4}, {0x26EA, 0x26EA},
  {0x26F2, 0x26F3}, {0x26F5, 0x26F5}, {0x26FA, 0x26FA}, {0x26FD, 0x26FD},
  {0x2705, 0x2705}, {0x270A, 0x270B}, {0x2728, 0x2728}, {0x274C, 0x274C},
  {0x274E, 0x274E}, {0x2753, 0x2755}, {0x2757, 0x2757}, {0x2795, 0x2797},
  {0x27B0, 0x27B0}, {0x27BF, 0x27BF}, {0x2B1B, 0x2B1C}, {0x2B50, 0x2B50},
  {0x2B55, 0x2B55}, {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF}, {0x1F18E, 0x1F18E},
  {0x1F191, 0x1F19A}, {0x1F1E6, 0x1F1FF}, {0x1F201, 0x1F201}, {0x1F21A, 0x1F21A},
  {0x1F22F, 0x1F22F}, {0x1F232, 0x1F236}, {0x1F238, 0x1F23A}, {0x1F250, 0x1F251},
  {0x1F300, 0x1F320}, {0x1F32D, 0x1F335}, {0x1F337, 0x1F37C}, {0x1F37E, 0x1F393},
  {0x1F3A0, 0x1F3CA}, {0x1F3CF, 0x1F3D3}, {0x1F3E0, 0x1F3F0}, {0x1F3F4, 0x1F3F4},
  {0x1F3F8, 0x1F43E}, {0x1F440, 0x1F440}, {0x1F442, 0x1F4FC}, {0x1F4FF, 0x1F53D},
  {0x1F54B, 0x1F54E}, {0x1F550, 0x1F567}, {0x1F57A, 0x1F57A}, {0x1F595, 0x1F596},
  {0x1F5A4, 0x1F5A4}, {0x1F5FB, 0x1F64F}, {0x1F680, 0x1F6C5}, {0x1F6CC, 0x1F6CC},
  {0x1F6D0, 0x1F6D2}, {0x1F6D5, 0x1F6D7}, {0x1F6DC, 0x1F6DF}, {0x1F6EB, 0x1F6EC},
  {0x1F6F4, 0x1F6FC}, {0x1F7E0, 0x1F7EB}, {0x1F7F0, 0x1F7F0}, {0x1F90C, 0x1F93A},
  {0x1F93C, 0x1F945}, {0x1F947, 0x1F9FF}, {0x1FA70, 0x1FA7C}, {0x1FA80, 0x1FA88},
  {0x1FA90, 0x1FABD}, {0x1FABF, 0x1FAC5}, {0x1FACE, 0x1FADB}, {0x1FAE0, 0x1FAE8},
  {0x1FAF0, 0x1FAF8},
};

// ---- stage 1: structure ----
// Byte length of the "http://" or "https://" scheme at s[i] (0 if none).
static size_t schemeAt_(const std::string& s, size_t i) {
  if (s.compare(i, 7, "http://") == 0) return 7;
  if (s.compare(i, 8, "https://") == 0) return 8;
  return 0;
}

// https?://\S+ -> ""
static std::string removeUrls_(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    const size_t scheme = (in[i] == 'h') ? schemeAt_(in, i) : 0;
    if (scheme > 0) {
      size_t j = i + scheme;
      while (j < in.size() && trUnicodeSpaceLen(in, j) == 0) {
        size_t L = 0;
        (void)trUtf8Decode(in, j, &L);
        j += L;
      }
      if (j > i + scheme) {
        i = j;
        continue;
      }
    }
    out += in[i++];
  }
  return out;
}

// Lazy "[^\n]*?" scans: first occurrence of `needle` at or after `from`, same line only.
static size_t findOnLine_(const std::string& s, size_t from, const char* needle) {
  const size_t n = strlen(needle);
  for (size_t j = from; j + n <= s.size(); j++) {
    if (s[j] == '\n' || s[j] == '\r') return std::string::npos;
    if (s.compare(j, n, needle) == 0) return j;
  }
  return std::string::npos;
}

// ![alt](url) -> ""    [label](url) -> "label"
static std::string stripLinks_(const std::string& in, bool image) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    const size_t open = image ? i + 1 : i;
    const bool lead = image ? (in[i] == '!' && open < in.size() && in[open] == '[')
                            : (in[i] == '[');
    if (lead) {
      const size_t close = findOnLine_(in, open + 1, "](");
      const size_t paren = (close == std::string::npos) ? std::string::npos
                                                        : findOnLine_(in, close + 2, ")");
      if (paren != std::string::npos) {
        if (!image) out.append(in, open + 1, close - open - 1);
        i = paren + 1;
        continue;
      }
    }
    out += in[i++];
  }
  return out;
}

// (**|__)x\1 -> x, then (*|_)x\1 -> x
static std::string stripEmphasis_(const std::string& in, size_t width) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    const char c = in[i];
    if ((c == '*' || c == '_') && i + width <= in.size() &&
        (width == 1 || in[i + 1] == c)) {
      const char delim[3] = {c, width == 2 ? c : '\0', '\0'};
      const size_t end = findOnLine_(in, i + width, delim);
      if (end != std::string::npos) {
        out.append(in, i + width, end - i - width);
        i = end + width;
        continue;
      }
    }
    out += in[i++];
  }
  return out;
}

// `{1,3}x`{1,3} -> x (greedy opener, lazy body, greedy closer)
static std::string stripCode_(const std::string& in) {
  auto runAt = [&](size_t j) {
    size_t r = 0;
    while (j + r < in.size() && in[j + r] == '`' && r < 3) r++;
    return r;
  };
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    if (in[i] == '`') {
      bool matched = false;
      for (size_t n = runAt(i); n >= 1 && !matched; n--) {
        const size_t j = findOnLine_(in, i + n, "`");
        if (j == std::string::npos) continue;
        out.append(in, i + n, j - i - n);
        i = j + runAt(j);
        matched = true;
      }
      if (matched) continue;
    }
    out += in[i++];
  }
  return out;
}

// #{1,6}\s -> ""
static std::string stripHeadings_(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    if (in[i] == '#') {
      size_t r = 0;
      while (i + r < in.size() && in[i + r] == '#') r++;
      const size_t sp = (r <= 6) ? trUnicodeSpaceLen(in, i + r) : 0;
      if (sp > 0) {
        i += r + sp;
        continue;
      }
    }
    out += in[i++];
  }
  return out;
}

static std::string removeMarkdown_(const std::string& in) {
  std::string s = stripLinks_(in, true);
  s = stripLinks_(s, false);
  s = stripEmphasis_(s, 2);
  s = stripEmphasis_(s, 1);
  s = stripCode_(s);
  s = stripHeadings_(s);
  return s;
}

// ---- stage 2: custom keywords ----
static std::string removeKeywords_(const std::string& in, const std::string& csv) {
  std::vector<std::string> keys;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t comma = csv.find(',', start);
    if (comma == std::string::npos) comma = csv.size();
    std::string k = trTrim(csv.substr(start, comma - start));
    if (!k.empty()) keys.push_back(k);
    start = comma + 1;
  }
  if (keys.empty()) return in;

  std::string pattern;
  for (size_t i = 0; i < keys.size(); i++) {
    if (i) pattern += '|';
    pattern += TextCleaner::escapeRegex(keys[i]);
  }
  try {
    const std::regex re(pattern);
    return std::regex_replace(in, re, "");
  } catch (const std::regex_error& e) {
    // escaped literals should always compile; fall back to plain erase if not
    TR_LOGW("CLEAN", "keyword regex rejected code=%d -> literal erase", (int)e.code());
  }
  std::string out = in;
  for (const std::string& k : keys) {
    size_t pos = 0;
    while ((pos = out.find(k, pos)) != std::string::npos) out.erase(pos, k.size());
  }
  return out;
}

// ---- stage 3: characters ----
static std::string removeEmoji_(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    size_t L = 0;
    const uint32_t cp = trUtf8Decode(in, i, &L);
    if (!TextCleaner::isEmojiPresentation(cp)) out.append(in, i, L);
    i += L;
  }
  return out;
}

// ---- stage 4: context ----
static bool citationFollower_(const std::string& s, size_t pos) {
  if (pos >= s.size()) return true; // end of text
  const char c = s[pos];
  if (c == '.' || c == ',' || c == ';' || c == ':') return true;
  size_t L = 0;
  const uint32_t cp = trUtf8Decode(s, pos, &L);
  // 。 ， ； ：
  return cp == 0x3002 || cp == 0xFF0C || cp == 0xFF1B || cp == 0xFF1A;
}

// whitespace + 1-2 ASCII digits right before sentence punctuation or the end -> ""
static std::string removeCitations_(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    const size_t sp = trUnicodeSpaceLen(in, i);
    if (sp > 0) {
      size_t d = 0;
      while (d < 3 && i + sp + d < in.size() && in[i + sp + d] >= '0' && in[i + sp + d] <= '9') d++;
      if (d >= 1 && d <= 2 && citationFollower_(in, i + sp + d)) {
        i += sp + d;
        continue;
      }
      out.append(in, i, sp);
      i += sp;
      continue;
    }
    out += in[i++];
  }
  return out;
}

// ---- stage 5: whitespace ----
static std::string collapseWhitespace_(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    size_t sp = trUnicodeSpaceLen(in, i);
    if (sp == 0) {
      out += in[i++];
      continue;
    }
    while (sp > 0) {
      i += sp;
      sp = trUnicodeSpaceLen(in, i);
    }
    out += ' ';
  }
  return out;
}

} // namespace

namespace TextCleaner {

bool isEmojiPresentation(uint32_t cp) {
  const CpRange* begin = kEmojiPresentation;
  const CpRange* end = kEmojiPresentation + sizeof(kEmojiPresentation) / sizeof(kEmojiPresentation[0]);
  const CpRange* it = std::upper_bound(begin, end, cp,
                                       [](uint32_t v, const CpRange& r) { return v < r.lo; });
  if (it == begin) return false;
  --it;
  return cp >= it->lo && cp <= it->hi;
}

std::string escapeRegex(const std::string& literal) {
  static const std::string kSpecial = "\\^$.*+?()[]{}|";
  std::string out;
  out.reserve(literal.size() * 2);
  for (char c : literal) {
    if (kSpecial.find(c) != std::string::npos) out += '\\';
    out += c;
  }
  return out;
}

std::string clean(const std::string& text, const CleaningOptions& opt) {
  std::string s = text;

  if (opt.removeUrls) {
    s = removeUrls_(s);
  }
  if (opt.removeMarkdown) {
    s = removeMarkdown_(s);
  }
  if (!opt.customKeywords.empty()) {
    s = removeKeywords_(s, opt.customKeywords);
  }
  if (opt.removeEmoji) {
    s = removeEmoji_(s);
  }
  if (opt.removeCitationNumbers) {
    s = removeCitations_(s);
  }
  if (opt.removeLineBreaks) {
    s = collapseWhitespace_(s);
  }

  s = trTrim(s);
  TR_LOGT("CLEAN", "bytes %u -> %u", (unsigned)text.size(), (unsigned)s.size());
  return s;
}

} // namespace TextCleaner
