// src/text/text_chunker.cpp
// Module implementation.
#include "text/text_chunker.h"

#include "utils/logging.h"
#include "utils/tr_text_utils.h"

namespace {

// A run of code points, kept as UTF-8 bytes plus its code point count.
struct Segment {
  std::string bytes;
  size_t cps = 0;
};

// Alternating [text][boundary-run][text]... like a capturing split.
static std::vector<Segment> tokenize_(const std::string& text) {
  std::vector<Segment> parts;
  Segment cur;
  bool curIsBoundary = false;
  size_t i = 0;
  while (i < text.size()) {
    size_t L = 0;
    const uint32_t cp = trUtf8Decode(text, i, &L);
    const bool b = TextChunker::isBoundary(cp);
    if (cur.cps > 0 && b != curIsBoundary) {
      parts.push_back(cur);
      cur = Segment{};
    }
    curIsBoundary = b;
    cur.bytes.append(text, i, L);
    cur.cps++;
    i += L;
  }
  if (cur.cps > 0) parts.push_back(cur);
  return parts;
}

// Break one oversize segment into pieces of <= maxLen code points.
static void breakLong_(const Segment& seg, size_t maxLen, std::vector<Segment>* out) {
  // byte offset of every code point (+ end)
  std::vector<size_t> offs;
  offs.reserve(seg.cps + 1);
  size_t i = 0;
  while (i < seg.bytes.size()) {
    offs.push_back(i);
    size_t L = 0;
    (void)trUtf8Decode(seg.bytes, i, &L);
    i += L;
  }
  offs.push_back(seg.bytes.size());
  const size_t total = offs.size() - 1;

  size_t start = 0;
  while (total - start > maxLen) {
    size_t cut = start + maxLen;
    if (trUnicodeSpaceLen(seg.bytes, offs[cut]) == 0) {
      // last space inside the window (not the first code point) keeps words whole
      for (size_t k = start + maxLen - 1; k > start; k--) {
        if (trUnicodeSpaceLen(seg.bytes, offs[k]) > 0) { cut = k; break; }
      }
    }
    Segment piece;
    piece.bytes = seg.bytes.substr(offs[start], offs[cut] - offs[start]);
    piece.cps = cut - start;
    out->push_back(piece);
    start = cut;
  }
  Segment rest;
  rest.bytes = seg.bytes.substr(offs[start]);
  rest.cps = total - start;
  out->push_back(rest);
}

static void flush_(std::string* buf, std::vector<std::string>* chunks) {
  std::string t = trTrim(*buf);
  if (!t.empty()) chunks->push_back(t);
  buf->clear();
}

} // namespace

namespace TextChunker {

bool isBoundary(uint32_t cp) {
  switch (cp) {
    case '.': case '?': case '!': case ',': case ';': case ':':
    case '\n': case '\r':
    case 0x3002: // 。
    case 0xFF1F: // ？
    case 0xFF01: // ！
    case 0xFF0C: // ，
    case 0xFF1B: // ；
    case 0xFF1A: // ：
      return true;
    default:
      return false;
  }
}

std::vector<std::string> split(const std::string& text, size_t maxLen) {
  std::vector<std::string> chunks;
  if (text.empty()) return chunks;
  if (maxLen < 1) maxLen = 1;

  std::vector<Segment> pieces;
  for (const Segment& s : tokenize_(text)) {
    if (s.cps > maxLen) breakLong_(s, maxLen, &pieces);
    else pieces.push_back(s);
  }

  std::string buf;
  size_t bufCps = 0;
  for (const Segment& p : pieces) {
    if (bufCps + p.cps <= maxLen) {
      buf += p.bytes;
      bufCps += p.cps;
    } else {
      flush_(&buf, &chunks);
      buf = p.bytes;
      bufCps = p.cps;
    }
  }
  flush_(&buf, &chunks);

  TR_LOGD("CHUNK", "split bytes=%u max=%u -> chunks=%u",
          (unsigned)text.size(), (unsigned)maxLen, (unsigned)chunks.size());
  return chunks;
}

} // namespace TextChunker
