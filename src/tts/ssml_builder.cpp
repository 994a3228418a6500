// src/tts/ssml_builder.cpp
// Module implementation.
#include "tts/ssml_builder.h"

#include <stdio.h>

#include "utils/tr_text_utils.h"

namespace {

static bool matchNoCase_(const std::string& s, size_t pos, const char* lit) {
  for (size_t k = 0; lit[k]; k++) {
    if (pos + k >= s.size()) return false;
    char c = s[pos + k];
    if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    if (c != lit[k]) return false;
  }
  return true;
}

static size_t skipSpaces_(const std::string& s, size_t pos) {
  size_t L = 0;
  while ((L = trUnicodeSpaceLen(s, pos)) > 0) pos += L;
  return pos;
}

// "\s*/?>" at pos -> end of tag, npos if absent
static size_t tagClose_(const std::string& s, size_t pos) {
  pos = skipSpaces_(s, pos);
  if (pos < s.size() && s[pos] == '/') pos++;
  if (pos < s.size() && s[pos] == '>') return pos + 1;
  return std::string::npos;
}

// Pause tag at s[pos] (case-insensitive), returns its byte length or 0:
//   <break time="500ms"/>  <break time='1s'>  <break/>  <break>
static size_t breakTagAt_(const std::string& s, size_t pos) {
  if (!matchNoCase_(s, pos, "<break")) return 0;
  const size_t name = pos + 6;

  const size_t attr = skipSpaces_(s, name);
  if (attr > name && matchNoCase_(s, attr, "time=") && attr + 5 < s.size()) {
    const char q = s[attr + 5];
    if (q == '"' || q == '\'') {
      const size_t endq = s.find(q, attr + 6);
      if (endq != std::string::npos) {
        const size_t end = tagClose_(s, endq + 1);
        if (end != std::string::npos) return end - pos;
      }
    }
  }

  const size_t end = tagClose_(s, name);
  return (end != std::string::npos) ? end - pos : 0;
}

static void appendTextEscaped_(std::string* o, const std::string& s, size_t b, size_t e) {
  for (size_t i = b; i < e; i++) {
    const char c = s[i];
    switch (c) {
      case '&': *o += "&amp;"; break;
      case '<': *o += "&lt;"; break;
      case '>': *o += "&gt;"; break;
      default: *o += c; break;
    }
  }
}

static std::string pct_(int v) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%d%%", v);
  return buf;
}

} // namespace

namespace SsmlBuilder {

std::string xmlEscape(const std::string& s) {
  std::string o;
  o.reserve(s.size() + 16);
  for (char c : s) {
    switch (c) {
      case '&': o += "&amp;"; break;
      case '<': o += "&lt;"; break;
      case '>': o += "&gt;"; break;
      case '"': o += "&quot;"; break;
      case '\'': o += "&apos;"; break;
      default: o += c; break;
    }
  }
  return o;
}

std::string escapeText(const std::string& text) {
  std::string o;
  o.reserve(text.size() + 16);
  size_t pos = 0;
  size_t i = text.find('<');
  while (i != std::string::npos) {
    const size_t n = breakTagAt_(text, i);
    if (n == 0) {
      i = text.find('<', i + 1);
      continue;
    }
    appendTextEscaped_(&o, text, pos, i);
    o.append(text, i, n); // pause tag as-is
    pos = i + n;
    i = text.find('<', pos);
  }
  appendTextEscaped_(&o, text, pos, text.size());
  return o;
}

std::string build(const std::string& text, const std::string& voice,
                  int ratePct, int pitchPct, const std::string& style) {
  std::string ssml;
  ssml.reserve(text.size() + voice.size() + style.size() + 320);
  ssml += "<speak xmlns=\"http://www.w3.org/2001/10/synthesis\" "
          "xmlns:mstts=\"http://www.w3.org/2001/mstts\" version=\"1.0\" xml:lang=\"en-US\">";
  ssml += "<voice name=\"";
  ssml += xmlEscape(voice);
  ssml += "\"><mstts:express-as style=\"";
  ssml += xmlEscape(style);
  ssml += "\"><prosody rate=\"";
  ssml += pct_(ratePct);
  ssml += "\" pitch=\"";
  ssml += pct_(pitchPct);
  ssml += "\">";
  ssml += escapeText(text);
  ssml += "</prosody></mstts:express-as></voice></speak>";
  return ssml;
}

} // namespace SsmlBuilder
