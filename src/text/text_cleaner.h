// src/text/text_cleaner.h
// Module implementation.
#pragma once
#include <stdint.h>
#include <string>

// Switches for TextCleaner::clean(). Defaults match the request defaults
// (everything on, no custom keywords).
struct CleaningOptions {
  bool removeMarkdown        = true;  // images, links (label kept), bold/italic, code spans, headings
  bool removeEmoji           = true;  // Emoji_Presentation code points
  bool removeUrls            = true;  // bare http(s) URLs
  bool removeLineBreaks      = true;  // collapse every whitespace run to one space
  bool removeCitationNumbers = true;  // " 12." -> "."
  std::string customKeywords;         // comma separated literals, removed verbatim
};

namespace TextCleaner {
// Multi-stage cleanup, fixed order:
//   urls / markdown -> custom keywords -> emoji -> citation numbers -> whitespace -> trim
// Total: never fails, empty in -> empty out.
std::string clean(const std::string& text, const CleaningOptions& opt);

// Escape characters that are special in an ECMAScript regex.
std::string escapeRegex(const std::string& literal);

bool isEmojiPresentation(uint32_t cp);
} // namespace TextCleaner
