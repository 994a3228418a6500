// src/text/text_chunker.h
// Module implementation.
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace TextChunker {
// Sentence/clause terminators: . ? ! , ; : \n \r and full-width 。？！，；：
bool isBoundary(uint32_t cp);

// Split text into ordered, non-empty chunks of at most maxLen code points.
// - boundary runs stay attached to the text before them ("Hello," / "world.")
// - consecutive segments are packed greedily while they fit
// - a segment longer than maxLen is broken at its last space inside the limit,
//   otherwise cut at exactly maxLen
// - chunks are trimmed; empty input -> empty result
// maxLen < 1 is treated as 1.
std::vector<std::string> split(const std::string& text, size_t maxLen);
} // namespace TextChunker
