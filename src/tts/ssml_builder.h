// src/tts/ssml_builder.h
// Module implementation.
#pragma once
#include <string>

namespace SsmlBuilder {
// & < > " ' -> entities (attribute values)
std::string xmlEscape(const std::string& s);

// Escape & < > only, keeping <break .../> pause tags byte-for-byte.
std::string escapeText(const std::string& text);

// <speak><voice><mstts:express-as><prosody rate pitch>TEXT</prosody>...</speak>
// ratePct / pitchPct are signed percents (0 = unchanged).
std::string build(const std::string& text, const std::string& voice,
                  int ratePct, int pitchPct, const std::string& style);
} // namespace SsmlBuilder
