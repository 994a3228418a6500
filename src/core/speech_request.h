// src/core/speech_request.h
// Module implementation.
#pragma once
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include "core/relay_error.h"
#include "text/text_cleaner.h"
#include "tts/edge_tts.h"

// Values used when the request omits a field.
struct SpeechDefaults {
  uint32_t concurrency = 10;
  uint32_t chunkSize = 300;
  std::string style = "general";
  std::string outputFormat;
  std::string voiceAlias = "shimmer"; // model "tts-1" / "tts-1-hd" without voice

  // config.h + tr_config_store
  static SpeechDefaults fromConfig();
};

// Validated POST /v1/audio/speech body. Immutable after parseSpeechRequest().
struct ParsedSpeechRequest {
  bool ok = false;
  RelayError kind = RelayError::None;
  std::string code;     // e.g. "invalid_request_error"
  std::string message;
  std::string param;    // offending field, empty if none

  std::string model;
  std::string text;     // raw input (not cleaned yet)
  std::string voice;    // resolved provider voice
  double speed = 1.0;
  double pitch = 1.0;
  std::string style;
  bool stream = false;
  uint32_t concurrency = 0;
  uint32_t chunkSize = 0;
  CleaningOptions cleaning;
  std::string outputFormat;

  VoiceParams voiceParams() const;
};

ParsedSpeechRequest parseSpeechRequest(const std::string& json, const SpeechDefaults& defaults);

// round((factor - 1) * 100), the provider's signed percent, saturated to +-10000
int trFactorToPercent(double factor);

// OpenAI-style alias -> provider voice; nullptr if unknown.
const char* trVoiceForAlias(const std::string& alias);

// alias, provider voice (models listing)
const std::vector<std::pair<std::string, std::string>>& trVoiceAliases();

constexpr double kSpeedMin = 0.25;
constexpr double kSpeedMax = 2.0;
