// src/tts/edge_tts.h
// Module implementation.
#pragma once
#include <stdint.h>
#include <string>
#include <vector>

#include "core/relay_error.h"
#include "net/http_transport.h"
#include "tts/edge_auth.h"

// Voice / prosody for one request (shared by every chunk).
struct VoiceParams {
  std::string voice;
  int ratePct = 0;   // signed percent
  int pitchPct = 0;  // signed percent
  std::string style = "general";
  std::string outputFormat;
};

struct SynthResult {
  bool ok = false;
  RelayError kind = RelayError::None;
  int http = 0;             // provider status (0: transport / not sent)
  std::string err;          // short reason
  std::string body;         // provider error body (clamped)
  std::vector<uint8_t> audio;
  uint32_t tookMs = 0;
};

// One text segment -> one audio payload. Must be safe to call from several threads.
class SpeechSynthesizer {
public:
  virtual ~SpeechSynthesizer() = default;
  virtual SynthResult synthesize(const std::string& text, const VoiceParams& params) = 0;
};

// Edge (Translator app) endpoint: credential from EdgeAuth, SSML POST, raw audio back.
// No retry here.
class EdgeTts : public SpeechSynthesizer {
public:
  EdgeTts(EdgeAuth& auth, HttpTransport& http);

  SynthResult synthesize(const std::string& text, const VoiceParams& params) override;

  // https://<region>.tts.speech.microsoft.com/cognitiveservices/v1
  static std::string endpointFor(const std::string& region);

private:
  EdgeAuth& auth_;
  HttpTransport& http_;
};
