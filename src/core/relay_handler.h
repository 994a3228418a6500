// src/core/relay_handler.h
// Module implementation.
#pragma once
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include "core/audio_sink.h"
#include "core/batch_orchestrator.h"
#include "core/speech_request.h"
#include "tts/edge_tts.h"

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Header lookup, case-insensitive name. nullptr if absent.
const std::string* trFindHeader(const HeaderList& headers, const std::string& name);

struct RelayHttpRequest {
  std::string method;
  std::string path;
  HeaderList headers;
  std::string body;
};

struct RelayResponse {
  int status = 200;
  HeaderList headers;
  std::string body;       // JSON or audio bytes (buffered)
  bool streamed = false;  // head + body already went out through the ResponseStream
  RelayError kind = RelayError::None;
};

// Transport side of a streamed response. begin() commits status + headers and is
// called at most once, before the first write().
class ResponseStream : public AudioSink {
public:
  virtual bool begin(int status, const HeaderList& headers) = 0;
};

// Transport-agnostic front of the relay:
//   OPTIONS *                 -> 204 + CORS
//   GET  /v1/models           -> model list
//   POST /v1/audio/speech     -> clean -> chunk -> batch synth -> audio/mpeg
// ("/api" prefixed paths are accepted too.)
class RelayHandler {
public:
  // apiKey empty: no bearer check
  RelayHandler(SpeechSynthesizer& synth, const std::string& apiKey,
               const SpeechDefaults& defaults);

  // stream may be nullptr: "stream": true then falls back to a buffered body
  RelayResponse handle(const RelayHttpRequest& req, ResponseStream* stream);

  static HeaderList corsHeaders(const std::string* requestedHeaders = nullptr);
  static std::string errorJson(const std::string& message, const std::string& code,
                               const std::string& param = std::string(),
                               const char* type = "api_error");
  static std::string modelsJson(int64_t created);

private:
  RelayResponse speech_(const RelayHttpRequest& req, ResponseStream* stream);
  RelayResponse error_(int status, const std::string& message, const std::string& code,
                       RelayError kind, const std::string& param = std::string()) const;
  bool authorized_(const RelayHttpRequest& req) const;

  SpeechSynthesizer& synth_;
  std::string apiKey_;
  SpeechDefaults defaults_;
};
