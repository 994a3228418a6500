// src/core/speech_request.cpp
// Module implementation.
#include "core/speech_request.h"

#include <ArduinoJson.h>
#include <math.h>
#include <string.h>

#include "config/config.h"
#include "config/tr_config_store.h"
#include "utils/logging.h"

namespace {

static const char* kModelPrefix = "tts-1-";

static ParsedSpeechRequest& reject_(ParsedSpeechRequest& r, const char* param,
                                    const std::string& message) {
  r.ok = false;
  r.kind = RelayError::InvalidRequest;
  r.code = "invalid_request_error";
  r.param = param ? param : "";
  r.message = message;
  TR_LOGI_RL("REQ.reject", 2000, "REQ", "rejected param=%s: %s",
             r.param.c_str(), message.c_str());
  return r;
}

// JSON integer >= 1 (absent -> def)
static bool readCount_(JsonVariantConst v, uint32_t def, uint32_t* out) {
  if (v.isNull()) {
    *out = def;
    return true;
  }
  if (!v.is<long long>()) return false;
  const long long n = v.as<long long>();
  if (n < 1 || n > 0xFFFFFFFFLL) return false;
  *out = (uint32_t)n;
  return true;
}

static bool readFactor_(JsonVariantConst v, double def, double* out) {
  if (v.isNull()) {
    *out = def;
    return true;
  }
  if (!v.is<double>()) return false;
  *out = v.as<double>();
  return isfinite(*out) != 0;
}

static bool readSwitch_(JsonVariantConst obj, const char* key, bool* dst) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return true;
  if (!v.is<bool>()) return false;
  *dst = v.as<bool>();
  return true;
}

// explicit voice wins (an alias given as voice is mapped too), else model suffix
static bool resolveVoice_(const std::string& voice, const std::string& model,
                          const SpeechDefaults& d, std::string* out) {
  if (!voice.empty()) {
    const char* mapped = trVoiceForAlias(voice);
    *out = mapped ? mapped : voice;
    return true;
  }
  std::string alias;
  if (model.empty() || model == "tts-1" || model == "tts-1-hd") {
    alias = d.voiceAlias;
  } else if (model.compare(0, strlen(kModelPrefix), kModelPrefix) == 0) {
    alias = model.substr(strlen(kModelPrefix));
  } else {
    alias = model;
  }
  const char* mapped = trVoiceForAlias(alias);
  if (!mapped) return false;
  *out = mapped;
  return true;
}

} // namespace

SpeechDefaults SpeechDefaults::fromConfig() {
  SpeechDefaults d;
  d.concurrency = trCfgDefaultConcurrency();
  d.chunkSize = trCfgDefaultChunkSize();
  d.style = TR_DEFAULT_STYLE;
  d.outputFormat = trCfgOutputFormat();
  return d;
}

const std::vector<std::pair<std::string, std::string>>& trVoiceAliases() {
  static const std::vector<std::pair<std::string, std::string>> kAliases = {
      {"shimmer", "zh-CN-XiaoxiaoNeural"},
      {"alloy",   "zh-CN-YunyangNeural"},
      {"fable",   "zh-CN-YunjianNeural"},
      {"onyx",    "zh-CN-XiaoyiNeural"},
      {"nova",    "zh-CN-YunxiNeural"},
      {"echo",    "zh-CN-liaoning-XiaobeiNeural"},
  };
  return kAliases;
}

const char* trVoiceForAlias(const std::string& alias) {
  for (const auto& kv : trVoiceAliases()) {
    if (kv.first == alias) return kv.second.c_str();
  }
  return nullptr;
}

int trFactorToPercent(double factor) {
  double pct = (factor - 1.0) * 100.0;
  if (!(pct > -10000.0)) pct = -10000.0; // NaN lands here too
  if (pct > 10000.0) pct = 10000.0;
  return (int)lround(pct);
}

VoiceParams ParsedSpeechRequest::voiceParams() const {
  VoiceParams p;
  p.voice = voice;
  p.ratePct = trFactorToPercent(speed);
  p.pitchPct = trFactorToPercent(pitch);
  p.style = style;
  p.outputFormat = outputFormat;
  return p;
}

ParsedSpeechRequest parseSpeechRequest(const std::string& json, const SpeechDefaults& defaults) {
  ParsedSpeechRequest r;

  DynamicJsonDocument doc(4096 + json.size() * 2);
  DeserializationError e = deserializeJson(doc, json);
  if (e) return reject_(r, nullptr, std::string("JSON parse error: ") + e.c_str());
  if (!doc.is<JsonObject>()) return reject_(r, nullptr, "request body must be a JSON object");

  JsonObjectConst root = doc.as<JsonObjectConst>();

  // input: required, non-empty string
  JsonVariantConst input = root["input"];
  if (input.isNull()) return reject_(r, "input", "'input' is required");
  if (!input.is<const char*>()) return reject_(r, "input", "'input' must be a string");
  r.text = input.as<const char*>();
  if (r.text.empty()) return reject_(r, "input", "'input' is required");

  JsonVariantConst model = root["model"];
  if (!model.isNull() && !model.is<const char*>()) return reject_(r, "model", "'model' must be a string");
  r.model = model.isNull() ? "tts-1" : model.as<const char*>();

  JsonVariantConst voice = root["voice"];
  if (!voice.isNull() && !voice.is<const char*>()) return reject_(r, "voice", "'voice' must be a string");
  const std::string voiceIn = voice.isNull() ? "" : voice.as<const char*>();
  if (!resolveVoice_(voiceIn, r.model, defaults, &r.voice)) {
    return reject_(r, "voice", "no voice for model '" + r.model + "'");
  }

  if (!readFactor_(root["speed"], 1.0, &r.speed)) return reject_(r, "speed", "'speed' must be a number");
  if (r.speed < kSpeedMin || r.speed > kSpeedMax) {
    return reject_(r, "speed", "'speed' must be between 0.25 and 2.0");
  }
  if (!readFactor_(root["pitch"], 1.0, &r.pitch)) return reject_(r, "pitch", "'pitch' must be a number");
  if (r.pitch < TR_PITCH_MIN || r.pitch > TR_PITCH_MAX) {
    const double clamped = (r.pitch < TR_PITCH_MIN) ? TR_PITCH_MIN : TR_PITCH_MAX;
    TR_LOGW("REQ", "pitch %g clamped to %g", r.pitch, clamped);
    r.pitch = clamped;
  }

  JsonVariantConst style = root["style"];
  if (!style.isNull() && !style.is<const char*>()) return reject_(r, "style", "'style' must be a string");
  r.style = style.isNull() ? defaults.style : style.as<const char*>();
  if (r.style.empty()) r.style = defaults.style;

  JsonVariantConst stream = root["stream"];
  if (!stream.isNull() && !stream.is<bool>()) return reject_(r, "stream", "'stream' must be a boolean");
  r.stream = stream.isNull() ? false : stream.as<bool>();

  if (!readCount_(root["concurrency"], defaults.concurrency, &r.concurrency)) {
    return reject_(r, "concurrency", "'concurrency' must be an integer >= 1");
  }
  if (r.concurrency > TR_MAX_CONCURRENCY) {
    TR_LOGW("REQ", "concurrency %u clamped to %u", (unsigned)r.concurrency, (unsigned)TR_MAX_CONCURRENCY);
    r.concurrency = TR_MAX_CONCURRENCY;
  }
  if (!readCount_(root["chunk_size"], defaults.chunkSize, &r.chunkSize)) {
    return reject_(r, "chunk_size", "'chunk_size' must be an integer >= 1");
  }
  if (r.chunkSize > TR_MAX_CHUNK_SIZE) {
    TR_LOGW("REQ", "chunk_size %u clamped to %u", (unsigned)r.chunkSize, (unsigned)TR_MAX_CHUNK_SIZE);
    r.chunkSize = TR_MAX_CHUNK_SIZE;
  }

  JsonVariantConst co = root["cleaning_options"];
  if (!co.isNull()) {
    if (!co.is<JsonObjectConst>()) return reject_(r, "cleaning_options", "'cleaning_options' must be an object");
    if (!readSwitch_(co, "remove_markdown", &r.cleaning.removeMarkdown) ||
        !readSwitch_(co, "remove_emoji", &r.cleaning.removeEmoji) ||
        !readSwitch_(co, "remove_urls", &r.cleaning.removeUrls) ||
        !readSwitch_(co, "remove_line_breaks", &r.cleaning.removeLineBreaks) ||
        !readSwitch_(co, "remove_citation_numbers", &r.cleaning.removeCitationNumbers)) {
      return reject_(r, "cleaning_options", "cleaning switches must be booleans");
    }
    JsonVariantConst kw = co["custom_keywords"];
    if (!kw.isNull()) {
      if (!kw.is<const char*>()) return reject_(r, "cleaning_options", "'custom_keywords' must be a string");
      r.cleaning.customKeywords = kw.as<const char*>();
    }
  }

  r.outputFormat = defaults.outputFormat;
  r.ok = true;
  return r;
}
