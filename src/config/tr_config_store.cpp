// src/config/tr_config_store.cpp
#include "config/tr_config_store.h"

#include <ArduinoJson.h>
#include <fstream>
#include <mutex>
#include <stdlib.h>

#include "config/config.h"
#include "utils/logging.h"

namespace {

struct RuntimeCfg {
  std::string api_key;

  uint32_t default_concurrency = TR_DEFAULT_CONCURRENCY;
  uint32_t default_chunk_size  = TR_DEFAULT_CHUNK_SIZE;

  std::string output_format;
  std::string user_agent;

  uint32_t http_timeout_ms  = TR_HTTP_TIMEOUT_MS;
  uint32_t token_timeout_ms = TR_TOKEN_TIMEOUT_MS;
};

static RuntimeCfg g_rt;
static bool g_loaded = false;
static std::mutex g_mu;

static void applyDefaults_() {
  g_rt = RuntimeCfg{};
  g_rt.api_key       = TR_API_KEY;
  g_rt.output_format = TR_OUTPUT_FORMAT;
  g_rt.user_agent    = TR_USER_AGENT;
}

// 1..TR_MAX_CONCURRENCY
static bool parseConcurrency_(long v, uint32_t* out) {
  if (v < 1 || v > TR_MAX_CONCURRENCY) return false;
  *out = (uint32_t)v;
  return true;
}

// 1..TR_MAX_CHUNK_SIZE
static bool parseChunkSize_(long v, uint32_t* out) {
  if (v < 1 || v > TR_MAX_CHUNK_SIZE) return false;
  *out = (uint32_t)v;
  return true;
}

static bool parsePositive_(long v, uint32_t* out) {
  if (v < 1) return false;
  *out = (uint32_t)v;
  return true;
}

static void loadFile_(const std::string& path) {
  if (path.empty()) {
    trLogf("[CFG] no config file -> defaults");
    return;
  }

  std::ifstream f(path);
  if (!f) {
    trLogf("[CFG] %s not found -> defaults", path.c_str());
    return;
  }

  DynamicJsonDocument doc(4096);
  DeserializationError err = deserializeJson(doc, f);
  if (err) {
    trLogf("[CFG] JSON parse failed: %s", err.c_str());
    return;
  }

  auto setStr = [&](const char* key, std::string& dst) {
    JsonVariant v = doc[key];
    if (!v.isNull()) dst = v.as<std::string>();
  };
  auto setU32 = [&](const char* key, uint32_t& dst, bool (*check)(long, uint32_t*)) {
    JsonVariant v = doc[key];
    if (v.isNull()) return;
    if (!v.is<long>() || !check(v.as<long>(), &dst)) {
      trLogf("[CFG] out of range ignored: %s", key);
    }
  };

  setStr("api_key", g_rt.api_key);
  setU32("default_concurrency", g_rt.default_concurrency, parseConcurrency_);
  setU32("default_chunk_size", g_rt.default_chunk_size, parseChunkSize_);
  setStr("output_format", g_rt.output_format);
  setStr("user_agent", g_rt.user_agent);
  setU32("http_timeout_ms", g_rt.http_timeout_ms, parsePositive_);
  setU32("token_timeout_ms", g_rt.token_timeout_ms, parsePositive_);

  trLogf("[CFG] loaded %s", path.c_str());
}

static void loadOnceLocked_(const std::string& path) {
  if (g_loaded) return;
  g_loaded = true;
  applyDefaults_();
  loadFile_(path);
}

static void ensureLoaded_() {
  std::lock_guard<std::mutex> lock(g_mu);
  loadOnceLocked_("");
}

} // namespace

void trConfigBegin(const std::string& path) {
  std::lock_guard<std::mutex> lock(g_mu);
  loadOnceLocked_(path);
}

void trConfigResetForTest() {
  std::lock_guard<std::mutex> lock(g_mu);
  g_loaded = true;
  applyDefaults_();
}

bool trConfigSetKV(const std::string& key, const std::string& value, std::string& err) {
  ensureLoaded_();
  std::lock_guard<std::mutex> lock(g_mu);
  err.clear();

  auto parseLong = [&](long* out) -> bool {
    const char* s = value.c_str();
    char* endp = nullptr;
    long v = strtol(s, &endp, 10);
    if (endp == s || *endp != 0) {
      err = "invalid_number";
      return false;
    }
    *out = v;
    return true;
  };

  if (key == "api_key")       { g_rt.api_key = value; return true; }
  if (key == "output_format") {
    if (value.empty()) { err = "empty"; return false; }
    g_rt.output_format = value;
    return true;
  }
  if (key == "user_agent")    { g_rt.user_agent = value; return true; }

  if (key == "default_concurrency") {
    long v = 0;
    if (!parseLong(&v)) return false;
    if (!parseConcurrency_(v, &g_rt.default_concurrency)) {
      err = "range(1-" + std::to_string(TR_MAX_CONCURRENCY) + ")";
      return false;
    }
    return true;
  }

  if (key == "default_chunk_size") {
    long v = 0;
    if (!parseLong(&v)) return false;
    if (!parseChunkSize_(v, &g_rt.default_chunk_size)) {
      err = "range(1-" + std::to_string(TR_MAX_CHUNK_SIZE) + ")";
      return false;
    }
    return true;
  }

  uint32_t* positive = nullptr;
  if (key == "http_timeout_ms") positive = &g_rt.http_timeout_ms;
  else if (key == "token_timeout_ms") positive = &g_rt.token_timeout_ms;
  if (positive) {
    long v = 0;
    if (!parseLong(&v)) return false;
    if (!parsePositive_(v, positive)) {
      err = "range(>=1)";
      return false;
    }
    return true;
  }

  err = "unknown_key";
  return false;
}

std::string trConfigGetMaskedJson() {
  const bool keySet = trCfgApiKey()[0] != 0;
  std::lock_guard<std::mutex> lock(g_mu);

  DynamicJsonDocument doc(1024);
  doc["api_key"]             = "***";
  doc["api_key_set"]         = keySet;
  doc["default_concurrency"] = g_rt.default_concurrency;
  doc["default_chunk_size"]  = g_rt.default_chunk_size;
  doc["output_format"]       = g_rt.output_format;
  doc["user_agent"]          = g_rt.user_agent;
  doc["http_timeout_ms"]     = g_rt.http_timeout_ms;
  doc["token_timeout_ms"]    = g_rt.token_timeout_ms;

  std::string out;
  serializeJson(doc, out);
  return out;
}

// ---- getters ----
// Values are written only during startup (trConfigBegin / trConfigSetKV), so reads are lock-free.

const char* trCfgApiKey() {
  ensureLoaded_();
  const char* env = getenv("API_KEY");
  if (env && *env) return env;
  return g_rt.api_key.c_str();
}

uint32_t trCfgDefaultConcurrency() { ensureLoaded_(); return g_rt.default_concurrency; }
uint32_t trCfgDefaultChunkSize()   { ensureLoaded_(); return g_rt.default_chunk_size; }

const char* trCfgOutputFormat() { ensureLoaded_(); return g_rt.output_format.c_str(); }
const char* trCfgUserAgent()    { ensureLoaded_(); return g_rt.user_agent.c_str(); }

uint32_t trCfgHttpTimeoutMs()  { ensureLoaded_(); return g_rt.http_timeout_ms; }
uint32_t trCfgTokenTimeoutMs() { ensureLoaded_(); return g_rt.token_timeout_ms; }
