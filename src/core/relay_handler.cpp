// src/core/relay_handler.cpp
// Module implementation.
#include "core/relay_handler.h"

#include <ArduinoJson.h>
#include <chrono>

#include "text/text_chunker.h"
#include "text/text_cleaner.h"
#include "utils/logging.h"
#include "utils/tr_crypto.h"
#include "utils/tr_text_utils.h"

namespace {

static const char* kSpeechPath = "/v1/audio/speech";
static const char* kModelsPath = "/v1/models";

// "/api/v1/..." -> "/v1/...", query string dropped
static std::string routePath_(const std::string& path) {
  std::string p = path.substr(0, path.find('?'));
  if (p.compare(0, 4, "/api") == 0 && p.size() > 4 && p[4] == '/') p = p.substr(4);
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

static int64_t nowSec_() {
  using namespace std::chrono;
  return (int64_t)duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

static const char* failCode_(RelayError kind) {
  return (kind == RelayError::Credential) ? "credential_error" : "tts_generation_error";
}

static std::string failMessage_(const char* what, const BatchResult& b) {
  std::string msg = what;
  msg += " at chunk " + std::to_string(b.failedChunk) + ": " + b.err;
  if (!b.body.empty()) msg += " - " + b.body;
  return msg;
}

static HeaderList audioHeaders_() {
  HeaderList h = RelayHandler::corsHeaders();
  h.emplace(h.begin(), "Content-Type", "audio/mpeg");
  return h;
}

// Commits the 200 audio head on the first write; until then nothing reaches the
// transport, so an early failure can still become a JSON error response.
class LazyStreamSink : public AudioSink {
public:
  explicit LazyStreamSink(ResponseStream* out) : out_(out) {}

  bool write(const uint8_t* data, size_t len) override {
    if (!started_) {
      if (!out_->begin(200, audioHeaders_())) return false;
      started_ = true;
    }
    return out_->write(data, len);
  }
  void error(const std::string& cause) override {
    if (started_) out_->error(cause);
  }
  void close() override {
    if (started_) out_->close();
  }

  bool started() const { return started_; }

private:
  ResponseStream* out_;
  bool started_ = false;
};

} // namespace

const std::string* trFindHeader(const HeaderList& headers, const std::string& name) {
  const std::string want = trToLowerAscii(name);
  for (const auto& kv : headers) {
    if (trToLowerAscii(kv.first) == want) return &kv.second;
  }
  return nullptr;
}

RelayHandler::RelayHandler(SpeechSynthesizer& synth, const std::string& apiKey,
                           const SpeechDefaults& defaults)
    : synth_(synth), apiKey_(apiKey), defaults_(defaults) {}

HeaderList RelayHandler::corsHeaders(const std::string* requestedHeaders) {
  return {
      {"Access-Control-Allow-Origin", "*"},
      {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
      {"Access-Control-Allow-Headers",
       (requestedHeaders && !requestedHeaders->empty()) ? *requestedHeaders
                                                        : std::string("Content-Type, Authorization")},
      {"Access-Control-Max-Age", "86400"},
  };
}

std::string RelayHandler::errorJson(const std::string& message, const std::string& code,
                                    const std::string& param, const char* type) {
  DynamicJsonDocument doc(512 + message.size() * 2);
  JsonObject e = doc.createNestedObject("error");
  e["message"] = message;
  e["type"] = type;
  if (param.empty()) e["param"] = nullptr;
  else e["param"] = param;
  e["code"] = code;
  std::string out;
  serializeJson(doc, out);
  return out;
}

std::string RelayHandler::modelsJson(int64_t created) {
  std::vector<std::string> ids = {"tts-1", "tts-1-hd"};
  for (const auto& kv : trVoiceAliases()) ids.push_back("tts-1-" + kv.first);

  DynamicJsonDocument doc(2048);
  doc["object"] = "list";
  JsonArray data = doc.createNestedArray("data");
  for (const std::string& id : ids) {
    JsonObject m = data.createNestedObject();
    m["id"] = id;
    m["object"] = "model";
    m["created"] = created;
    m["owned_by"] = "openai";
  }
  std::string out;
  serializeJson(doc, out);
  return out;
}

RelayResponse RelayHandler::error_(int status, const std::string& message, const std::string& code,
                                   RelayError kind, const std::string& param) const {
  RelayResponse r;
  r.status = status;
  r.kind = kind;
  r.headers = corsHeaders();
  r.headers.emplace(r.headers.begin(), "Content-Type", "application/json");
  r.body = errorJson(message, code, param);
  return r;
}

bool RelayHandler::authorized_(const RelayHttpRequest& req) const {
  if (apiKey_.empty()) return true;
  const std::string* auth = trFindHeader(req.headers, "Authorization");
  static const std::string kBearer = "Bearer ";
  if (!auth || auth->compare(0, kBearer.size(), kBearer) != 0) return false;
  return auth->substr(kBearer.size()) == apiKey_;
}

RelayResponse RelayHandler::handle(const RelayHttpRequest& req, ResponseStream* stream) {
  const std::string path = routePath_(req.path);
  TR_EVT_D("RELAY", "%s %s", req.method.c_str(), path.c_str());

  if (req.method == "OPTIONS") {
    RelayResponse r;
    r.status = 204;
    r.headers = corsHeaders(trFindHeader(req.headers, "Access-Control-Request-Headers"));
    return r;
  }

  if (!authorized_(req)) {
    TR_LOGI_RL("RELAY.auth", 5000, "RELAY", "unauthorized %s %s", req.method.c_str(), path.c_str());
    return error_(401, "invalid API key", "invalid_api_key", RelayError::InvalidRequest);
  }

  if (path == kModelsPath) {
    if (req.method != "GET") {
      return error_(405, "method not allowed", "method_not_allowed", RelayError::InvalidRequest);
    }
    RelayResponse r;
    r.headers = corsHeaders();
    r.headers.emplace(r.headers.begin(), "Content-Type", "application/json");
    r.body = modelsJson(nowSec_());
    return r;
  }

  if (path == kSpeechPath) {
    if (req.method != "POST") {
      return error_(405, "method not allowed", "method_not_allowed", RelayError::InvalidRequest);
    }
    return speech_(req, stream);
  }

  return error_(404, "not found: " + path, "not_found", RelayError::InvalidRequest);
}

RelayResponse RelayHandler::speech_(const RelayHttpRequest& req, ResponseStream* stream) {
  const ParsedSpeechRequest p = parseSpeechRequest(req.body, defaults_);
  if (!p.ok) return error_(400, p.message, p.code, p.kind, p.param);

  const std::string cleaned = TextCleaner::clean(p.text, p.cleaning);
  const std::vector<std::string> chunks = TextChunker::split(cleaned, p.chunkSize);
  TR_EVT("RELAY", "speech chars=%u cleaned=%u chunks=%u voice=%s stream=%d",
         (unsigned)trUtf8Length(p.text), (unsigned)trUtf8Length(cleaned),
         (unsigned)chunks.size(), p.voice.c_str(), p.stream ? 1 : 0);

  BatchOrchestrator orch(synth_);
  const bool streamed = p.stream && stream;

  if (streamed) {
    LazyStreamSink sink(stream);
    BatchResult b = orch.run(chunks, p.concurrency, p.voiceParams(), &sink);
    if (!b.ok && !sink.started()) {
      return error_(500, failMessage_("streaming TTS failed", b), failCode_(b.kind), b.kind);
    }
    RelayResponse r;
    r.status = 200;
    r.headers = audioHeaders_();
    r.streamed = true;
    r.kind = b.kind;
    if (b.ok && !sink.started()) {
      // nothing to say (empty after cleaning): still a valid, empty audio stream
      if (stream->begin(200, r.headers)) stream->close();
    }
    return r;
  }

  BatchResult b = orch.run(chunks, p.concurrency, p.voiceParams());
  if (!b.ok) {
    return error_(500, failMessage_("TTS failed", b), failCode_(b.kind), b.kind);
  }

  RelayResponse r;
  r.status = 200;
  r.headers = audioHeaders_();
  r.body.assign(b.audio.begin(), b.audio.end());
  return r;
}
