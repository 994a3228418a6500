// src/tts/edge_tts.cpp
// Module implementation.
#include "tts/edge_tts.h"

#include "config/config.h"
#include "config/tr_config_store.h"
#include "tts/ssml_builder.h"
#include "utils/logging.h"
#include "utils/tr_text_utils.h"

EdgeTts::EdgeTts(EdgeAuth& auth, HttpTransport& http) : auth_(auth), http_(http) {}

std::string EdgeTts::endpointFor(const std::string& region) {
  return "https://" + region + ".tts.speech.microsoft.com/cognitiveservices/v1";
}

SynthResult EdgeTts::synthesize(const std::string& text, const VoiceParams& params) {
  SynthResult r;
  const uint32_t t0 = trMillis();

  EdgeCredential cred;
  std::string aerr;
  if (!auth_.acquire(&cred, &aerr)) {
    r.kind = RelayError::Credential;
    r.err = aerr.empty() ? "credential" : aerr;
    return r;
  }

  // ★SSML全文・トークンはログに出さない
  const std::string ssml =
      SsmlBuilder::build(text, params.voice, params.ratePct, params.pitchPct, params.style);

  HttpRequest req;
  req.url = endpointFor(cred.region);
  req.timeoutMs = trCfgHttpTimeoutMs();
  req.body = ssml;
  req.headers = {
      {"Authorization", cred.token},
      {"Content-Type", "application/ssml+xml"},
      {"User-Agent", trCfgUserAgent()},
      {"X-Microsoft-OutputFormat",
       params.outputFormat.empty() ? std::string(trCfgOutputFormat()) : params.outputFormat},
  };

  HttpResponse res = http_.post(req);
  r.http = res.status;
  r.tookMs = trMillis() - t0;

  if (res.status < 200 || res.status >= 300) {
    r.kind = RelayError::Provider;
    r.err = (res.status == 0) ? ("transport:" + res.err) : ("http_" + std::to_string(res.status));
    r.body = trUtf8ClampBytes(res.body, TR_PROVIDER_ERR_BODY_MAX);
    TR_LOGI_RL("TTS.fail", 3000, "TTS", "synth fail %s chars=%u took=%ums head=%s",
               r.err.c_str(), (unsigned)trUtf8Length(text), (unsigned)r.tookMs,
               trLogHead(res.body, TR_LOG_HEAD_BYTES_PROVIDER_BODY).c_str());
    return r;
  }

  r.audio.assign(res.body.begin(), res.body.end());
  r.ok = true;
  TR_LOGT("TTS", "synth ok chars=%u bytes=%u took=%ums",
          (unsigned)trUtf8Length(text), (unsigned)r.audio.size(), (unsigned)r.tookMs);
  return r;
}
