// src/core/main.cpp
// Module implementation.
// ===== tts_relay: command-line driver (one request through the relay) =====
// Libs : libcurl (outbound), mbedTLS (handshake signature), ArduinoJson (config / request)
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdio.h>
#include <string.h>
#include <string>
#include <vector>

#include "config/config.h"
#include "config/tr_config_store.h"
#include "core/audio_sink.h"
#include "core/relay_handler.h"
#include "net/http_transport.h"
#include "tts/edge_auth.h"
#include "tts/edge_tts.h"
#include "utils/logging.h"

namespace {

struct CliArgs {
  std::string configPath;
  std::vector<std::string> sets;   // key=value
  std::string requestPath = "-";
  std::string path = "/v1/audio/speech";
  std::string method = "POST";
  std::string outPath = "-";
  std::string apiKey;
  bool printConfig = false;
};

static void usage_(const char* argv0) {
  fprintf(stderr,
          "usage: %s [--config FILE] [--set KEY=VALUE]... [--request FILE|-]\n"
          "          [--path PATH] [--method METHOD] [--out FILE|-] [--api-key KEY]\n"
          "          [--print-config]\n",
          argv0);
}

static bool parseArgs_(int argc, char** argv, CliArgs* a) {
  for (int i = 1; i < argc; i++) {
    const std::string k = argv[i];
    auto next = [&](std::string* dst) -> bool {
      if (i + 1 >= argc) {
        fprintf(stderr, "%s needs a value\n", k.c_str());
        return false;
      }
      *dst = argv[++i];
      return true;
    };
    if (k == "--config") { if (!next(&a->configPath)) return false; }
    else if (k == "--set") {
      std::string kv;
      if (!next(&kv)) return false;
      a->sets.push_back(kv);
    }
    else if (k == "--request") { if (!next(&a->requestPath)) return false; }
    else if (k == "--path") { if (!next(&a->path)) return false; }
    else if (k == "--method") { if (!next(&a->method)) return false; }
    else if (k == "--out") { if (!next(&a->outPath)) return false; }
    else if (k == "--api-key") { if (!next(&a->apiKey)) return false; }
    else if (k == "--print-config") { a->printConfig = true; }
    else {
      fprintf(stderr, "unknown option: %s\n", k.c_str());
      return false;
    }
  }
  return true;
}

static bool readAll_(const std::string& path, std::string* out) {
  if (path == "-") {
    out->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  *out = ss.str();
  return true;
}

// Streamed responses go straight to the output file as windows resolve.
class FileResponseStream : public ResponseStream {
public:
  explicit FileResponseStream(const std::string& path) : path_(path) {}

  bool begin(int status, const HeaderList& headers) override {
    const std::string* ct = trFindHeader(headers, "Content-Type");
    TR_LOGI("MAIN", "stream begin status=%d type=%s", status, ct ? ct->c_str() : "-");
    return sink_.open(path_);
  }
  bool write(const uint8_t* data, size_t len) override { return sink_.write(data, len); }
  void error(const std::string& cause) override { sink_.error(cause); }
  void close() override { sink_.close(); }

  size_t bytesWritten() const { return sink_.bytesWritten(); }

private:
  std::string path_;
  FileAudioSink sink_;
};

static int writeBody_(const std::string& path, const std::string& body) {
  FileAudioSink out;
  if (!out.open(path)) return 1;
  const bool ok = out.write(reinterpret_cast<const uint8_t*>(body.data()), body.size());
  out.close();
  return ok ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (!parseArgs_(argc, argv, &args)) {
    usage_(argv[0]);
    return 2;
  }

  trConfigBegin(args.configPath);
  for (const std::string& kv : args.sets) {
    const size_t eq = kv.find('=');
    std::string err;
    if (eq == std::string::npos || !trConfigSetKV(kv.substr(0, eq), kv.substr(eq + 1), err)) {
      fprintf(stderr, "--set %s rejected: %s\n", kv.c_str(), err.empty() ? "format" : err.c_str());
      return 2;
    }
  }
  if (args.printConfig) {
    printf("%s\n", trConfigGetMaskedJson().c_str());
    return 0;
  }

  RelayHttpRequest req;
  req.method = args.method;
  req.path = args.path;
  req.headers.push_back({"Content-Type", "application/json"});
  if (!args.apiKey.empty()) req.headers.push_back({"Authorization", "Bearer " + args.apiKey});
  if (args.method == "POST" && !readAll_(args.requestPath, &req.body)) {
    TR_LOGE("MAIN", "cannot read request body from %s", args.requestPath.c_str());
    return 2;
  }

  CurlHttpTransport http;
  EdgeAuth auth(http);
  EdgeTts tts(auth, http);
  RelayHandler relay(tts, trCfgApiKey(), SpeechDefaults::fromConfig());

  FileResponseStream stream(args.outPath);
  const uint32_t t0 = trMillis();
  RelayResponse res = relay.handle(req, &stream);
  TR_EVT("MAIN", "done status=%d streamed=%d kind=%s took=%ums", res.status, res.streamed ? 1 : 0,
         relayErrorName(res.kind), (unsigned)(trMillis() - t0));

  if (res.streamed) {
    TR_LOGI("MAIN", "streamed bytes=%u", (unsigned)stream.bytesWritten());
    return (res.kind == RelayError::None) ? 0 : 1;
  }

  const bool ok2xx = res.status >= 200 && res.status < 300;
  const std::string* ct = trFindHeader(res.headers, "Content-Type");
  if (ok2xx && ct && *ct == "audio/mpeg") {
    TR_LOGI("MAIN", "audio bytes=%u", (unsigned)res.body.size());
    return writeBody_(args.outPath, res.body);
  }

  // JSON (model list / error) -> stdout
  if (!res.body.empty()) printf("%s\n", res.body.c_str());
  else printf("HTTP %d\n", res.status);
  return ok2xx ? 0 : 1;
}
