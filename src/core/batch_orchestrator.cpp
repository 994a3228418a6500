// src/core/batch_orchestrator.cpp
// Module implementation.
#include "core/batch_orchestrator.h"

#include <algorithm>
#include <system_error>
#include <thread>

#include "utils/logging.h"

namespace {

// close() on every exit path
class SinkCloser {
public:
  explicit SinkCloser(AudioSink* s) : s_(s) {}
  ~SinkCloser() {
    if (s_) s_->close();
  }
  SinkCloser(const SinkCloser&) = delete;
  SinkCloser& operator=(const SinkCloser&) = delete;

private:
  AudioSink* s_;
};

static void fail_(BatchResult* r, RelayError kind, int chunk, const SynthResult* sr,
                  const std::string& err) {
  r->ok = false;
  r->kind = (kind == RelayError::None) ? RelayError::Internal : kind;
  r->failedChunk = chunk;
  r->err = err;
  if (sr) {
    r->http = sr->http;
    r->body = sr->body;
  }
  r->audio.clear();
}

} // namespace

BatchOrchestrator::BatchOrchestrator(SpeechSynthesizer& synth) : synth_(synth) {}

uint32_t BatchOrchestrator::windowCount(size_t chunks, uint32_t concurrency) {
  if (concurrency < 1) concurrency = 1;
  return (uint32_t)((chunks + concurrency - 1) / concurrency);
}

void BatchOrchestrator::runWindow_(const std::vector<std::string>& chunks, size_t begin,
                                   size_t end, const VoiceParams& params,
                                   std::vector<SynthResult>* out) {
  const size_t n = end - begin;
  out->assign(n, SynthResult());

  std::vector<std::thread> workers;
  workers.reserve(n);
  for (size_t i = 0; i < n; i++) {
    SynthResult* slot = &(*out)[i];
    const std::string* text = &chunks[begin + i];
    try {
      workers.emplace_back([this, slot, text, &params]() {
        *slot = synth_.synthesize(*text, params);
      });
    } catch (const std::system_error& e) {
      // could not spawn: the slot reports it, already-started workers are still joined
      slot->ok = false;
      slot->kind = RelayError::Internal;
      slot->err = "thread_spawn";
      TR_LOGE("BATCH", "thread spawn failed chunk=%u: %s", (unsigned)(begin + i), e.what());
    }
  }
  for (std::thread& t : workers) t.join();
}

BatchResult BatchOrchestrator::run(const std::vector<std::string>& chunks, uint32_t concurrency,
                                   const VoiceParams& params, AudioSink* sink) {
  SinkCloser closer(sink);
  BatchResult r;
  if (concurrency < 1) concurrency = 1;

  const uint32_t total = windowCount(chunks.size(), concurrency);
  const uint32_t t0 = trMillis();
  TR_EVT("BATCH", "start chunks=%u conc=%u windows=%u mode=%s",
         (unsigned)chunks.size(), (unsigned)concurrency, (unsigned)total,
         sink ? "stream" : "buffer");

  std::vector<SynthResult> results;
  for (size_t begin = 0; begin < chunks.size(); begin += concurrency) {
    const size_t end = std::min(chunks.size(), begin + (size_t)concurrency);
    runWindow_(chunks, begin, end, params, &results);

    // first failure in chunk order wins, regardless of completion order
    for (size_t i = 0; i < results.size(); i++) {
      if (results[i].ok) continue;
      const int idx = (int)(begin + i);
      fail_(&r, results[i].kind, idx, &results[i], results[i].err);
      TR_EVT("BATCH", "window %u failed chunk=%d kind=%s err=%s",
             (unsigned)r.windows, idx, relayErrorName(r.kind), r.err.c_str());
      if (sink) sink->error("chunk " + std::to_string(idx) + ": " + r.err);
      return r;
    }

    for (size_t i = 0; i < results.size(); i++) {
      const std::vector<uint8_t>& a = results[i].audio;
      if (sink) {
        if (!sink->write(a.data(), a.size())) {
          fail_(&r, RelayError::Sink, (int)(begin + i), nullptr, "sink_write");
          TR_EVT("BATCH", "sink write failed window=%u -> abort", (unsigned)r.windows);
          sink->error("sink write failed");
          return r;
        }
      } else {
        r.audio.insert(r.audio.end(), a.begin(), a.end());
      }
      r.bytesOut += a.size();
    }
    r.windows++;
    TR_EVT_D("BATCH", "window %u/%u done chunks=%u", (unsigned)r.windows, (unsigned)total,
             (unsigned)(end - begin));
  }

  r.ok = true;
  TR_EVT("BATCH", "done windows=%u bytes=%u took=%ums", (unsigned)r.windows,
         (unsigned)r.bytesOut, (unsigned)(trMillis() - t0));
  return r;
}
