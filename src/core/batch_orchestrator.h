// src/core/batch_orchestrator.h
// Module implementation.
#pragma once
#include <stdint.h>
#include <string>
#include <vector>

#include "core/audio_sink.h"
#include "core/relay_error.h"
#include "tts/edge_tts.h"

struct BatchResult {
  bool ok = false;
  RelayError kind = RelayError::None;
  int http = 0;            // provider status of the failing chunk
  std::string err;
  std::string body;        // provider error body (clamped)
  uint32_t windows = 0;    // windows fully resolved
  int failedChunk = -1;    // index of the first failing chunk (chunk order)
  size_t bytesOut = 0;
  std::vector<uint8_t> audio; // buffered mode only; empty on failure
};

// Drives chunks through a SpeechSynthesizer in sequential windows of at most
// `concurrency` chunks. Inside a window every chunk runs on its own thread and the
// window is joined before the next one starts. Output is always in chunk order.
//
// sink == nullptr : buffered, BatchResult::audio holds the concatenation (all or nothing)
// sink != nullptr : streamed, each resolved window is written to the sink before the
//                   next one is dispatched; sink->close() is called on every path,
//                   sink->error() before it when the run failed
class BatchOrchestrator {
public:
  explicit BatchOrchestrator(SpeechSynthesizer& synth);

  BatchResult run(const std::vector<std::string>& chunks, uint32_t concurrency,
                  const VoiceParams& params, AudioSink* sink = nullptr);

  static uint32_t windowCount(size_t chunks, uint32_t concurrency);

private:
  void runWindow_(const std::vector<std::string>& chunks, size_t begin, size_t end,
                  const VoiceParams& params, std::vector<SynthResult>* out);

  SpeechSynthesizer& synth_;
};
