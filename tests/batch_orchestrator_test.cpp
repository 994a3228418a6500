// tests/batch_orchestrator_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "core/batch_orchestrator.h"
#include "test_support.h"

using namespace trtest;

namespace {

std::vector<std::string> makeChunks(int n) {
  std::vector<std::string> v;
  for (int i = 0; i < n; i++) v.push_back("c" + std::to_string(i) + ";");
  return v;
}

std::string joined(const std::vector<std::string>& v) {
  std::string s;
  for (const std::string& x : v) s += x;
  return s;
}

int chunkIndex(const std::string& text) {
  return std::stoi(text.substr(1));
}

// later chunks of a window finish first
SynthResult reverseOrderAudio(const std::string& text, int concurrency) {
  const int pos = chunkIndex(text) % concurrency;
  std::this_thread::sleep_for(std::chrono::milliseconds(5 * (concurrency - pos)));
  SynthResult r;
  r.ok = true;
  r.audio.assign(text.begin(), text.end());
  return r;
}

TEST(BatchOrchestrator, WindowCount) {
  EXPECT_EQ(BatchOrchestrator::windowCount(0, 3), 0u);
  EXPECT_EQ(BatchOrchestrator::windowCount(10, 3), 4u);
  EXPECT_EQ(BatchOrchestrator::windowCount(9, 3), 3u);
  EXPECT_EQ(BatchOrchestrator::windowCount(5, 0), 5u);
}

TEST(BatchOrchestrator, BufferedOutputKeepsChunkOrder) {
  const std::vector<std::string> chunks = makeChunks(10);
  FakeSynthesizer synth([](const std::string& t) { return reverseOrderAudio(t, 3); });
  BatchOrchestrator orch(synth);

  BatchResult r = orch.run(chunks, 3, VoiceParams());
  ASSERT_TRUE(r.ok) << r.err;
  EXPECT_EQ(r.windows, 4u);
  EXPECT_EQ(std::string(r.audio.begin(), r.audio.end()), joined(chunks));
  EXPECT_LE(synth.maxInFlight(), 3);
}

TEST(BatchOrchestrator, WindowsRunStrictlyInSequence) {
  const std::vector<std::string> chunks = makeChunks(7);
  FakeSynthesizer synth([](const std::string& t) { return reverseOrderAudio(t, 3); });
  BatchOrchestrator orch(synth);

  ASSERT_TRUE(orch.run(chunks, 3, VoiceParams()).ok);

  const std::vector<FakeSynthesizer::Call> calls = synth.calls();
  ASSERT_EQ(calls.size(), 7u);
  for (const auto& a : calls) {
    for (const auto& b : calls) {
      const int wa = chunkIndex(a.text) / 3;
      const int wb = chunkIndex(b.text) / 3;
      if (wa < wb) EXPECT_LT(a.endSeq, b.startSeq) << a.text << " vs " << b.text;
    }
  }
}

TEST(BatchOrchestrator, BufferedFailureReturnsNoAudio) {
  const std::vector<std::string> chunks = makeChunks(9);
  FakeSynthesizer synth([](const std::string& t) {
    if (chunkIndex(t) == 4) return providerFailure(500, "boom");
    SynthResult r;
    r.ok = true;
    r.audio.assign(t.begin(), t.end());
    return r;
  });
  BatchOrchestrator orch(synth);

  BatchResult r = orch.run(chunks, 3, VoiceParams());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.kind, RelayError::Provider);
  EXPECT_EQ(r.http, 500);
  EXPECT_EQ(r.body, "boom");
  EXPECT_EQ(r.failedChunk, 4);
  EXPECT_EQ(r.windows, 1u);
  EXPECT_TRUE(r.audio.empty());
  EXPECT_EQ(synth.calls().size(), 6u); // third window never dispatched
}

TEST(BatchOrchestrator, FirstFailureInChunkOrderWins) {
  const std::vector<std::string> chunks = makeChunks(3);
  FakeSynthesizer synth([](const std::string& t) {
    const int i = chunkIndex(t);
    if (i == 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      return providerFailure(400, "first");
    }
    if (i == 2) return providerFailure(503, "second");
    SynthResult r;
    r.ok = true;
    return r;
  });
  BatchOrchestrator orch(synth);

  BatchResult r = orch.run(chunks, 3, VoiceParams());
  EXPECT_EQ(r.failedChunk, 1);
  EXPECT_EQ(r.http, 400);
}

TEST(BatchOrchestrator, StreamedWritesEachWindowAndCloses) {
  const std::vector<std::string> chunks = makeChunks(5);
  FakeSynthesizer synth([](const std::string& t) { return reverseOrderAudio(t, 2); });
  BatchOrchestrator orch(synth);
  RecordingSink sink;

  BatchResult r = orch.run(chunks, 2, VoiceParams(), &sink);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.windows, 3u);
  EXPECT_EQ(sink.bytes, joined(chunks));
  EXPECT_EQ(sink.writeCalls, 5);
  EXPECT_EQ(sink.errorCalls, 0);
  EXPECT_EQ(sink.closeCalls, 1);
}

TEST(BatchOrchestrator, StreamedProviderFailureTruncatesAfterFlushedWindows) {
  const std::vector<std::string> chunks = makeChunks(6);
  FakeSynthesizer synth([](const std::string& t) {
    if (chunkIndex(t) == 3) return providerFailure(502, "bad gateway");
    SynthResult r;
    r.ok = true;
    r.audio.assign(t.begin(), t.end());
    return r;
  });
  BatchOrchestrator orch(synth);
  RecordingSink sink;

  BatchResult r = orch.run(chunks, 2, VoiceParams(), &sink);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.kind, RelayError::Provider);
  EXPECT_EQ(sink.bytes, "c0;c1;");
  EXPECT_EQ(sink.errorCalls, 1);
  EXPECT_EQ(sink.closeCalls, 1);
  EXPECT_EQ(synth.calls().size(), 4u);
}

TEST(BatchOrchestrator, SinkWriteFailureStopsFurtherSynthesis) {
  const std::vector<std::string> chunks = makeChunks(6);
  FakeSynthesizer synth;
  BatchOrchestrator orch(synth);
  RecordingSink sink;
  sink.failFromWrite = 1;

  BatchResult r = orch.run(chunks, 2, VoiceParams(), &sink);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.kind, RelayError::Sink);
  EXPECT_EQ(synth.calls().size(), 2u);
  EXPECT_EQ(sink.errorCalls, 1);
  EXPECT_EQ(sink.closeCalls, 1);
}

TEST(BatchOrchestrator, EmptyInputStillClosesSink) {
  FakeSynthesizer synth;
  BatchOrchestrator orch(synth);
  RecordingSink sink;

  BatchResult r = orch.run({}, 4, VoiceParams(), &sink);
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.windows, 0u);
  EXPECT_EQ(sink.writeCalls, 0);
  EXPECT_EQ(sink.closeCalls, 1);
}

TEST(BatchOrchestrator, ParamsReachEverySynthesisCall) {
  FakeSynthesizer synth;
  BatchOrchestrator orch(synth);
  VoiceParams p;
  p.voice = "zh-CN-YunxiNeural";
  p.ratePct = 25;

  ASSERT_TRUE(orch.run(makeChunks(2), 5, p).ok);
  EXPECT_EQ(synth.lastParams().voice, "zh-CN-YunxiNeural");
  EXPECT_EQ(synth.lastParams().ratePct, 25);
}

} // namespace
