// tests/speech_request_test.cpp
#include <gtest/gtest.h>

#include "config/config.h"
#include "core/speech_request.h"

namespace {

SpeechDefaults defaults() {
  SpeechDefaults d;
  d.concurrency = 10;
  d.chunkSize = 300;
  d.outputFormat = "audio-24khz-48kbitrate-mono-mp3";
  return d;
}

TEST(SpeechRequest, MissingInputIsInvalidRequest) {
  ParsedSpeechRequest r = parseSpeechRequest("{\"model\":\"tts-1\"}", defaults());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.kind, RelayError::InvalidRequest);
  EXPECT_EQ(r.code, "invalid_request_error");
  EXPECT_EQ(r.param, "input");

  EXPECT_EQ(parseSpeechRequest("{\"input\":\"\"}", defaults()).param, "input");
  EXPECT_EQ(parseSpeechRequest("{\"input\":42}", defaults()).param, "input");
}

TEST(SpeechRequest, MalformedJson) {
  ParsedSpeechRequest r = parseSpeechRequest("{\"input\": ", defaults());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.code, "invalid_request_error");
  EXPECT_FALSE(parseSpeechRequest("[1,2]", defaults()).ok);
}

TEST(SpeechRequest, DefaultsApplied) {
  ParsedSpeechRequest r = parseSpeechRequest("{\"input\":\"hello\"}", defaults());
  ASSERT_TRUE(r.ok) << r.message;
  EXPECT_EQ(r.text, "hello");
  EXPECT_EQ(r.model, "tts-1");
  EXPECT_EQ(r.voice, "zh-CN-XiaoxiaoNeural");
  EXPECT_DOUBLE_EQ(r.speed, 1.0);
  EXPECT_DOUBLE_EQ(r.pitch, 1.0);
  EXPECT_EQ(r.style, "general");
  EXPECT_FALSE(r.stream);
  EXPECT_EQ(r.concurrency, 10u);
  EXPECT_EQ(r.chunkSize, 300u);
  EXPECT_TRUE(r.cleaning.removeMarkdown);
  EXPECT_TRUE(r.cleaning.removeUrls);
  EXPECT_TRUE(r.cleaning.customKeywords.empty());
}

TEST(SpeechRequest, VoiceResolution) {
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"model\":\"tts-1-nova\"}", defaults()).voice,
            "zh-CN-YunxiNeural");
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"voice\":\"echo\"}", defaults()).voice,
            "zh-CN-liaoning-XiaobeiNeural");
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"model\":\"tts-1-nova\",\"voice\":\"en-US-AriaNeural\"}",
                               defaults()).voice,
            "en-US-AriaNeural");

  ParsedSpeechRequest bad = parseSpeechRequest("{\"input\":\"x\",\"model\":\"tts-1-robot\"}", defaults());
  EXPECT_FALSE(bad.ok);
  EXPECT_EQ(bad.param, "voice");
}

TEST(SpeechRequest, SpeedRangeAndTypes) {
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"speed\":3.0}", defaults()).param, "speed");
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"speed\":0.1}", defaults()).param, "speed");
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"speed\":\"fast\"}", defaults()).param, "speed");
  EXPECT_TRUE(parseSpeechRequest("{\"input\":\"x\",\"speed\":0.25}", defaults()).ok);
  EXPECT_TRUE(parseSpeechRequest("{\"input\":\"x\",\"speed\":2}", defaults()).ok);
}

TEST(SpeechRequest, CountsMustBePositiveIntegers) {
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"concurrency\":0}", defaults()).param, "concurrency");
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"chunk_size\":-3}", defaults()).param, "chunk_size");
  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"chunk_size\":2.5}", defaults()).param, "chunk_size");

  ParsedSpeechRequest r = parseSpeechRequest("{\"input\":\"x\",\"concurrency\":1000,\"chunk_size\":50}", defaults());
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.concurrency, 64u);
  EXPECT_EQ(r.chunkSize, 50u);
}

TEST(SpeechRequest, OversizedChunkSizeIsClamped) {
  ParsedSpeechRequest r = parseSpeechRequest("{\"input\":\"x\",\"chunk_size\":100000000}", defaults());
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.chunkSize, (uint32_t)TR_MAX_CHUNK_SIZE);
}

TEST(SpeechRequest, PitchIsClampedToProsodyRange) {
  ParsedSpeechRequest r = parseSpeechRequest("{\"input\":\"x\",\"pitch\":1e300}", defaults());
  ASSERT_TRUE(r.ok);
  EXPECT_DOUBLE_EQ(r.pitch, 1.5);
  EXPECT_EQ(r.voiceParams().pitchPct, 50);

  r = parseSpeechRequest("{\"input\":\"x\",\"pitch\":-7}", defaults());
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.voiceParams().pitchPct, -50);

  EXPECT_EQ(trFactorToPercent(1e300), 10000);
  EXPECT_EQ(trFactorToPercent(-1e300), -10000);
}

TEST(SpeechRequest, CleaningOptionsOverrideDefaults) {
  ParsedSpeechRequest r = parseSpeechRequest(
      "{\"input\":\"x\",\"cleaning_options\":{\"remove_urls\":false,\"custom_keywords\":\"foo,bar\"}}",
      defaults());
  ASSERT_TRUE(r.ok);
  EXPECT_FALSE(r.cleaning.removeUrls);
  EXPECT_TRUE(r.cleaning.removeEmoji);
  EXPECT_EQ(r.cleaning.customKeywords, "foo,bar");

  EXPECT_EQ(parseSpeechRequest("{\"input\":\"x\",\"cleaning_options\":{\"remove_emoji\":\"yes\"}}",
                               defaults()).param,
            "cleaning_options");
}

TEST(SpeechRequest, ProsodyPercentConversion) {
  EXPECT_EQ(trFactorToPercent(1.0), 0);
  EXPECT_EQ(trFactorToPercent(1.5), 50);
  EXPECT_EQ(trFactorToPercent(0.8), -20);
  EXPECT_EQ(trFactorToPercent(0.25), -75);
  EXPECT_EQ(trFactorToPercent(1.1), 10);

  ParsedSpeechRequest r = parseSpeechRequest(
      "{\"input\":\"x\",\"speed\":1.25,\"pitch\":0.9,\"style\":\"sad\",\"stream\":true}", defaults());
  ASSERT_TRUE(r.ok);
  EXPECT_TRUE(r.stream);
  const VoiceParams p = r.voiceParams();
  EXPECT_EQ(p.ratePct, 25);
  EXPECT_EQ(p.pitchPct, -10);
  EXPECT_EQ(p.style, "sad");
  EXPECT_EQ(p.outputFormat, "audio-24khz-48kbitrate-mono-mp3");
}

TEST(SpeechRequest, AliasTable) {
  EXPECT_EQ(trVoiceAliases().size(), 6u);
  EXPECT_STREQ(trVoiceForAlias("alloy"), "zh-CN-YunyangNeural");
  EXPECT_EQ(trVoiceForAlias("nobody"), nullptr);
}

} // namespace
