// tests/ssml_builder_test.cpp
#include <gtest/gtest.h>

#include "tts/ssml_builder.h"

namespace {

TEST(SsmlBuilder, WrapsEscapedTextInVoiceStyleProsody) {
  const std::string ssml =
      SsmlBuilder::build("Hi & <you>", "zh-CN-XiaoxiaoNeural", 10, -20, "general");
  EXPECT_EQ(ssml,
            "<speak xmlns=\"http://www.w3.org/2001/10/synthesis\" "
            "xmlns:mstts=\"http://www.w3.org/2001/mstts\" version=\"1.0\" xml:lang=\"en-US\">"
            "<voice name=\"zh-CN-XiaoxiaoNeural\"><mstts:express-as style=\"general\">"
            "<prosody rate=\"10%\" pitch=\"-20%\">Hi &amp; &lt;you&gt;</prosody>"
            "</mstts:express-as></voice></speak>");
}

TEST(SsmlBuilder, PauseTagsKeptVerbatim) {
  EXPECT_EQ(SsmlBuilder::escapeText("a <break time=\"500ms\"/> b <BREAK/> c < d"),
            "a <break time=\"500ms\"/> b <BREAK/> c &lt; d");
  EXPECT_EQ(SsmlBuilder::escapeText("x<break time='1s'>y"), "x<break time='1s'>y");
  EXPECT_EQ(SsmlBuilder::escapeText("<breakfast>"), "&lt;breakfast&gt;");
}

TEST(SsmlBuilder, UnterminatedPauseTagOverLongTextIsEscaped) {
  const std::string tail(200000, 'a');
  const std::string out = SsmlBuilder::escapeText("<break time=\"" + tail);
  EXPECT_EQ(out, "&lt;break time=\"" + tail);

  EXPECT_EQ(SsmlBuilder::escapeText("<break time=\"1s <break/>"), "&lt;break time=\"1s <break/>");
  EXPECT_EQ(SsmlBuilder::escapeText("<Break Time=\"2s\" />"), "<Break Time=\"2s\" />");
  EXPECT_EQ(SsmlBuilder::escapeText("<break time=\"1s\" x>"), "&lt;break time=\"1s\" x&gt;");
}

TEST(SsmlBuilder, QuotesInTextStayQuotesInAttributesAreEscaped) {
  EXPECT_EQ(SsmlBuilder::escapeText("say \"hi\" & 'bye'"), "say \"hi\" &amp; 'bye'");
  const std::string ssml = SsmlBuilder::build("t", "a\"b", 0, 0, "x<y");
  EXPECT_NE(ssml.find("<voice name=\"a&quot;b\">"), std::string::npos);
  EXPECT_NE(ssml.find("style=\"x&lt;y\""), std::string::npos);
  EXPECT_NE(ssml.find("rate=\"0%\" pitch=\"0%\""), std::string::npos);
}

} // namespace
