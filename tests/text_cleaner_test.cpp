// tests/text_cleaner_test.cpp
#include <gtest/gtest.h>

#include "text/text_cleaner.h"

namespace {

CleaningOptions allOff() {
  CleaningOptions o;
  o.removeMarkdown = false;
  o.removeEmoji = false;
  o.removeUrls = false;
  o.removeLineBreaks = false;
  o.removeCitationNumbers = false;
  return o;
}

TEST(TextCleaner, UrlRemovalBeforeAndAfterCollapse) {
  CleaningOptions o = allOff();
  o.removeUrls = true;
  EXPECT_EQ(TextCleaner::clean("See https://example.com now", o), "See  now");
  o.removeLineBreaks = true;
  EXPECT_EQ(TextCleaner::clean("See https://example.com now", o), "See now");
}

TEST(TextCleaner, MarkdownKeepsLinkLabels) {
  CleaningOptions o = allOff();
  o.removeMarkdown = true;
  o.removeLineBreaks = true;
  const std::string in =
      "# Title\n**bold** and *it* with `code` and [link](http://x.y) ![img](a.png)";
  EXPECT_EQ(TextCleaner::clean(in, o), "Title bold and it with code and link");
}

TEST(TextCleaner, UnclosedMarkupIsLeftAlone) {
  CleaningOptions o = allOff();
  o.removeMarkdown = true;
  EXPECT_EQ(TextCleaner::clean("2 * 3 = 6 and [not a link", o), "2 * 3 = 6 and [not a link");
}

TEST(TextCleaner, EmojiPresentationRemoved) {
  CleaningOptions o = allOff();
  o.removeEmoji = true;
  o.removeLineBreaks = true;
  EXPECT_EQ(TextCleaner::clean("Hi \xF0\x9F\x98\x80 there \xE2\x9C\x85", o), "Hi there");
  EXPECT_TRUE(TextCleaner::isEmojiPresentation(0x1F600));
  EXPECT_FALSE(TextCleaner::isEmojiPresentation('A'));
  EXPECT_FALSE(TextCleaner::isEmojiPresentation(0x4F60)); // 你
}

TEST(TextCleaner, CitationNumbersBeforePunctuation) {
  CleaningOptions o = allOff();
  o.removeCitationNumbers = true;
  EXPECT_EQ(TextCleaner::clean("This is true 12. Another 3\xE3\x80\x82", o),
            "This is true. Another\xE3\x80\x82");
  EXPECT_EQ(TextCleaner::clean("Year 2024.", o), "Year 2024.");
  EXPECT_EQ(TextCleaner::clean("see note 7", o), "see note");
}

TEST(TextCleaner, CustomKeywordsAreLiterals) {
  CleaningOptions o = allOff();
  o.customKeywords = "a.b, (c)";
  EXPECT_EQ(TextCleaner::clean("a.b (c) [x] hello", o), "[x] hello");
  EXPECT_EQ(TextCleaner::clean("axb a.b", o), "axb");
}

TEST(TextCleaner, EscapeRegexEscapesMetacharacters) {
  EXPECT_EQ(TextCleaner::escapeRegex("a.b*c"), "a\\.b\\*c");
  EXPECT_EQ(TextCleaner::escapeRegex("plain"), "plain");
}

TEST(TextCleaner, MegabyteUrlAndWhitespaceRuns) {
  const CleaningOptions o;
  const std::string url = "see https://" + std::string(1 << 20, 'a') + " now";
  EXPECT_EQ(TextCleaner::clean(url, o), "see now");
  const std::string gap = "a" + std::string(1 << 20, ' ') + "b";
  EXPECT_EQ(TextCleaner::clean(gap, o), "a b");
  const std::string cites = std::string(1 << 20, '\n') + "x 1.";
  EXPECT_EQ(TextCleaner::clean(cites, o), "x.");
}

TEST(TextCleaner, UnicodeWhitespaceEndsUrlsAndCollapses) {
  const CleaningOptions o;
  // 请访问 https://a.com<U+3000>然后继续说。 end
  const std::string in =
      "\xE8\xAF\xB7\xE8\xAE\xBF\xE9\x97\xAE https://a.com\xE3\x80\x80"
      "\xE7\x84\xB6\xE5\x90\x8E\xE7\xBB\xA7\xE7\xBB\xAD\xE8\xAF\xB4\xE3\x80\x82 end";
  EXPECT_EQ(TextCleaner::clean(in, o),
            "\xE8\xAF\xB7\xE8\xAE\xBF\xE9\x97\xAE "
            "\xE7\x84\xB6\xE5\x90\x8E\xE7\xBB\xA7\xE7\xBB\xAD\xE8\xAF\xB4\xE3\x80\x82 end");

  CleaningOptions ws = allOff();
  ws.removeLineBreaks = true;
  EXPECT_EQ(TextCleaner::clean("a\xC2\xA0\xC2\xA0\xE3\x80\x80 b", ws), "a b");

  CleaningOptions cite = allOff();
  cite.removeCitationNumbers = true;
  EXPECT_EQ(TextCleaner::clean("done\xE3\x80\x80" "12\xEF\xBC\x8C next", cite),
            "done\xEF\xBC\x8C next");
}

TEST(TextCleaner, HeadingMarkerBeforeIdeographicSpace) {
  CleaningOptions o = allOff();
  o.removeMarkdown = true;
  EXPECT_EQ(TextCleaner::clean("##\xE3\x80\x80Title", o), "Title");
}

TEST(TextCleaner, EmptyInput) {
  EXPECT_EQ(TextCleaner::clean("", CleaningOptions()), "");
}

TEST(TextCleaner, IdempotentOnCleanOutput) {
  const CleaningOptions o;
  const std::string once =
      TextCleaner::clean("**Hello** world 3. Visit https://a.b/c \xF0\x9F\x98\x80\n\nBye", o);
  EXPECT_EQ(TextCleaner::clean(once, o), once);
}

} // namespace
