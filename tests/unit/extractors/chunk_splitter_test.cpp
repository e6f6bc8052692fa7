#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docsearch_core/extractors/chunk_splitter.hpp"

namespace docsearch_core {

class ChunkSplitterTest : public ::testing::Test {
 protected:
  static std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
      if (i > 0) out += '\n';
      out += parts[i];
    }
    return out;
  }

  static std::string last_chars(const std::string& text, size_t n) {
    return text.substr(text.size() - n);
  }
};

TEST_F(ChunkSplitterTest, EmptyInputYieldsNoChunks) {
  EXPECT_TRUE(ChunkSplitter::split("").empty());
  EXPECT_TRUE(ChunkSplitter::split("   \n\t\n  \r\n").empty());
}

TEST_F(ChunkSplitterTest, ShortTextIsSingleChunk) {
  auto chunks = ChunkSplitter::split("First line\nSecond line", 1500, 200);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "First line\nSecond line");
}

TEST_F(ChunkSplitterTest, DropsBlankLinesAndTrimsParagraphs) {
  auto paragraphs = ChunkSplitter::paragraphs("  foo  \n\n \t \n\tbar\r\n   baz");
  ASSERT_EQ(paragraphs.size(), 3u);
  EXPECT_EQ(paragraphs[0], "foo");
  EXPECT_EQ(paragraphs[1], "bar");
  EXPECT_EQ(paragraphs[2], "baz");

  auto chunks = ChunkSplitter::split("  foo  \n\n \t \n\tbar\r\n   baz");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "foo\nbar\nbaz");
}

TEST_F(ChunkSplitterTest, ThreeParagraphsSplitWithOverlapCarriedForward) {
  const std::string a(100, 'a');
  const std::string b(100, 'b');
  const std::string c(100, 'c');

  auto chunks = ChunkSplitter::split(a + "\n" + b + "\n" + c, 250, 50);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], a + "\n" + b);
  EXPECT_EQ(chunks[1], last_chars(a + "\n" + b, 50) + "\n" + c);
  EXPECT_EQ(chunks[1], std::string(50, 'b') + "\n" + c);
}

TEST_F(ChunkSplitterTest, SeparatorCountsTowardsLimit) {
  // 10 + 1 + 9 == 20 fits; one more character does not
  auto fits = ChunkSplitter::split(std::string(10, 'x') + "\n" + std::string(9, 'y'), 20, 5);
  EXPECT_EQ(fits.size(), 1u);

  auto splits = ChunkSplitter::split(std::string(10, 'x') + "\n" + std::string(10, 'y'), 20, 5);
  EXPECT_EQ(splits.size(), 2u);
}

TEST_F(ChunkSplitterTest, OverlapMayCutMidWord) {
  auto chunks = ChunkSplitter::split("abcdefghij\nklmnopqrst", 20, 3);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "abcdefghij");
  EXPECT_EQ(chunks[1], "hij\nklmnopqrst");
}

TEST_F(ChunkSplitterTest, OversizedParagraphBecomesOneChunk) {
  const std::string big(300, 'z');

  auto alone = ChunkSplitter::split(big, 100, 20);
  ASSERT_EQ(alone.size(), 1u);
  EXPECT_EQ(alone[0], big);

  auto after_short = ChunkSplitter::split("short\n" + big, 100, 20);
  ASSERT_EQ(after_short.size(), 2u);
  EXPECT_EQ(after_short[0], "short");
  EXPECT_EQ(after_short[1], "short\n" + big);
}

TEST_F(ChunkSplitterTest, ZeroOverlapStartsNextChunkWithSeparator) {
  auto chunks = ChunkSplitter::split("aaaa\nbbbb", 6, 0);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "aaaa");
  EXPECT_EQ(chunks[1], "\nbbbb");
}

TEST_F(ChunkSplitterTest, OverlapLongerThanChunkCarriesWholeChunk) {
  auto chunks = ChunkSplitter::split("abc\ndefgh", 6, 50);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "abc");
  EXPECT_EQ(chunks[1], "abc\ndefgh");
}

TEST_F(ChunkSplitterTest, CountsCodePointsNotBytes) {
  // Six two-byte characters count as six
  const std::string accents = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";

  auto fits = ChunkSplitter::split(accents + "\nx", 8, 2);
  ASSERT_EQ(fits.size(), 1u);

  auto chunks = ChunkSplitter::split(accents + "\nxyz", 8, 2);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], accents);
  EXPECT_EQ(chunks[1], "\xC3\xA9\xC3\xA9\nxyz");
}

TEST_F(ChunkSplitterTest, TrimsUnicodeWhitespace) {
  // NO-BREAK SPACE and IDEOGRAPHIC SPACE around the text
  auto paragraphs = ChunkSplitter::paragraphs("\xC2\xA0GPIO\xE3\x80\x80\n\xE3\x80\x80");
  ASSERT_EQ(paragraphs.size(), 1u);
  EXPECT_EQ(paragraphs[0], "GPIO");
}

TEST_F(ChunkSplitterTest, RepairsInvalidUtf8) {
  auto chunks = ChunkSplitter::split(std::string("ok\n\xFF\xFE broken"), 1500, 200);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].find('\xFF'), std::string::npos);
  EXPECT_NE(chunks[0].find("broken"), std::string::npos);
}

TEST_F(ChunkSplitterTest, ResplittingJoinedParagraphsIsDeterministic) {
  std::string text;
  for (int i = 0; i < 60; ++i) {
    text += "  Register " + std::to_string(i) + " controls the " + std::string(i % 17 + 3, 'q') +
            " peripheral clock.  \n";
    if (i % 7 == 0) text += "\n   \n";
  }

  auto first = ChunkSplitter::split(text, 200, 40);
  auto second = ChunkSplitter::split(join(ChunkSplitter::paragraphs(text)), 200, 40);

  EXPECT_GT(first.size(), 1u);
  EXPECT_EQ(first, second);
}

TEST_F(ChunkSplitterTest, EveryParagraphAppearsInSomeChunk) {
  std::string text;
  for (int i = 0; i < 40; ++i) {
    text += "Paragraph number " + std::to_string(i) + " with some reference manual text.\n";
  }

  auto chunks = ChunkSplitter::split(text, 150, 30);
  for (const auto& paragraph : ChunkSplitter::paragraphs(text)) {
    bool found = false;
    for (const auto& chunk : chunks) {
      if (chunk.find(paragraph) != std::string::npos) {
        found = true;
        break;
      }
    }
    EXPECT_TRUE(found) << "Missing paragraph: " << paragraph;
  }
}

}  // namespace docsearch_core
