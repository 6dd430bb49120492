#include <gtest/gtest.h>

#include "source_index.h"

namespace {

TEST(SourceIndexTest, AsciiLinesAndColumns) {
  SourceIndex index("ab\ncd");
  EXPECT_EQ(index.lineCount(), 2u);

  size_t off = 0;
  ASSERT_TRUE(index.toOffset(1, 0, off));
  EXPECT_EQ(off, 0u);
  ASSERT_TRUE(index.toOffset(2, 1, off));
  EXPECT_EQ(off, 4u);
  // one past the last unit is the end of the text
  ASSERT_TRUE(index.toOffset(2, 2, off));
  EXPECT_EQ(off, 5u);
}

TEST(SourceIndexTest, CrLfIsOneTerminator) {
  SourceIndex index("a\r\nb\rc");
  EXPECT_EQ(index.lineCount(), 3u);

  size_t off = 0;
  ASSERT_TRUE(index.toOffset(2, 0, off));
  EXPECT_EQ(off, 3u);
  ASSERT_TRUE(index.toOffset(3, 0, off));
  EXPECT_EQ(off, 5u);
}

TEST(SourceIndexTest, UnicodeLineSeparators) {
  // U+2028 and U+2029 end lines too
  SourceIndex index("a\xE2\x80\xA8" "b\xE2\x80\xA9" "c");
  EXPECT_EQ(index.lineCount(), 3u);

  size_t off = 0;
  ASSERT_TRUE(index.toOffset(2, 0, off));
  EXPECT_EQ(off, 4u);
  ASSERT_TRUE(index.toOffset(3, 0, off));
  EXPECT_EQ(off, 8u);
}

TEST(SourceIndexTest, MultiByteColumnsCountUtf16Units) {
  // "é" is two bytes and one unit, the emoji four bytes and two units
  SourceIndex index("\xC3\xA9=\xF0\x9F\x98\x80;");
  EXPECT_EQ(index.utf16().size(), 5u);

  size_t off = 0;
  ASSERT_TRUE(index.toOffset(1, 1, off));
  EXPECT_EQ(off, 2u);
  ASSERT_TRUE(index.toOffset(1, 4, off));
  EXPECT_EQ(off, 7u);
}

TEST(SourceIndexTest, RejectsPositionsOutsideText) {
  SourceIndex index("x\ny");
  size_t off = 0;
  EXPECT_FALSE(index.toOffset(0, 0, off));
  EXPECT_FALSE(index.toOffset(3, 0, off));
  EXPECT_FALSE(index.toOffset(2, 5, off));
}

TEST(SourceIndexTest, InvalidUtf8BecomesReplacementCharacter) {
  SourceIndex index("a\xFFz");
  ASSERT_EQ(index.utf16().size(), 3u);
  EXPECT_EQ(index.utf16()[1], char16_t(0xFFFD));
}

TEST(SourceIndexTest, Utf16ToUtf8RestoresText) {
  std::string text = "var s = '\xC3\xA9\xF0\x9F\x98\x80';";
  SourceIndex index(text);
  EXPECT_EQ(utf16ToUtf8(index.utf16()), text);
}

TEST(SourceIndexTest, LoneSurrogateIsReplaced) {
  std::u16string s;
  s.push_back(char16_t(0xD800));
  s.push_back(u'a');
  EXPECT_EQ(utf16ToUtf8(s), "\xEF\xBF\xBD" "a");
}

}  // namespace
