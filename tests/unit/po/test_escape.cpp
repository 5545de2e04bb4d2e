#include <gtest/gtest.h>

#include "poexam/po/escape.hpp"

using poexam::po::escape;
using poexam::po::unescape;

TEST(PoEscape, UnescapesKnownSequences)
{
  const auto r = unescape(R"(a\nb\tc\"d\\e)");
  EXPECT_EQ(r.value, "a\nb\tc\"d\\e");
  EXPECT_TRUE(r.unknown_sequences.empty());
}

TEST(PoEscape, OctalAndHexEscapes)
{
  EXPECT_EQ(unescape(R"(\101\x42)").value, "AB");
}

TEST(PoEscape, UnknownSequencesAreKeptAndReported)
{
  const auto r = unescape(R"(a\qb)");
  EXPECT_EQ(r.value, "a\\qb");
  ASSERT_EQ(r.unknown_sequences.size(), 1u);
  EXPECT_EQ(r.unknown_sequences[0].text, "\\q");
  EXPECT_EQ(r.unknown_sequences[0].offset, 1u);
}

TEST(PoEscape, TrailingBackslashIsKept)
{
  EXPECT_EQ(unescape("abc\\").value, "abc\\");
}

TEST(PoEscape, EscapeIsTheInverseForCommonCharacters)
{
  const std::string value = "line 1\nsay \"hi\"\t\\";
  EXPECT_EQ(escape(value), R"(line 1\nsay \"hi\"\t\\)");
  EXPECT_EQ(unescape(escape(value)).value, value);
}
