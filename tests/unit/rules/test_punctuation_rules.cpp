#include <gtest/gtest.h>

#include <string>

#include "poexam/test_support/lint_helpers.hpp"

using poexam::Highlight;
using poexam::test_support::entry_po;
using poexam::test_support::lint;

TEST(PunctuationRules, TrailingPunctuation)
{
  const auto unit = lint(entry_po("Hello!", "Bonjour"), "punc-end");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].message, "inconsistent trailing punctuation ('!' / '')");
  EXPECT_EQ(unit.diagnostics[0].lines[0].highlights, (std::vector<Highlight>{{5, 6}}));
}

TEST(PunctuationRules, EquivalentPunctuationOfOtherScripts)
{
  EXPECT_TRUE(lint(entry_po("Wait...", "Attendez…"), "punc-end").diagnostics.empty());
  EXPECT_TRUE(lint(entry_po("Done.", "完成。"), "punc-end").diagnostics.empty());
  EXPECT_TRUE(lint(entry_po("Really?", "真的？"), "punc-end").diagnostics.empty());
  EXPECT_TRUE(lint(entry_po("Name:", "Nom :"), "punc-end").diagnostics.empty());
}

TEST(PunctuationRules, GreekQuestionMark)
{
  const std::string src =
    "msgid \"\"\n"
    "msgstr \"Language: el\\n\"\n"
    "\n"
    "msgid \"Why?\"\n"
    "msgstr \"Γιατί;\"\n";
  EXPECT_TRUE(lint(src, "punc-end").diagnostics.empty());
}

TEST(PunctuationRules, LeadingPunctuation)
{
  const auto unit = lint(entry_po("¿Qué?", "What?"), "punc-start");
  EXPECT_TRUE(unit.diagnostics.empty());

  const auto colon = lint(entry_po(": value", "valeur"), "punc-start");
  ASSERT_EQ(colon.diagnostics.size(), 1u);
  EXPECT_EQ(colon.diagnostics[0].message, "inconsistent leading punctuation (':' / '')");

  // Leading dots of file names may move
  EXPECT_TRUE(lint(entry_po(".hidden files", "fichiers .cachés"), "punc-start").diagnostics.empty());
}

TEST(PunctuationRules, Whitespace)
{
  const auto start = lint(entry_po(" a", "b"), "whitespace-start");
  ASSERT_EQ(start.diagnostics.size(), 1u);
  EXPECT_EQ(start.diagnostics[0].message, "inconsistent leading whitespace (' ' / '')");

  const auto end = lint(entry_po("a", "b  "), "whitespace-end");
  ASSERT_EQ(end.diagnostics.size(), 1u);
  EXPECT_EQ(end.diagnostics[0].message, "inconsistent trailing whitespace ('' / '  ')");
  EXPECT_EQ(end.diagnostics[0].lines[2].highlights, (std::vector<Highlight>{{1, 3}}));

  EXPECT_TRUE(lint(entry_po(" a ", " b "), "whitespace-start,whitespace-end").diagnostics.empty());
}

TEST(LengthRules, TooLongAndTooShort)
{
  const auto long_unit = lint(entry_po("Hi", "abcdefghijklmnopqrst"), "long,short");
  ASSERT_EQ(long_unit.diagnostics.size(), 1u);
  EXPECT_EQ(long_unit.diagnostics[0].rule, "long");
  EXPECT_EQ(long_unit.diagnostics[0].message, "translation too long (2 / 20)");

  const auto short_unit = lint(entry_po("OK", "x"), "long,short");
  ASSERT_EQ(short_unit.diagnostics.size(), 1u);
  EXPECT_EQ(short_unit.diagnostics[0].rule, "short");
  EXPECT_EQ(short_unit.diagnostics[0].message, "translation too short (2 / 1)");

  EXPECT_TRUE(lint(entry_po("Open", "Ouvrir"), "long,short").diagnostics.empty());
}

TEST(LengthRules, LengthsCountCharacters)
{
  // One character, two bytes
  EXPECT_TRUE(lint(entry_po("A", "é"), "long,short").diagnostics.empty());
}
