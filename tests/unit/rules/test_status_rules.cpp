#include <gtest/gtest.h>

#include <string>

#include "poexam/test_support/lint_helpers.hpp"

using poexam::Highlight;
using poexam::Severity;
using poexam::engine::LintOptions;
using poexam::test_support::entry_po;
using poexam::test_support::lint;

TEST(StatusRules, BlankTranslation)
{
  const auto unit = lint(entry_po("Hello", " "), "blank");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].severity, Severity::Warning);
  EXPECT_EQ(unit.diagnostics[0].message, "blank translation");
  EXPECT_EQ(unit.diagnostics[0].lines[2].highlights, (std::vector<Highlight>{{0, 1}}));
}

TEST(StatusRules, ChangedAndUnchanged)
{
  EXPECT_EQ(lint(entry_po("Hello", "Bonjour"), "changed").count("changed"), 1u);
  EXPECT_EQ(lint(entry_po("Hello", "Hello"), "changed").count("changed"), 0u);

  const auto unit = lint(entry_po("Hello", "Hello"), "unchanged");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].message, "unchanged translation");

  // Nothing to translate without lowercase letters
  EXPECT_TRUE(lint(entry_po("OK", "OK"), "unchanged").diagnostics.empty());
}

TEST(StatusRules, UntranslatedEntries)
{
  const auto unit = lint(entry_po("Hello", ""), "untranslated");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].message, "untranslated message");

  // Other rules never see untranslated entries
  EXPECT_TRUE(lint(entry_po("Hello!", ""), "punc-end").diagnostics.empty());
}

TEST(StatusRules, FuzzyEntriesShowAllLines)
{
  const auto unit = lint(entry_po("Hello", "Bonjour", "fuzzy"), "fuzzy");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  const auto & d = unit.diagnostics[0];
  EXPECT_EQ(d.message, "fuzzy entry");
  ASSERT_EQ(d.lines.size(), 2u);
  EXPECT_EQ(d.lines[0].line_number, 6u);
  EXPECT_EQ(d.lines[0].text, "msgid \"Hello\"");
  EXPECT_EQ(d.lines[1].text, "msgstr \"Bonjour\"");
}

TEST(StatusRules, ObsoleteEntries)
{
  const std::string src =
    "#~ msgid \"Old\"\n"
    "#~ msgstr \"Ancien\"\n";
  const auto unit = lint(src, "obsolete");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].message, "obsolete entry");
  EXPECT_EQ(unit.diagnostics[0].lines[0].text, "#~ msgid \"Old\"");
}

TEST(StatusRules, PluralForms)
{
  const std::string src =
    "msgid \"\"\n"
    "msgstr \"\"\n"
    "\"Plural-Forms: nplurals=2; plural=(n != 1);\\n\"\n"
    "\n"
    "msgid \"file\"\n"
    "msgid_plural \"files\"\n"
    "msgstr[0] \"fichier\"\n";
  const auto unit = lint(src, "plurals");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].severity, Severity::Error);
  EXPECT_EQ(
    unit.diagnostics[0].message, "missing translated plural form (found: 1, expected: 2)");
  EXPECT_EQ(unit.diagnostics[0].lines.back().text, "msgstr[0] \"fichier\"");
}

TEST(StatusRules, UnknownEncodingIsAFileDiagnostic)
{
  const std::string src =
    "msgid \"\"\n"
    "msgstr \"Content-Type: text/plain; charset=FOO-1\\n\"\n"
    "\n"
    "msgid \"a\"\n"
    "msgstr \"b\"\n";
  const auto unit = lint(src, "encoding");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].message, "unknown encoding 'FOO-1'");
  EXPECT_TRUE(unit.diagnostics[0].lines.empty());
  EXPECT_EQ(unit.diagnostics[0].line(), 0u);
}

TEST(StatusRules, InvalidCharactersForEncoding)
{
  const auto unit = lint(entry_po("summer", "\xE9t\xE9"), "encoding");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].message, "invalid characters for encoding UTF-8");
}

TEST(StatusRules, FuzzyEntriesAreSkippedUnlessRequested)
{
  const std::string src = entry_po("Hello!", "Bonjour", "fuzzy");
  EXPECT_TRUE(lint(src, "punc-end").diagnostics.empty());

  LintOptions options;
  options.fuzzy = true;
  EXPECT_EQ(lint(src, "punc-end", options).diagnostics.size(), 1u);

  // Selecting the fuzzy rule checks fuzzy entries with every rule
  EXPECT_EQ(lint(src, "fuzzy,punc-end").diagnostics.size(), 2u);
}
