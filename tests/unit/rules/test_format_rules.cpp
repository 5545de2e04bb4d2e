#include <gtest/gtest.h>

#include "poexam/test_support/lint_helpers.hpp"

using poexam::Highlight;
using poexam::Severity;
using poexam::test_support::entry_po;
using poexam::test_support::lint;

TEST(FormatRules, InconsistentCFormats)
{
  const auto unit =
    lint(entry_po("Name: %s, age: %d", "Âge : %2$d, nom : %1$f", "c-format"), "c-formats");
  ASSERT_EQ(unit.diagnostics.size(), 1u);

  const auto & d = unit.diagnostics[0];
  EXPECT_EQ(d.rule, "c-formats");
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.message, "inconsistent C format strings");
  EXPECT_EQ(d.line(), 6u);
  ASSERT_EQ(d.lines.size(), 3u);
  EXPECT_EQ(d.lines[0].highlights, (std::vector<Highlight>{{6, 8}, {15, 17}}));
  EXPECT_EQ(d.lines[2].highlights.size(), 2u);
}

TEST(FormatRules, ReorderedPositionalSpecifiersAreConsistent)
{
  EXPECT_TRUE(
    lint(entry_po("%s has %d files", "%2$d fichiers pour %1$s", "c-format"), "c-formats")
      .diagnostics.empty());
}

TEST(FormatRules, OnlyEntriesWithTheFormatFlag)
{
  EXPECT_TRUE(lint(entry_po("%s", "%d"), "c-formats").diagnostics.empty());
  EXPECT_TRUE(lint(entry_po("%s", "%d", "python-format"), "c-formats").diagnostics.empty());
}

TEST(FormatRules, TrailingPercentIsIgnored)
{
  EXPECT_TRUE(lint(entry_po("100%", "100 %", "c-format"), "c-formats").diagnostics.empty());
  EXPECT_TRUE(
    lint(entry_po("Progress: %d%", "Progression : %d %", "c-format"), "c-formats")
      .diagnostics.empty());
}

TEST(FormatRules, PythonFormats)
{
  const auto unit =
    lint(entry_po("Hello %(name)s", "Bonjour %(nom)s", "python-format"), "python-formats");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  EXPECT_EQ(unit.diagnostics[0].message, "inconsistent Python format strings");

  EXPECT_TRUE(
    lint(entry_po("{0} of {1}", "{0} sur {1}", "python-brace-format"), "python-formats")
      .diagnostics.empty());
  EXPECT_EQ(
    lint(entry_po("{0} of {1}", "{0} sur", "python-brace-format"), "python-formats")
      .diagnostics.size(),
    1u);
}
