#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/report/json_output.hpp"
#include "poexam/report/stats_printer.hpp"
#include "poexam/test_support/lint_helpers.hpp"
#include "poexam/text/unicode.hpp"

using nlohmann::json;
using poexam::Diagnostic;
using poexam::DiagnosticBag;
using poexam::DiagnosticField;
using poexam::Severity;
using poexam::report::FileStats;
using poexam::report::StatsPrinter;
using poexam::report::TextCounts;
using poexam::report::to_json;

TEST(JsonOutput, DiagnosticFields)
{
  DiagnosticBag bag;
  bag.report("po/fr.po", "brackets", Severity::Info, "missing square brackets")
    .with_line(DiagnosticField::source(), 5, "Test [brackets]", {{5, 6}})
    .with_separator()
    .with_line(DiagnosticField::translation(0), 6, "Test brackets");
  const json j = to_json(bag.all().front());

  EXPECT_EQ(j["path"], "po/fr.po");
  EXPECT_EQ(j["rule"], "brackets");
  EXPECT_EQ(j["severity"], "info");
  EXPECT_EQ(j["message"], "missing square brackets");
  ASSERT_EQ(j["lines"].size(), 3u);
  EXPECT_EQ(j["lines"][0]["line_number"], 5);
  EXPECT_EQ(j["lines"][0]["message"], "Test [brackets]");
  EXPECT_EQ(j["lines"][0]["highlights"], json::parse("[[5, 6]]"));
  EXPECT_EQ(j["lines"][1]["line_number"], 0);
  EXPECT_EQ(j["lines"][1]["message"], "");
  EXPECT_TRUE(j["lines"][2]["highlights"].empty());
}

TEST(JsonOutput, HighlightsAreCharacterOffsets)
{
  DiagnosticBag bag;
  // "é" takes two bytes
  bag.report("a.po", "punc-end", Severity::Info, "m")
    .with_line(DiagnosticField::translation(0), 3, "\xc3\xa9t\xc3\xa9 !", {{5, 7}});
  const json j = to_json(bag.all().front());
  EXPECT_EQ(j["lines"][0]["highlights"], json::parse("[[3, 5]]"));
}

TEST(JsonOutput, SyntaxErrorWithInvalidUtf8CanBeDumped)
{
  const auto unit = poexam::test_support::lint(
    "msgid \"a\"\nmsgstr \"b\"\n\n\xE9t\xE9 \"x\"\n", "blank");
  ASSERT_EQ(unit.diagnostics.size(), 1u);
  const Diagnostic & d = unit.diagnostics.front();
  EXPECT_EQ(d.rule, "syntax-error");
  EXPECT_TRUE(poexam::text::is_valid_utf8(d.message));
  EXPECT_EQ(d.message, "unknown keyword '\xEF\xBF\xBDt\xEF\xBF\xBD'");

  std::string dumped;
  EXPECT_NO_THROW(dumped = to_json(d).dump());
  EXPECT_NE(dumped.find("unknown keyword"), std::string::npos);
}

TEST(JsonOutput, SeverityNames)
{
  DiagnosticBag bag;
  bag.report("a.po", "encoding", Severity::Error, "e");
  bag.report("a.po", "blank", Severity::Warning, "w");
  const json j = to_json(bag.take());

  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["severity"], "error");
  EXPECT_EQ(j[1]["severity"], "warning");
  EXPECT_TRUE(j[0]["lines"].empty());
}

TEST(JsonOutput, EmptyDiagnosticListIsAnArray)
{
  const json j = to_json(std::vector<Diagnostic>{});
  EXPECT_EQ(j.dump(), "[]");
}

TEST(JsonOutput, StatsWithoutWords)
{
  FileStats s;
  s.path = "po/de.po";
  s.entries.total = 4;
  s.entries.translated = 2;
  s.entries.fuzzy = 1;
  s.entries.untranslated = 1;
  const json j = to_json(s);

  EXPECT_EQ(j["path"], "po/de.po");
  EXPECT_EQ(j["entries"]["total"], 4);
  EXPECT_EQ(j["entries"]["translated"], 2);
  EXPECT_EQ(j["entries"]["fuzzy"], 1);
  EXPECT_EQ(j["entries"]["untranslated"], 1);
  EXPECT_EQ(j["entries"]["obsolete"], 0);
  EXPECT_FALSE(j.contains("words"));
  EXPECT_FALSE(j.contains("chars"));
}

TEST(JsonOutput, StatsWithWords)
{
  FileStats s;
  s.path = "po/de.po";
  TextCounts words;
  words.id_total = 7;
  words.id_translated = 2;
  words.str_translated = 3;
  s.words = words;
  s.chars = TextCounts{};
  const json j = to_json(s);

  EXPECT_EQ(j["words"]["id_total"], 7);
  EXPECT_EQ(j["words"]["id_translated"], 2);
  EXPECT_EQ(j["words"]["str_translated"], 3);
  EXPECT_EQ(j["chars"]["id_total"], 0);
}

TEST(JsonOutput, StatsPrinterWritesOneLine)
{
  FileStats s;
  s.path = "po/de.po";
  std::ostringstream os;
  StatsPrinter printer(os, false);
  printer.print_json({s});

  const std::string out = os.str();
  ASSERT_FALSE(out.empty());
  EXPECT_EQ(out.back(), '\n');
  const json j = json::parse(out);
  ASSERT_TRUE(j.is_array());
  EXPECT_EQ(j[0]["path"], "po/de.po");
}
