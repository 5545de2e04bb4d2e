#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/basic/diagnostic_printer.hpp"

using poexam::Diagnostic;
using poexam::DiagnosticBag;
using poexam::DiagnosticField;
using poexam::DiagnosticPrinter;
using poexam::Severity;

namespace
{

std::string print(const Diagnostic & diag)
{
  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print(diag);
  return os.str();
}

}  // namespace

TEST(DiagnosticPrinter, PrintsEntryLines)
{
  DiagnosticBag bag;
  bag.report("po/fr.po", "brackets", Severity::Info, "missing square brackets")
    .with_line(DiagnosticField::source(), 5, "Test [brackets]", {{5, 6}, {14, 15}})
    .with_separator()
    .with_line(DiagnosticField::translation(0), 6, "Test brackets");

  const std::string expected =
    "po/fr.po:5: [info:brackets] missing square brackets\n"
    "        |\n"
    "      5 | Test [brackets]\n"
    "        | \n"
    "      6 | Test brackets\n"
    "        |\n"
    "\n";
  EXPECT_EQ(print(bag.all().front()), expected);
}

TEST(DiagnosticPrinter, FileLevelDiagnosticHasNoLines)
{
  DiagnosticBag bag;
  bag.report("po/it.po", "encoding", Severity::Error, "unknown encoding: foo");

  EXPECT_EQ(print(bag.all().front()), "po/it.po: [error:encoding] unknown encoding: foo\n\n");
}

TEST(DiagnosticPrinter, MultiLineTextContinuesInGutter)
{
  DiagnosticBag bag;
  bag.report("a.po", "newlines", Severity::Warning, "different line feeds")
    .with_line(DiagnosticField::source(), 12, "first\nsecond\n");

  const std::string expected =
    "a.po:12: [warning:newlines] different line feeds\n"
    "        |\n"
    "     12 | first\n"
    "        | second\n"
    "        |\n"
    "\n";
  EXPECT_EQ(print(bag.all().front()), expected);
}

TEST(DiagnosticPrinter, PrintAllKeepsOrder)
{
  DiagnosticBag bag;
  bag.report("b.po", "blank", Severity::Warning, "second");
  bag.report("a.po", "blank", Severity::Warning, "first");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  const std::vector<Diagnostic> diags = bag.take();
  printer.print_all(diags);
  EXPECT_EQ(os.str(), "b.po: [warning:blank] second\n\na.po: [warning:blank] first\n\n");
}
