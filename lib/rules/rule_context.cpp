// poexam/rules/rule_context.cpp - What a rule hook sees and reports to
#include "poexam/rules/rule_context.hpp"

#include <utility>

namespace poexam::rules
{

RuleContext::RuleContext(std::string path, const po::Catalog & catalog, DiagnosticBag & diagnostics)
: path_(std::move(path)), catalog_(catalog), diagnostics_(diagnostics)
{
}

void RuleContext::report_file(std::string message)
{
  diagnostics_.report(path_, std::string(rule_), severity_, std::move(message));
}

void RuleContext::report_entry(const po::Entry & entry, std::string message)
{
  auto builder = diagnostics_.report(path_, std::string(rule_), severity_, std::move(message));
  for (auto & po_line : entry.to_po_lines()) {
    builder.with_line(DiagnosticField::none(), po_line.line, std::move(po_line.text));
  }
}

void RuleContext::report_ctxt(
  const MessageRef & msgctxt, std::vector<Highlight> highlights, std::string message)
{
  diagnostics_.report(path_, std::string(rule_), severity_, std::move(message))
    .with_line(msgctxt.field, msgctxt.line(), std::string(msgctxt.value()), std::move(highlights));
}

void RuleContext::report_msg(
  const MessageRef & msgid, std::vector<Highlight> id_highlights, const MessageRef & msgstr,
  std::vector<Highlight> str_highlights, std::string message)
{
  diagnostics_.report(path_, std::string(rule_), severity_, std::move(message))
    .with_line(msgid.field, msgid.line(), std::string(msgid.value()), std::move(id_highlights))
    .with_separator()
    .with_line(msgstr.field, msgstr.line(), std::string(msgstr.value()), std::move(str_highlights));
}

}  // namespace poexam::rules
