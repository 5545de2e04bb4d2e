// poexam/rules/format_rules.cpp - Format string consistency (c-formats, python-formats)
#include <algorithm>
#include <string>
#include <tuple>

#include "poexam/po/format.hpp"
#include "poexam/rules/builtin_rules.hpp"
#include "poexam/rules/rule_context.hpp"

namespace poexam::rules
{

namespace
{

/**
 * Specifiers of `s` ordered by positional index (then position), with the
 * index removed: "%2$s %1$d" gives ["%d", "%s"].
 */
std::vector<std::string> normalized_formats(const std::vector<po::TextSpan> & formats)
{
  std::vector<po::TextSpan> sorted = formats;
  std::sort(sorted.begin(), sorted.end(), [](const po::TextSpan & a, const po::TextSpan & b) {
    return std::make_tuple(po::format_sort_index(a.text), a.start, a.end) <
           std::make_tuple(po::format_sort_index(b.text), b.start, b.end);
  });
  std::vector<std::string> result;
  result.reserve(sorted.size());
  for (const auto & f : sorted) {
    result.push_back(po::format_strip_index(f.text));
  }
  return result;
}

std::vector<Highlight> spans_of(const std::vector<po::TextSpan> & formats)
{
  std::vector<Highlight> result;
  result.reserve(formats.size());
  for (const auto & f : formats) {
    result.emplace_back(f.start, f.end);
  }
  return result;
}

void compare_formats(
  RuleContext & ctx, const MessageRef & msgid, const MessageRef & msgstr, po::FormatLanguage lang,
  std::string_view message)
{
  const auto id_formats = po::find_formats(msgid.value(), lang);
  const auto str_formats = po::find_formats(msgstr.value(), lang);
  if (normalized_formats(id_formats) != normalized_formats(str_formats)) {
    ctx.report_msg(
      msgid, spans_of(id_formats), msgstr, spans_of(str_formats), std::string(message));
  }
}

void check_c_formats(
  RuleContext & ctx, const po::Entry & entry, const MessageRef & msgid, const MessageRef & msgstr)
{
  if (entry.format_language() == po::FormatLanguage::C) {
    compare_formats(ctx, msgid, msgstr, po::FormatLanguage::C, "inconsistent C format strings");
  }
}

void check_python_formats(
  RuleContext & ctx, const po::Entry & entry, const MessageRef & msgid, const MessageRef & msgstr)
{
  const po::FormatLanguage lang = entry.format_language();
  if (lang == po::FormatLanguage::Python || lang == po::FormatLanguage::PythonBrace) {
    compare_formats(ctx, msgid, msgstr, lang, "inconsistent Python format strings");
  }
}

}  // namespace

void add_format_rules(std::vector<Rule> & rules)
{
  // {info}, check_catalog, check_entry, check_ctxt, check_msg
  rules.push_back(
    {{"c-formats", Severity::Error, true, k_checks_group,
      "inconsistent C format strings (entries flagged c-format)"},
     nullptr,
     nullptr,
     nullptr,
     check_c_formats});
  rules.push_back(
    {{"python-formats", Severity::Error, true, k_checks_group,
      "inconsistent Python format strings (entries flagged python-format or python-brace-format)"},
     nullptr,
     nullptr,
     nullptr,
     check_python_formats});
}

}  // namespace poexam::rules
