// poexam/rules/character_rules.cpp - Rules comparing special characters
//
//   brackets, double-quotes, double-spaces, escapes, newlines, pipes, tabs
//
#include <fmt/core.h>

#include <algorithm>
#include <array>

#include "poexam/rules/builtin_rules.hpp"
#include "poexam/rules/rule_context.hpp"
#include "poexam/rules/rule_helpers.hpp"

namespace poexam::rules
{

namespace
{

// ============================================================================
// brackets
// ============================================================================

struct BracketPair
{
  char open;
  char close;
  std::string_view name;
};

constexpr std::array<BracketPair, 4> k_bracket_pairs = {{
  {'(', ')', "round"},
  {'[', ']', "square"},
  {'{', '}', "curly"},
  {'<', '>', "angle"},
}};

/// "(s)" and "(S)" mark optional plurals
bool is_plural_marker_at(std::string_view s, size_t pos) noexcept
{
  const std::string_view marker = s.substr(pos, 3);
  return marker == "(s)" || marker == "(S)";
}

std::vector<Highlight> find_opening(std::string_view s, char bracket)
{
  std::vector<Highlight> result;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == bracket && !(bracket == '(' && is_plural_marker_at(s, i))) {
      result.emplace_back(i, i + 1);
    }
  }
  return result;
}

std::vector<Highlight> find_closing(std::string_view s, char bracket)
{
  std::vector<Highlight> result;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == bracket && !(bracket == ')' && i >= 2 && is_plural_marker_at(s, i - 2))) {
      result.emplace_back(i, i + 1);
    }
  }
  return result;
}

std::vector<Highlight> merge_sorted(std::vector<Highlight> a, const std::vector<Highlight> & b)
{
  a.insert(a.end(), b.begin(), b.end());
  std::sort(a.begin(), a.end());
  return a;
}

void check_brackets(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view id = msgid.value();
  const std::string_view str = msgstr.value();

  for (const auto & pair : k_bracket_pairs) {
    const auto id_open = find_opening(id, pair.open);
    const auto str_open = find_opening(str, pair.open);
    const auto id_close = find_closing(id, pair.close);
    const auto str_close = find_closing(str, pair.close);

    const bool missing_open = id_open.size() > str_open.size();
    const bool extra_open = id_open.size() < str_open.size();
    const bool missing_close = id_close.size() > str_close.size();
    const bool extra_close = id_close.size() < str_close.size();

    // Translations often add words in parentheses to clarify a term
    if (pair.open == '(' && extra_open && extra_close) {
      continue;
    }

    if ((missing_open && missing_close) || (extra_open && extra_close)) {
      ctx.report_msg(
        msgid, merge_sorted(id_open, id_close), msgstr, merge_sorted(str_open, str_close),
        fmt::format(
          "{} opening and closing {} brackets '{}' ({} / {}) and '{}' ({} / {})",
          missing_open ? "missing" : "extra", pair.name, pair.open, id_open.size(),
          str_open.size(), pair.close, id_close.size(), str_close.size()));
      continue;
    }

    if (missing_open || extra_open) {
      ctx.report_msg(
        msgid, id_open, msgstr, str_open,
        fmt::format(
          "{} opening {} brackets '{}' ({} / {})", missing_open ? "missing" : "extra", pair.name,
          pair.open, id_open.size(), str_open.size()));
    }
    if (missing_close || extra_close) {
      ctx.report_msg(
        msgid, id_close, msgstr, str_close,
        fmt::format(
          "{} closing {} brackets '{}' ({} / {})", missing_close ? "missing" : "extra", pair.name,
          pair.close, id_close.size(), str_close.size()));
    }
  }
}

// ============================================================================
// Counted characters
// ============================================================================

void check_double_quotes(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  // ASCII quote, low-9 quote, right double quote
  report_count_mismatch(
    ctx, msgid, find_any(msgid.value(), {"\"", "„", "”"}), msgstr,
    find_any(msgstr.value(), {"\"", "„", "”"}), "double quotes");
}

void check_double_spaces(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  report_count_mismatch(
    ctx, msgid, find_all(msgid.value(), "  "), msgstr, find_all(msgstr.value(), "  "),
    "double spaces '  '");
}

void check_escapes(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  if (report_count_mismatch(
        ctx, msgid, find_all(msgid.value(), "\\\\"), msgstr, find_all(msgstr.value(), "\\\\"),
        "escaped escape characters '\\\\'"))
  {
    return;
  }
  report_count_mismatch(
    ctx, msgid, find_all(msgid.value(), "\\"), msgstr, find_all(msgstr.value(), "\\"),
    "escape characters '\\'");
}

void check_pipes(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  report_count_mismatch(
    ctx, msgid, find_all(msgid.value(), "|"), msgstr, find_all(msgstr.value(), "|"),
    "pipes '|'");
}

void check_tabs(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  report_count_mismatch(
    ctx, msgid, find_all(msgid.value(), "\t"), msgstr, find_all(msgstr.value(), "\t"),
    "tabs '\\t'");
}

// ============================================================================
// newlines
// ============================================================================

void report_newline_count(
  RuleContext & ctx, const MessageRef & msgid, const MessageRef & msgstr, char c,
  std::string_view what)
{
  const auto id_count = std::count(msgid.value().begin(), msgid.value().end(), c);
  const auto str_count = std::count(msgstr.value().begin(), msgstr.value().end(), c);
  if (id_count != str_count) {
    ctx.report_msg(
      msgid, {}, msgstr, {},
      fmt::format("{} {} ({} / {})", id_count > str_count ? "missing" : "extra", what, id_count,
                  str_count));
  }
}

void report_newline_at(
  RuleContext & ctx, const MessageRef & msgid, const MessageRef & msgstr, bool id_has,
  bool str_has, std::string_view what)
{
  if (id_has != str_has) {
    ctx.report_msg(msgid, {}, msgstr, {}, fmt::format("{} {}", id_has ? "missing" : "extra", what));
  }
}

void check_newlines(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view id = msgid.value();
  const std::string_view str = msgstr.value();

  report_newline_count(ctx, msgid, msgstr, '\r', "carriage returns '\\r'");
  report_newline_count(ctx, msgid, msgstr, '\n', "line feeds '\\n'");

  const auto starts = [](std::string_view s, char c) { return !s.empty() && s.front() == c; };
  const auto ends = [](std::string_view s, char c) { return !s.empty() && s.back() == c; };

  report_newline_at(
    ctx, msgid, msgstr, starts(id, '\r'), starts(str, '\r'),
    "carriage return '\\r' at the beginning");
  report_newline_at(
    ctx, msgid, msgstr, starts(id, '\n'), starts(str, '\n'), "line feed '\\n' at the beginning");
  report_newline_at(
    ctx, msgid, msgstr, ends(id, '\r'), ends(str, '\r'), "carriage return '\\r' at the end");
  report_newline_at(
    ctx, msgid, msgstr, ends(id, '\n'), ends(str, '\n'), "line feed '\\n' at the end");
}

}  // namespace

void add_character_rules(std::vector<Rule> & rules)
{
  // {info}, check_catalog, check_entry, check_ctxt, check_msg
  rules.push_back(
    {{"brackets", Severity::Info, true, k_checks_group, "missing or extra brackets: () [] {} <>"},
     nullptr,
     nullptr,
     nullptr,
     check_brackets});
  rules.push_back(
    {{"double-quotes", Severity::Info, true, k_checks_group, "missing or extra double quotes"},
     nullptr,
     nullptr,
     nullptr,
     check_double_quotes});
  rules.push_back(
    {{"double-spaces", Severity::Info, true, k_checks_group, "missing or extra double spaces"},
     nullptr,
     nullptr,
     nullptr,
     check_double_spaces});
  rules.push_back(
    {{"escapes", Severity::Error, true, k_checks_group, "missing or extra escape characters"},
     nullptr,
     nullptr,
     nullptr,
     check_escapes});
  rules.push_back(
    {{"newlines", Severity::Error, true, k_checks_group,
      "missing or extra carriage returns and line feeds"},
     nullptr,
     nullptr,
     nullptr,
     check_newlines});
  rules.push_back(
    {{"pipes", Severity::Info, true, k_checks_group, "missing or extra pipes"},
     nullptr,
     nullptr,
     nullptr,
     check_pipes});
  rules.push_back(
    {{"tabs", Severity::Error, true, k_checks_group, "missing or extra tabs"},
     nullptr,
     nullptr,
     nullptr,
     check_tabs});
}

}  // namespace poexam::rules
