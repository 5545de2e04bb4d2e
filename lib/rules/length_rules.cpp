// poexam/rules/length_rules.cpp - Translation length compared to the source (long, short)
#include <fmt/core.h>

#include "poexam/rules/builtin_rules.hpp"
#include "poexam/rules/rule_context.hpp"
#include "poexam/text/unicode.hpp"

namespace poexam::rules
{

namespace
{

/// Characters of `s`, leading and trailing whitespace excluded
size_t trimmed_length(std::string_view s) noexcept { return text::char_count(text::trim(s)); }

/// True if `longer` is at least ten times `shorter`, or one character against more.
bool is_much_longer(size_t shorter, size_t longer) noexcept
{
  return shorter * 10 <= longer || (shorter == 1 && longer > 1);
}

void check_long(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const size_t id_len = trimmed_length(msgid.value());
  const size_t str_len = trimmed_length(msgstr.value());
  if (id_len == 0 || str_len == 0) {
    return;
  }
  if (is_much_longer(id_len, str_len)) {
    ctx.report_msg(
      msgid, {}, msgstr, {}, fmt::format("translation too long ({} / {})", id_len, str_len));
  }
}

void check_short(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const size_t id_len = trimmed_length(msgid.value());
  const size_t str_len = trimmed_length(msgstr.value());
  if (id_len == 0 || str_len == 0) {
    return;
  }
  if (is_much_longer(str_len, id_len)) {
    ctx.report_msg(
      msgid, {}, msgstr, {}, fmt::format("translation too short ({} / {})", id_len, str_len));
  }
}

}  // namespace

void add_length_rules(std::vector<Rule> & rules)
{
  // {info}, check_catalog, check_entry, check_ctxt, check_msg
  rules.push_back(
    {{"long", Severity::Warning, true, k_checks_group,
      "translation is too long compared to the source"},
     nullptr,
     nullptr,
     nullptr,
     check_long});
  rules.push_back(
    {{"short", Severity::Warning, true, k_checks_group,
      "translation is too short compared to the source"},
     nullptr,
     nullptr,
     nullptr,
     check_short});
}

}  // namespace poexam::rules
