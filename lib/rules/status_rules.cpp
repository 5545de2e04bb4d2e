// poexam/rules/status_rules.cpp - Translation status and catalog-level rules
//
//   blank, changed, encoding, fuzzy, obsolete, plurals, unchanged, untranslated
//
#include <fmt/core.h>

#include "poexam/po/charset.hpp"
#include "poexam/rules/builtin_rules.hpp"
#include "poexam/rules/rule_context.hpp"
#include "poexam/text/unicode.hpp"

namespace poexam::rules
{

namespace
{

bool has_lowercase(std::string_view s) noexcept
{
  size_t pos = 0;
  while (pos < s.size()) {
    const text::DecodedChar c = text::decode_at(s, pos);
    if (text::is_lowercase(c.cp)) {
      return true;
    }
    pos += c.size;
  }
  return false;
}

// ============================================================================
// Hooks
// ============================================================================

void check_blank(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view str = msgstr.value();
  if (!text::is_blank(msgid.value()) && !str.empty() && text::is_blank(str)) {
    ctx.report_msg(msgid, {}, msgstr, {{0, str.size()}}, "blank translation");
  }
}

void check_changed(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  if (
    !text::is_blank(msgid.value()) && !text::is_blank(msgstr.value()) &&
    msgid.value() != msgstr.value())
  {
    ctx.report_msg(msgid, {}, msgstr, {}, "changed translation");
  }
}

void check_encoding_catalog(RuleContext & ctx, const po::Catalog & catalog)
{
  const std::string & charset = catalog.declared_charset;
  if (!charset.empty() && !po::is_known_charset(charset)) {
    ctx.report_file(fmt::format("unknown encoding '{}'", charset));
  }
}

void check_encoding_entry(RuleContext & ctx, const po::Entry & entry)
{
  if (entry.encoding_error) {
    ctx.report_entry(
      entry, fmt::format("invalid characters for encoding {}", ctx.catalog().encoding));
  }
}

void check_fuzzy(RuleContext & ctx, const po::Entry & entry)
{
  if (entry.fuzzy) {
    ctx.report_entry(entry, "fuzzy entry");
  }
}

void check_obsolete(RuleContext & ctx, const po::Entry & entry)
{
  if (entry.obsolete) {
    ctx.report_entry(entry, "obsolete entry");
  }
}

void check_plurals(RuleContext & ctx, const po::Entry & entry)
{
  // Only entries with a plural form, when the header defines nplurals
  const size_t expected = ctx.catalog().nplurals;
  if (expected == 0 || !entry.has_plural_form()) {
    return;
  }
  const size_t found = entry.msgstr.size();
  if (found != expected) {
    ctx.report_entry(
      entry, fmt::format(
               "{} translated plural form (found: {}, expected: {})",
               found < expected ? "missing" : "extra", found, expected));
  }
}

void check_unchanged(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view id = msgid.value();
  if (
    !text::is_blank(id) && !text::is_blank(msgstr.value()) && id == msgstr.value() &&
    has_lowercase(id))
  {
    ctx.report_msg(msgid, {}, msgstr, {}, "unchanged translation");
  }
}

void check_untranslated(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  if (msgstr.value().empty()) {
    ctx.report_msg(msgid, {}, msgstr, {}, "untranslated message");
  }
}

}  // namespace

void add_status_rules(std::vector<Rule> & rules)
{
  // {info}, check_catalog, check_entry, check_ctxt, check_msg
  rules.push_back(
    {{"blank", Severity::Warning, true, k_checks_group, "translation is empty or only whitespace"},
     nullptr,
     nullptr,
     nullptr,
     check_blank});
  rules.push_back(
    {{"changed", Severity::Info, false, k_checks_group, "translation differs from the source"},
     nullptr,
     nullptr,
     nullptr,
     check_changed});
  rules.push_back(
    {{"encoding", Severity::Info, true, k_checks_group,
      "characters invalid for the charset, or unknown charset in the header"},
     check_encoding_catalog,
     check_encoding_entry,
     nullptr,
     nullptr});
  rules.push_back(
    {{"fuzzy", Severity::Info, false, k_no_groups, "entry is marked fuzzy"},
     nullptr,
     check_fuzzy,
     nullptr,
     nullptr});
  rules.push_back(
    {{"obsolete", Severity::Info, false, k_no_groups, "entry is obsolete (#~)"},
     nullptr,
     check_obsolete,
     nullptr,
     nullptr});
  rules.push_back(
    {{"plurals", Severity::Error, true, k_checks_group,
      "number of plural translations differs from nplurals of the header"},
     nullptr,
     check_plurals,
     nullptr,
     nullptr});
  rules.push_back(
    {{"unchanged", Severity::Info, false, k_no_groups, "translation is identical to the source"},
     nullptr,
     nullptr,
     nullptr,
     check_unchanged});
  rules.push_back(
    {{"untranslated", Severity::Info, false, k_no_groups, "message is not translated"},
     nullptr,
     nullptr,
     nullptr,
     check_untranslated});
}

}  // namespace poexam::rules
