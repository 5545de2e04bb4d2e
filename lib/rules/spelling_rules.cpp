// poexam/rules/spelling_rules.cpp - Spell checking (spelling-ctxt, spelling-id, spelling-str)
//
// Context and source are checked with the source language dictionary,
// translations with the dictionary of the catalog language. A rule without
// its dictionary reports nothing.
//
#include <fmt/format.h>

#include "poexam/rules/builtin_rules.hpp"
#include "poexam/rules/rule_context.hpp"
#include "poexam/spelling/spell_check.hpp"

namespace poexam::rules
{

namespace
{

void check_spelling_ctxt(RuleContext & ctx, const po::Entry & entry, const MessageRef & msgctxt)
{
  const spelling::Dictionary * dict = ctx.source_dictionary();
  if (dict == nullptr) {
    return;
  }
  auto result = spelling::check_words(msgctxt.value(), entry.format_language(), *dict);
  if (!result.empty()) {
    ctx.report_ctxt(
      msgctxt, std::move(result.highlights),
      fmt::format("misspelled words in context: {}", fmt::join(result.words, ", ")));
  }
}

void check_spelling_id(
  RuleContext & ctx, const po::Entry & entry, const MessageRef & msgid, const MessageRef & msgstr)
{
  const spelling::Dictionary * dict = ctx.source_dictionary();
  if (dict == nullptr) {
    return;
  }
  auto result = spelling::check_words(msgid.value(), entry.format_language(), *dict);
  if (!result.empty()) {
    ctx.report_msg(
      msgid, std::move(result.highlights), msgstr, {},
      fmt::format("misspelled words in source: {}", fmt::join(result.words, ", ")));
  }
}

void check_spelling_str(
  RuleContext & ctx, const po::Entry & entry, const MessageRef & msgid, const MessageRef & msgstr)
{
  const spelling::Dictionary * dict = ctx.translation_dictionary();
  if (dict == nullptr) {
    return;
  }
  auto result = spelling::check_words(msgstr.value(), entry.format_language(), *dict);
  if (!result.empty()) {
    ctx.report_msg(
      msgid, {}, msgstr, std::move(result.highlights),
      fmt::format("misspelled words in translation: {}", fmt::join(result.words, ", ")));
  }
}

}  // namespace

void add_spelling_rules(std::vector<Rule> & rules)
{
  // {info}, check_catalog, check_entry, check_ctxt, check_msg
  rules.push_back(
    {{"spelling-ctxt", Severity::Info, false, k_checks_group | k_spelling_group,
      "misspelled words in the context"},
     nullptr,
     nullptr,
     check_spelling_ctxt,
     nullptr});
  rules.push_back(
    {{"spelling-id", Severity::Info, false, k_checks_group | k_spelling_group,
      "misspelled words in the source"},
     nullptr,
     nullptr,
     nullptr,
     check_spelling_id});
  rules.push_back(
    {{"spelling-str", Severity::Info, false, k_checks_group | k_spelling_group,
      "misspelled words in the translation"},
     nullptr,
     nullptr,
     nullptr,
     check_spelling_str});
}

}  // namespace poexam::rules
