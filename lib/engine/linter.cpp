// poexam/engine/linter.cpp - Run enabled rules over a catalog
#include "poexam/engine/linter.hpp"

#include <algorithm>

#include "poexam/rules/rule_context.hpp"
#include "poexam/spelling/dictionary_cache.hpp"

namespace poexam::engine
{

namespace
{

constexpr std::string_view k_spelling_ctxt = "spelling-ctxt";
constexpr std::string_view k_spelling_id = "spelling-id";
constexpr std::string_view k_spelling_str = "spelling-str";

/// Rule hooks for one entry and one rule
void run_rule(
  rules::RuleContext & ctx, const po::Entry & entry, const rules::Rule & rule,
  bool untranslated_rule)
{
  if (rule.check_entry) {
    rule.check_entry(ctx, entry);
  }
  if (rule.check_ctxt && entry.msgctxt) {
    rule.check_ctxt(ctx, entry, {&*entry.msgctxt, DiagnosticField::context()});
  }
  if (!rule.check_msg || !entry.msgid) {
    return;
  }

  // Empty translations are only given to the rule reporting them
  const bool with_empty = untranslated_rule && rule.id() == "untranslated";
  const rules::MessageRef msgid{&*entry.msgid, DiagnosticField::source()};
  if (auto it = entry.msgstr.find(0); it != entry.msgstr.end()) {
    if (!it->second.value.empty() || with_empty) {
      rule.check_msg(ctx, entry, msgid, {&it->second, DiagnosticField::translation(0)});
    }
  }
  if (entry.msgid_plural) {
    const rules::MessageRef msgid_plural{&*entry.msgid_plural, DiagnosticField::source_plural()};
    for (const auto & [index, msgstr] : entry.msgstr) {
      if (index == 0) {
        continue;
      }
      if (!msgstr.value.empty() || with_empty) {
        rule.check_msg(ctx, entry, msgid_plural, {&msgstr, DiagnosticField::translation(index)});
      }
    }
  }
}

}  // namespace

Linter::Linter(const rules::RuleSet & rules, LintOptions options)
: rules_(rules),
  options_(options),
  untranslated_rule_(rules.contains("untranslated")),
  fuzzy_rule_(rules.contains("fuzzy")),
  obsolete_rule_(rules.contains("obsolete"))
{
}

bool Linter::needs_source_dictionary() const noexcept
{
  return rules_.contains(k_spelling_ctxt) || rules_.contains(k_spelling_id);
}

bool Linter::needs_translation_dictionary() const noexcept
{
  return rules_.contains(k_spelling_str);
}

std::vector<Diagnostic> Linter::lint(const po::Catalog & catalog, const std::string & path) const
{
  DiagnosticBag diagnostics;
  rules::RuleContext ctx(path, catalog, diagnostics);

  const spelling::Dictionary * translation_dictionary = nullptr;
  if (needs_translation_dictionary() && dictionary_cache_) {
    const auto & loaded = dictionary_cache_->get(catalog.language);
    if (loaded.success) {
      translation_dictionary = loaded.dictionary.get();
    } else {
      ctx.set_rule(k_spelling_str, Severity::Warning);
      ctx.report_file(loaded.error);
    }
  }
  ctx.set_dictionaries(source_dictionary_, translation_dictionary);

  for (const auto & enabled : rules_) {
    if (enabled.rule->check_catalog) {
      ctx.set_rule(enabled.rule->id(), enabled.severity);
      enabled.rule->check_catalog(ctx, catalog);
    }
  }

  for (const auto & entry : catalog.entries) {
    if (entry.is_header()) {
      continue;
    }
    if (
      (!entry.is_translated() && !untranslated_rule_) ||
      (entry.fuzzy && !options_.fuzzy && !fuzzy_rule_) || (entry.noqa && !options_.noqa) ||
      (entry.obsolete && !options_.obsolete && !obsolete_rule_))
    {
      continue;
    }
    for (const auto & enabled : rules_) {
      if (entry.is_rule_disabled(enabled.rule->id())) {
        continue;
      }
      ctx.set_rule(enabled.rule->id(), enabled.severity);
      run_rule(ctx, entry, *enabled.rule, untranslated_rule_);
    }
  }

  for (const auto & issue : catalog.issues) {
    diagnostics
      .report(path, std::string(rules::k_syntax_error_rule), Severity::Error, issue.message)
      .with_line(DiagnosticField::none(), issue.line, std::string());
  }

  std::vector<Diagnostic> result = diagnostics.take();
  std::stable_sort(result.begin(), result.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.line() < b.line();
  });
  return result;
}

}  // namespace poexam::engine
