// poexam/test_support/lint_helpers.hpp - helpers for unit tests
//
// Parse in-memory PO text and lint it with a chosen set of rules.
// The rule set is owned by the returned unit because the linter only keeps
// a reference to it.
//
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/engine/linter.hpp"
#include "poexam/po/parser.hpp"
#include "poexam/rules/registry.hpp"
#include "poexam/rules/selection.hpp"

namespace poexam::test_support
{

struct TestLintUnit
{
  po::Catalog catalog;
  std::unique_ptr<rules::RuleSet> rules;
  std::vector<Diagnostic> diagnostics;

  [[nodiscard]] size_t count(std::string_view rule) const noexcept
  {
    size_t n = 0;
    for (const auto & d : diagnostics) {
      if (d.rule == rule) {
        ++n;
      }
    }
    return n;
  }
};

/// Resolve a comma separated rule list, throwing on unknown names.
[[nodiscard]] inline std::unique_ptr<rules::RuleSet> select_rules(std::string_view select)
{
  auto result =
    rules::resolve_rules(rules::RuleRegistry::builtin(), rules::split_rule_list(select), {});
  if (!result.success) {
    throw std::invalid_argument(result.error);
  }
  return std::make_unique<rules::RuleSet>(std::move(result.rules));
}

/// Parse PO text, throwing if the parse fails.
[[nodiscard]] inline po::Catalog parse(std::string_view src, const po::ParseOptions & options = {})
{
  auto parsed = po::parse_catalog(src, options);
  if (!parsed.success) {
    throw std::invalid_argument(parsed.error);
  }
  return std::move(parsed.catalog);
}

[[nodiscard]] inline TestLintUnit lint(
  std::string_view src, std::string_view select, engine::LintOptions options = {},
  const std::string & path = "test.po")
{
  TestLintUnit out;
  out.catalog = parse(src);
  out.rules = select_rules(select);
  const engine::Linter linter(*out.rules, options);
  out.diagnostics = linter.lint(out.catalog, path);
  return out;
}

/// A single translated entry with an optional flag line (`c-format`).
[[nodiscard]] inline std::string entry_po(
  std::string_view msgid, std::string_view msgstr, std::string_view flags = "")
{
  std::string s = "msgid \"\"\nmsgstr \"\"\n\"Content-Type: text/plain; charset=UTF-8\\n\"\n\n";
  if (!flags.empty()) {
    s += "#, ";
    s += flags;
    s += "\n";
  }
  s += "msgid \"";
  s += msgid;
  s += "\"\nmsgstr \"";
  s += msgstr;
  s += "\"\n";
  return s;
}

}  // namespace poexam::test_support
