// poexam/rules/selection.cpp - Resolve select/ignore tokens into enabled rules
#include "poexam/rules/selection.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "poexam/text/unicode.hpp"

namespace poexam::rules
{

std::vector<std::string> split_rule_list(std::string_view list)
{
  std::vector<std::string> names;
  size_t start = 0;
  while (true) {
    const size_t comma = list.find(',', start);
    const std::string_view name =
      list.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    names.emplace_back(text::trim(name));
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return names;
}

// ============================================================================
// RuleSet
// ============================================================================

bool RuleSet::contains(std::string_view id) const noexcept { return severity_of(id).has_value(); }

std::optional<Severity> RuleSet::severity_of(std::string_view id) const noexcept
{
  for (const auto & enabled : rules_) {
    if (enabled.rule->id() == id) {
      return enabled.severity;
    }
  }
  return std::nullopt;
}

std::vector<std::string_view> RuleSet::ids() const
{
  std::vector<std::string_view> result;
  result.reserve(rules_.size());
  for (const auto & enabled : rules_) {
    result.push_back(enabled.rule->id());
  }
  return result;
}

// ============================================================================
// Resolution
// ============================================================================

SelectionResult resolve_rules(
  const RuleRegistry & registry, const std::vector<SelectionToken> & tokens,
  const SelectionOptions & options)
{
  // Indexed by registration order, so the output order never depends on tokens
  std::vector<bool> enabled(registry.size(), false);

  const bool has_select = std::any_of(tokens.begin(), tokens.end(), [](const SelectionToken & t) {
    return t.kind == SelectionTokenKind::Select && !t.name.empty();
  });
  if (!has_select) {
    for (size_t index : registry.group_members(k_group_default)) {
      enabled[index] = true;
    }
  }

  for (const auto & token : tokens) {
    if (token.name.empty()) {
      continue;
    }
    std::vector<size_t> members;
    if (RuleRegistry::is_group(token.name)) {
      members = registry.group_members(token.name);
    } else if (auto index = registry.index_of(token.name)) {
      members.push_back(*index);
    } else {
      return SelectionResult::fail(
        SelectionError::UnknownRule, fmt::format("unknown rule '{}'", token.name));
    }
    const bool value = token.kind == SelectionTokenKind::Select;
    for (size_t index : members) {
      enabled[index] = value;
    }
  }

  for (const auto & [id, severity] : options.severity_overrides) {
    if (!registry.find(id)) {
      return SelectionResult::fail(
        SelectionError::UnknownRule, fmt::format("unknown rule '{}' in severity overrides", id));
    }
  }

  std::vector<EnabledRule> rules;
  for (size_t i = 0; i < registry.size(); ++i) {
    if (!enabled[i]) {
      continue;
    }
    const Rule & rule = registry.rules()[i];
    Severity severity = rule.info.default_severity;
    if (auto it = options.severity_overrides.find(std::string(rule.id()));
        it != options.severity_overrides.end())
    {
      severity = it->second;
    }
    if (
      !options.severity_filter.empty() &&
      std::find(options.severity_filter.begin(), options.severity_filter.end(), severity) ==
        options.severity_filter.end())
    {
      continue;
    }
    rules.push_back({&rule, severity});
  }
  return SelectionResult::ok(RuleSet(std::move(rules)));
}

SelectionResult resolve_rules(
  const RuleRegistry & registry, const std::vector<std::string> & select,
  const std::vector<std::string> & exclude, const SelectionOptions & options)
{
  std::vector<SelectionToken> tokens;
  tokens.reserve(select.size() + exclude.size());
  for (const auto & name : select) {
    tokens.push_back(SelectionToken::select(name));
  }
  for (const auto & name : exclude) {
    tokens.push_back(SelectionToken::exclude(name));
  }
  return resolve_rules(registry, tokens, options);
}

}  // namespace poexam::rules
