// poexam/rules/selection.hpp - Resolve select/ignore tokens into enabled rules
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "poexam/rules/registry.hpp"

namespace poexam::rules
{

// ============================================================================
// Tokens
// ============================================================================

enum class SelectionTokenKind : uint8_t {
  Select,
  Exclude,
};

/**
 * A rule id or group name to add to (or remove from) the enabled rules.
 */
struct SelectionToken
{
  SelectionTokenKind kind = SelectionTokenKind::Select;
  std::string name;

  static SelectionToken select(std::string name)
  {
    return {SelectionTokenKind::Select, std::move(name)};
  }
  static SelectionToken exclude(std::string name)
  {
    return {SelectionTokenKind::Exclude, std::move(name)};
  }
};

/**
 * Split a comma separated list ("brackets, pipes"); names are trimmed and
 * empty names are kept (they are ignored by the resolver).
 */
[[nodiscard]] std::vector<std::string> split_rule_list(std::string_view list);

// ============================================================================
// RuleSet
// ============================================================================

/**
 * A rule enabled for a run, with its effective severity.
 */
struct EnabledRule
{
  const Rule * rule = nullptr;
  Severity severity = Severity::Info;
};

/**
 * Enabled rules in registration order. Immutable once resolved.
 */
class RuleSet
{
public:
  RuleSet() = default;
  explicit RuleSet(std::vector<EnabledRule> rules) : rules_(std::move(rules)) {}

  [[nodiscard]] const std::vector<EnabledRule> & rules() const noexcept { return rules_; }
  [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return rules_.size(); }

  [[nodiscard]] bool contains(std::string_view id) const noexcept;

  /// Effective severity of an enabled rule
  [[nodiscard]] std::optional<Severity> severity_of(std::string_view id) const noexcept;

  [[nodiscard]] std::vector<std::string_view> ids() const;

  [[nodiscard]] auto begin() const { return rules_.begin(); }
  [[nodiscard]] auto end() const { return rules_.end(); }

private:
  std::vector<EnabledRule> rules_;
};

// ============================================================================
// Resolution
// ============================================================================

struct SelectionOptions
{
  /// Severity replacing the default one of a rule
  std::map<std::string, Severity> severity_overrides;

  /// Keep only rules with one of these effective severities (empty: keep all)
  std::vector<Severity> severity_filter;
};

enum class SelectionError : uint8_t {
  None,
  UnknownRule,
};

/**
 * Result of a rule selection.
 */
struct SelectionResult
{
  /// Enabled rules (only valid if success == true)
  RuleSet rules;

  bool success = false;

  SelectionError error_kind = SelectionError::None;

  /// Error message if the selection failed
  std::string error;

  static SelectionResult ok(RuleSet rules)
  {
    SelectionResult r;
    r.rules = std::move(rules);
    r.success = true;
    return r;
  }

  static SelectionResult fail(SelectionError kind, std::string msg)
  {
    SelectionResult r;
    r.error_kind = kind;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Resolve tokens into enabled rules.
 *
 * The working set starts empty when at least one token selects, otherwise
 * with the `default` group. Tokens are applied from left to right: a select
 * token adds a rule or a group, an exclude token removes it. Empty names are
 * ignored; an unknown name fails the whole selection.
 */
[[nodiscard]] SelectionResult resolve_rules(
  const RuleRegistry & registry, const std::vector<SelectionToken> & tokens,
  const SelectionOptions & options = {});

/**
 * Resolve the select tokens, then the exclude tokens.
 */
[[nodiscard]] SelectionResult resolve_rules(
  const RuleRegistry & registry, const std::vector<std::string> & select,
  const std::vector<std::string> & exclude, const SelectionOptions & options = {});

}  // namespace poexam::rules
