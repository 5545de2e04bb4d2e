// poexam/rules/registry.hpp - Table of known rules
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "poexam/rules/rule.hpp"

namespace poexam::rules
{

/// Every rule
inline constexpr std::string_view k_group_all = "all";
/// Every rule except status reports (fuzzy, obsolete, unchanged, untranslated)
inline constexpr std::string_view k_group_checks = "checks";
/// The spelling rules
inline constexpr std::string_view k_group_spelling = "spelling";
/// Rules enabled by default
inline constexpr std::string_view k_group_default = "default";

class RuleRegistry
{
public:
  /**
   * Create a registry.
   *
   * Rules keep the given order (the registration order); ids must be unique.
   */
  explicit RuleRegistry(std::vector<Rule> rules);

  /**
   * The built-in rules, sorted by id.
   *
   * Built once, immutable afterwards.
   */
  [[nodiscard]] static const RuleRegistry & builtin();

  [[nodiscard]] const std::vector<Rule> & rules() const noexcept { return rules_; }
  [[nodiscard]] size_t size() const noexcept { return rules_.size(); }

  [[nodiscard]] const Rule * find(std::string_view id) const noexcept;
  [[nodiscard]] std::optional<size_t> index_of(std::string_view id) const noexcept;

  [[nodiscard]] static bool is_group(std::string_view name) noexcept;

  /// Indexes of the rules of a group, in registration order
  [[nodiscard]] std::vector<size_t> group_members(std::string_view group) const;

private:
  std::vector<Rule> rules_;
};

}  // namespace poexam::rules
