// poexam/rules/registry.cpp - Table of known rules
#include "poexam/rules/registry.hpp"

#include <algorithm>

#include "poexam/rules/builtin_rules.hpp"

namespace poexam::rules
{

namespace
{

bool in_group(const RuleInfo & info, std::string_view group) noexcept
{
  if (group == k_group_all) {
    return true;
  }
  if (group == k_group_checks) {
    return info.in_groups(k_checks_group);
  }
  if (group == k_group_spelling) {
    return info.in_groups(k_spelling_group);
  }
  if (group == k_group_default) {
    return info.default_enabled;
  }
  return false;
}

}  // namespace

RuleRegistry::RuleRegistry(std::vector<Rule> rules) : rules_(std::move(rules)) {}

const RuleRegistry & RuleRegistry::builtin()
{
  static const RuleRegistry registry = [] {
    std::vector<Rule> rules;
    add_status_rules(rules);
    add_character_rules(rules);
    add_format_rules(rules);
    add_punctuation_rules(rules);
    add_length_rules(rules);
    add_spelling_rules(rules);
    std::sort(rules.begin(), rules.end(), [](const Rule & a, const Rule & b) {
      return a.id() < b.id();
    });
    return RuleRegistry(std::move(rules));
  }();
  return registry;
}

const Rule * RuleRegistry::find(std::string_view id) const noexcept
{
  const auto index = index_of(id);
  return index ? &rules_[*index] : nullptr;
}

std::optional<size_t> RuleRegistry::index_of(std::string_view id) const noexcept
{
  for (size_t i = 0; i < rules_.size(); ++i) {
    if (rules_[i].id() == id) {
      return i;
    }
  }
  return std::nullopt;
}

bool RuleRegistry::is_group(std::string_view name) noexcept
{
  return name == k_group_all || name == k_group_checks || name == k_group_spelling ||
         name == k_group_default;
}

std::vector<size_t> RuleRegistry::group_members(std::string_view group) const
{
  std::vector<size_t> members;
  for (size_t i = 0; i < rules_.size(); ++i) {
    if (in_group(rules_[i].info, group)) {
      members.push_back(i);
    }
  }
  return members;
}

}  // namespace poexam::rules
