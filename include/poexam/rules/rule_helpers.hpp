// poexam/rules/rule_helpers.hpp - Helpers shared by the built-in rules
#pragma once

#include <initializer_list>
#include <string_view>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/rules/rule.hpp"

namespace poexam::rules
{

/// Byte ranges of the non-overlapping occurrences of `needle` in `s`.
[[nodiscard]] std::vector<Highlight> find_all(std::string_view s, std::string_view needle);

/// Byte ranges of the occurrences of any of `needles` in `s`, in text order.
[[nodiscard]] std::vector<Highlight> find_any(
  std::string_view s, std::initializer_list<std::string_view> needles);

/**
 * Compare two occurrence lists and report `missing {what} (a / b)` or
 * `extra {what} (a / b)` when their sizes differ.
 *
 * @return true if a diagnostic was reported
 */
bool report_count_mismatch(
  RuleContext & ctx, const MessageRef & msgid, std::vector<Highlight> id_highlights,
  const MessageRef & msgstr, std::vector<Highlight> str_highlights, std::string_view what);

}  // namespace poexam::rules
