// poexam/rules/rule_helpers.cpp - Helpers shared by the built-in rules
#include "poexam/rules/rule_helpers.hpp"

#include <fmt/core.h>

#include "poexam/rules/rule_context.hpp"

namespace poexam::rules
{

std::vector<Highlight> find_all(std::string_view s, std::string_view needle)
{
  std::vector<Highlight> result;
  if (needle.empty()) {
    return result;
  }
  size_t pos = s.find(needle);
  while (pos != std::string_view::npos) {
    result.emplace_back(pos, pos + needle.size());
    pos = s.find(needle, pos + needle.size());
  }
  return result;
}

std::vector<Highlight> find_any(std::string_view s, std::initializer_list<std::string_view> needles)
{
  std::vector<Highlight> result;
  size_t pos = 0;
  while (pos < s.size()) {
    size_t matched = 0;
    for (const auto needle : needles) {
      if (!needle.empty() && s.substr(pos, needle.size()) == needle) {
        matched = needle.size();
        break;
      }
    }
    if (matched > 0) {
      result.emplace_back(pos, pos + matched);
      pos += matched;
    } else {
      ++pos;
    }
  }
  return result;
}

bool report_count_mismatch(
  RuleContext & ctx, const MessageRef & msgid, std::vector<Highlight> id_highlights,
  const MessageRef & msgstr, std::vector<Highlight> str_highlights, std::string_view what)
{
  const size_t id_count = id_highlights.size();
  const size_t str_count = str_highlights.size();
  if (id_count == str_count) {
    return false;
  }
  ctx.report_msg(
    msgid, std::move(id_highlights), msgstr, std::move(str_highlights),
    fmt::format("{} {} ({} / {})", id_count > str_count ? "missing" : "extra", what, id_count,
                str_count));
  return true;
}

}  // namespace poexam::rules
