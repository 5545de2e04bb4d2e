// poexam/po/entry.cpp - PO entry model
#include "poexam/po/entry.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "poexam/po/escape.hpp"

namespace poexam::po
{

const Fragment * Message::fragment_at(size_t raw_offset) const noexcept
{
  for (const auto & fragment : fragments) {
    if (raw_offset < static_cast<size_t>(fragment.offset) + fragment.length) {
      return &fragment;
    }
  }
  return nullptr;
}

uint32_t Message::line_at(size_t raw_offset) const noexcept
{
  const Fragment * fragment = fragment_at(raw_offset);
  return fragment != nullptr ? fragment->line : line;
}

bool Entry::is_header() const noexcept { return msgid && msgid->value.empty(); }

bool Entry::is_translated() const noexcept
{
  return std::any_of(msgstr.begin(), msgstr.end(), [](const auto & kv) {
    return !kv.second.value.empty();
  });
}

bool Entry::is_rule_disabled(std::string_view rule) const noexcept
{
  return std::find(noqa_rules.begin(), noqa_rules.end(), rule) != noqa_rules.end();
}

std::vector<const Message *> Entry::source_texts() const
{
  std::vector<const Message *> result;
  if (msgid) {
    result.push_back(&*msgid);
  }
  if (msgid_plural) {
    result.push_back(&*msgid_plural);
  }
  return result;
}

std::vector<const Message *> Entry::translated_texts() const
{
  std::vector<const Message *> result;
  result.reserve(msgstr.size());
  for (const auto & [index, msg] : msgstr) {
    result.push_back(&msg);
  }
  return result;
}

std::vector<PoLine> Entry::to_po_lines() const
{
  std::vector<PoLine> lines;
  const std::string_view prefix = obsolete ? "#~ " : "";

  if (msgctxt) {
    lines.push_back({msgctxt->line, fmt::format("{}msgctxt \"{}\"", prefix, escape(msgctxt->value))});
  }
  if (msgid) {
    lines.push_back({msgid->line, fmt::format("{}msgid \"{}\"", prefix, escape(msgid->value))});
  }
  if (msgid_plural) {
    lines.push_back(
      {msgid_plural->line,
       fmt::format("{}msgid_plural \"{}\"", prefix, escape(msgid_plural->value))});
  }
  const bool indexed = has_plural_form() || msgstr.size() > 1;
  for (const auto & [index, msg] : msgstr) {
    if (indexed) {
      lines.push_back(
        {msg.line, fmt::format("{}msgstr[{}] \"{}\"", prefix, index, escape(msg.value))});
    } else {
      lines.push_back({msg.line, fmt::format("{}msgstr \"{}\"", prefix, escape(msg.value))});
    }
  }
  return lines;
}

}  // namespace poexam::po
