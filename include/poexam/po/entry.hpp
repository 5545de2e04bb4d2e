// poexam/po/entry.hpp - PO entry model
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "poexam/po/format.hpp"

namespace poexam::po
{

// ============================================================================
// Message
// ============================================================================

/**
 * Location of one quoted string in the file.
 */
struct Fragment
{
  /// 1-based line number
  uint32_t line = 0;

  /// 1-based byte column of the first character after the opening quote
  uint32_t column = 0;

  /// Byte offset of the fragment in Message::raw
  uint32_t offset = 0;

  /// Byte length of the fragment in Message::raw (escaped, UTF-8)
  uint32_t length = 0;
};

/**
 * One field of an entry (`msgctxt`, `msgid`, `msgid_plural`, `msgstr[n]`).
 */
struct Message
{
  /// Line of the keyword (`msgid "..."`)
  uint32_t line = 0;

  /// Unescaped value, UTF-8
  std::string value;

  /// Concatenated raw strings, before unescaping
  std::string raw;

  /// Raw strings the value was built from, in file order
  std::vector<Fragment> fragments;

  /**
   * Fragment holding byte `raw_offset` of `raw`.
   *
   * @return nullptr if the offset is past the end of `raw`
   */
  [[nodiscard]] const Fragment * fragment_at(size_t raw_offset) const noexcept;

  /// File line of byte `raw_offset` of `raw` (the keyword line if unknown).
  [[nodiscard]] uint32_t line_at(size_t raw_offset) const noexcept;
};

// ============================================================================
// Entry
// ============================================================================

/**
 * A display line of an entry, as it would be written in a PO file.
 */
struct PoLine
{
  uint32_t line = 0;
  std::string text;
};

/**
 * One translation unit of a catalog.
 */
struct Entry
{
  /// First non-blank line of the entry
  uint32_t line = 0;

  /// Keywords of `#,` and `#=` comments, in order
  std::vector<std::string> keywords;

  bool fuzzy = false;
  bool obsolete = false;
  bool noqa = false;
  bool nowrap = false;

  /// Some bytes could not be decoded with the catalog charset
  bool encoding_error = false;

  /// Rules disabled with `noqa:rule1;rule2`
  std::vector<std::string> noqa_rules;

  /// Stem of the `*-format` keyword ("c" for `c-format`)
  std::string format;

  std::optional<Message> msgctxt;
  std::optional<Message> msgid;
  std::optional<Message> msgid_plural;
  std::map<uint32_t, Message> msgstr;

  /// True if msgid is present and empty
  [[nodiscard]] bool is_header() const noexcept;

  [[nodiscard]] bool has_plural_form() const noexcept { return msgid_plural.has_value(); }

  /// True if at least one msgstr is non-empty (fuzzy entries included)
  [[nodiscard]] bool is_translated() const noexcept;

  [[nodiscard]] FormatLanguage format_language() const noexcept
  {
    return format_language_from_name(format);
  }

  /// True if `rule` is listed in `noqa:` keywords
  [[nodiscard]] bool is_rule_disabled(std::string_view rule) const noexcept;

  /// Source messages: msgid, then msgid_plural if any.
  [[nodiscard]] std::vector<const Message *> source_texts() const;

  /// Translations in index order.
  [[nodiscard]] std::vector<const Message *> translated_texts() const;

  /**
   * Re-escaped lines of the entry (one per field).
   *
   * Obsolete entries are prefixed with `#~ `; `msgstr[n]` is used when the
   * entry has a plural form or more than one translation.
   */
  [[nodiscard]] std::vector<PoLine> to_po_lines() const;
};

}  // namespace poexam::po
