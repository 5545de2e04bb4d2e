// poexam/po/format.hpp - Format string scanner (C, Python)
//
// The scanner never fails: a malformed specifier is either skipped or
// returned as the shortest span that could be recognized.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace poexam::po
{

/**
 * Format language of an entry, from its `*-format` flag.
 */
enum class FormatLanguage : uint8_t {
  None,
  C,
  Python,
  PythonBrace,
};

/// Map a flag stem ("c", "python", "python-brace") to a language.
[[nodiscard]] FormatLanguage format_language_from_name(std::string_view name) noexcept;

/// Display name: "none", "C", "Python", "Python brace".
[[nodiscard]] std::string_view format_language_display_name(FormatLanguage lang) noexcept;

/**
 * A byte range of a string with its text.
 */
struct TextSpan
{
  std::string_view text;
  size_t start = 0;
  size_t end = 0;

  [[nodiscard]] bool operator==(const TextSpan & other) const noexcept
  {
    return text == other.text && start == other.start && end == other.end;
  }
};

/**
 * Find every format specifier of `s` (`%d`, `%1$s`, `%(name)s`, `{0}`, ...).
 *
 * `%%` and `{{` are escapes, not specifiers. A lone `%` at the end of the
 * string is not a specifier.
 */
[[nodiscard]] std::vector<TextSpan> find_formats(std::string_view s, FormatLanguage lang);

/// Value returned by format_sort_index() for non positional specifiers.
inline constexpr size_t k_no_format_index = std::numeric_limits<size_t>::max();

/**
 * Positional index of a C specifier: 3 for "%3$d".
 */
[[nodiscard]] size_t format_sort_index(std::string_view fmt) noexcept;

/**
 * Remove the positional index of a C specifier: "%3$d" -> "%d".
 */
[[nodiscard]] std::string format_strip_index(std::string_view fmt);

// ============================================================================
// Low level scanner (shared with the word splitter)
// ============================================================================

namespace detail
{

/**
 * Check for the start of a specifier at byte `pos`.
 *
 * @return Position after the introducer and whether a specifier starts there
 */
[[nodiscard]] std::pair<size_t, bool> next_format_char(
  std::string_view s, size_t pos, FormatLanguage lang) noexcept;

/// Position right after the specifier whose body starts at `pos`.
[[nodiscard]] size_t find_format_end(std::string_view s, size_t pos, FormatLanguage lang) noexcept;

}  // namespace detail

}  // namespace poexam::po
