// poexam/po/escape.hpp - PO string escape sequences
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace poexam::po
{

/// Escape sequence that was not recognized.
struct UnknownEscape
{
  /// Sequence as written, e.g. "\\q"
  std::string text;

  /// Byte offset of the backslash in the raw string
  size_t offset = 0;
};

/**
 * Result of unescaping a quoted PO string.
 */
struct UnescapeResult
{
  /// Unescaped value (unknown sequences are kept verbatim)
  std::string value;

  std::vector<UnknownEscape> unknown_sequences;
};

/**
 * Escape a value so that it can be written between double quotes in a PO file.
 *
 * Only `\n`, `\r`, `\t`, `"` and `\` are escaped.
 */
[[nodiscard]] std::string escape(std::string_view value);

/**
 * Resolve escape sequences of a raw PO string.
 *
 * Supports `\n \r \t \" \\ \a \b \f \v`, octal `\NNN` and hex `\xHH`.
 * A trailing lone backslash is kept as is.
 */
[[nodiscard]] UnescapeResult unescape(std::string_view raw);

}  // namespace poexam::po
