// poexam/text/unicode.hpp - UTF-8 decoding and character classes
//
// UTF-8 decoding is hand written; character properties come from ICU.
// Strings are UTF-8 everywhere.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace poexam::text
{

/// Replacement character emitted for undecodable input
inline constexpr char32_t k_replacement_char = 0xFFFD;

/**
 * One decoded code point and the number of bytes it occupies.
 */
struct DecodedChar
{
  char32_t cp = 0;
  uint32_t size = 0;
  bool valid = false;
};

/**
 * Decode the code point starting at byte offset `pos`.
 *
 * Invalid or truncated sequences decode as U+FFFD with size 1 and
 * `valid == false`.
 */
[[nodiscard]] DecodedChar decode_at(std::string_view s, size_t pos) noexcept;

/**
 * Decode the code point that ends right before byte offset `end`.
 */
[[nodiscard]] DecodedChar decode_before(std::string_view s, size_t end) noexcept;

/// Append the UTF-8 encoding of `cp` to `out`.
void append_utf8(std::string & out, char32_t cp);

/// Check that `s` is well-formed UTF-8.
[[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept;

/**
 * Copy `s`, replacing every invalid sequence with U+FFFD.
 *
 * @param had_errors Set to true if at least one replacement was made
 */
[[nodiscard]] std::string to_valid_utf8(std::string_view s, bool & had_errors);

/// Number of code points in `s` (continuation bytes are not counted).
[[nodiscard]] size_t char_count(std::string_view s) noexcept;

/// Convert a byte offset into a character offset.
[[nodiscard]] size_t char_offset(std::string_view s, size_t byte_offset) noexcept;

/// True if `byte_offset` is the start of a code point (or the end of `s`).
[[nodiscard]] bool is_char_boundary(std::string_view s, size_t byte_offset) noexcept;

// ============================================================================
// Character classes
// ============================================================================

/// Unicode White_Space property.
[[nodiscard]] bool is_whitespace(char32_t cp) noexcept;

/// Alphabetic property or a numeric category (marks, punctuation and spaces excluded).
[[nodiscard]] bool is_alphanumeric(char32_t cp) noexcept;

/// Letters of any script.
[[nodiscard]] bool is_alphabetic(char32_t cp) noexcept;

/// Unicode Lowercase property.
[[nodiscard]] bool is_lowercase(char32_t cp) noexcept;

// ============================================================================
// String helpers
// ============================================================================

/// Strip leading and trailing Unicode whitespace.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/// True if `s` is empty or only whitespace.
[[nodiscard]] bool is_blank(std::string_view s) noexcept;

/// Number of non-overlapping occurrences of `needle` in `haystack`.
[[nodiscard]] size_t count_occurrences(std::string_view haystack, std::string_view needle) noexcept;

}  // namespace poexam::text
