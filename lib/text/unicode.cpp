// poexam/text/unicode.cpp - UTF-8 decoding and character classes
#include "poexam/text/unicode.hpp"

#include <unicode/uchar.h>

#include <algorithm>

namespace poexam::text
{

namespace
{

bool is_continuation(unsigned char c) noexcept { return (c & 0xC0U) == 0x80U; }

UChar32 to_uchar(char32_t cp) noexcept { return static_cast<UChar32>(cp); }

}  // namespace

// ============================================================================
// Decoding
// ============================================================================

DecodedChar decode_at(std::string_view s, size_t pos) noexcept
{
  DecodedChar invalid{k_replacement_char, 1, false};
  if (pos >= s.size()) {
    return {0, 0, false};
  }
  const auto c0 = static_cast<unsigned char>(s[pos]);
  if (c0 < 0x80) {
    return {c0, 1, true};
  }

  uint32_t len = 0;
  char32_t cp = 0;
  char32_t min = 0;
  if ((c0 & 0xE0U) == 0xC0U) {
    len = 2;
    cp = c0 & 0x1FU;
    min = 0x80;
  } else if ((c0 & 0xF0U) == 0xE0U) {
    len = 3;
    cp = c0 & 0x0FU;
    min = 0x800;
  } else if ((c0 & 0xF8U) == 0xF0U) {
    len = 4;
    cp = c0 & 0x07U;
    min = 0x10000;
  } else {
    return invalid;
  }

  if (pos + len > s.size()) {
    return invalid;
  }
  for (uint32_t i = 1; i < len; ++i) {
    const auto c = static_cast<unsigned char>(s[pos + i]);
    if (!is_continuation(c)) {
      return invalid;
    }
    cp = (cp << 6U) | (c & 0x3FU);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return invalid;
  }
  return {cp, len, true};
}

DecodedChar decode_before(std::string_view s, size_t end) noexcept
{
  if (end == 0 || end > s.size()) {
    return {0, 0, false};
  }
  size_t start = end - 1;
  const size_t limit = end >= 4 ? end - 4 : 0;
  while (start > limit && is_continuation(static_cast<unsigned char>(s[start]))) {
    --start;
  }
  const DecodedChar d = decode_at(s, start);
  if (d.valid && start + d.size == end) {
    return d;
  }
  return {k_replacement_char, 1, false};
}

void append_utf8(std::string & out, char32_t cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

bool is_valid_utf8(std::string_view s) noexcept
{
  size_t pos = 0;
  while (pos < s.size()) {
    const DecodedChar d = decode_at(s, pos);
    if (!d.valid) {
      return false;
    }
    pos += d.size;
  }
  return true;
}

std::string to_valid_utf8(std::string_view s, bool & had_errors)
{
  std::string out;
  out.reserve(s.size());
  size_t pos = 0;
  while (pos < s.size()) {
    const DecodedChar d = decode_at(s, pos);
    if (d.valid) {
      out.append(s.substr(pos, d.size));
    } else {
      had_errors = true;
      append_utf8(out, k_replacement_char);
    }
    pos += d.size;
  }
  return out;
}

size_t char_count(std::string_view s) noexcept
{
  return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
    return !is_continuation(static_cast<unsigned char>(c));
  }));
}

size_t char_offset(std::string_view s, size_t byte_offset) noexcept
{
  return char_count(s.substr(0, std::min(byte_offset, s.size())));
}

bool is_char_boundary(std::string_view s, size_t byte_offset) noexcept
{
  if (byte_offset == 0 || byte_offset == s.size()) {
    return true;
  }
  if (byte_offset > s.size()) {
    return false;
  }
  return !is_continuation(static_cast<unsigned char>(s[byte_offset]));
}

// ============================================================================
// Character classes
// ============================================================================

bool is_whitespace(char32_t cp) noexcept { return u_isUWhiteSpace(to_uchar(cp)) != 0; }

bool is_alphanumeric(char32_t cp) noexcept
{
  // Alphabetic property or any numeric general category (Nd, Nl, No)
  return is_alphabetic(cp) || (U_GET_GC_MASK(to_uchar(cp)) & U_GC_N_MASK) != 0;
}

bool is_alphabetic(char32_t cp) noexcept { return u_isUAlphabetic(to_uchar(cp)) != 0; }

bool is_lowercase(char32_t cp) noexcept { return u_isULowercase(to_uchar(cp)) != 0; }

// ============================================================================
// String helpers
// ============================================================================

std::string_view trim(std::string_view s) noexcept
{
  size_t start = 0;
  while (start < s.size()) {
    const DecodedChar d = decode_at(s, start);
    if (!is_whitespace(d.cp)) {
      break;
    }
    start += d.size;
  }
  size_t end = s.size();
  while (end > start) {
    const DecodedChar d = decode_before(s, end);
    if (!is_whitespace(d.cp)) {
      break;
    }
    end -= d.size;
  }
  return s.substr(start, end - start);
}

bool is_blank(std::string_view s) noexcept { return trim(s).empty(); }

size_t count_occurrences(std::string_view haystack, std::string_view needle) noexcept
{
  if (needle.empty()) {
    return 0;
  }
  size_t count = 0;
  size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = haystack.find(needle, pos + needle.size());
  }
  return count;
}

}  // namespace poexam::text
