// poexam/po/format.cpp - Format string scanner (C, Python)
#include "poexam/po/format.hpp"

#include <cctype>

#include "poexam/text/unicode.hpp"

namespace poexam::po
{

namespace
{

constexpr bool is_ascii_digit(char c) noexcept { return c >= '0' && c <= '9'; }

bool is_ascii_alpha(char c) noexcept { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

size_t find_end_c(std::string_view s, size_t pos) noexcept
{
  const size_t len = s.size();
  while (pos < len) {
    const char c = s[pos];
    if (c == '-' || c == '+' || c == ' ' || c == '#' || c == '.' || c == '$' || is_ascii_digit(c)) {
      ++pos;
    } else {
      break;
    }
  }

  // Length modifier
  if (pos < len) {
    switch (s[pos]) {
      case 'h':
      case 'l':
        ++pos;
        if (pos < len && s[pos] == s[pos - 1]) {
          ++pos;
        }
        break;
      case 'q':
      case 'L':
      case 'j':
      case 'z':
      case 'Z':
      case 't':
        ++pos;
        break;
      default:
        break;
    }
  }

  if (pos < len && is_ascii_alpha(s[pos])) {
    ++pos;
  }
  return pos;
}

size_t find_end_python(std::string_view s, size_t pos) noexcept
{
  const size_t len = s.size();

  // Mapping key: %(name)s
  if (pos < len && s[pos] == '(') {
    const size_t close = s.find(')', pos);
    if (close == std::string_view::npos) {
      return len;
    }
    pos = close + 1;
  }

  while (pos < len) {
    const char c = s[pos];
    if (c == '-' || c == '+' || c == ' ' || c == '#' || c == '.' || is_ascii_digit(c)) {
      ++pos;
    } else {
      break;
    }
  }

  if (pos < len && (s[pos] == 'h' || s[pos] == 'l' || s[pos] == 'L')) {
    ++pos;
  }

  if (pos < len && is_ascii_alpha(s[pos])) {
    ++pos;
  }
  return pos;
}

size_t find_end_python_brace(std::string_view s, size_t pos) noexcept
{
  int level = 1;
  while (pos < s.size()) {
    if (s[pos] == '{') {
      ++level;
    } else if (s[pos] == '}') {
      --level;
      if (level <= 0) {
        return pos + 1;
      }
    }
    ++pos;
  }
  return pos;
}

}  // namespace

FormatLanguage format_language_from_name(std::string_view name) noexcept
{
  if (name == "c") {
    return FormatLanguage::C;
  }
  if (name == "python") {
    return FormatLanguage::Python;
  }
  if (name == "python-brace") {
    return FormatLanguage::PythonBrace;
  }
  return FormatLanguage::None;
}

std::string_view format_language_display_name(FormatLanguage lang) noexcept
{
  switch (lang) {
    case FormatLanguage::C:
      return "C";
    case FormatLanguage::Python:
      return "Python";
    case FormatLanguage::PythonBrace:
      return "Python brace";
    case FormatLanguage::None:
      break;
  }
  return "none";
}

namespace detail
{

std::pair<size_t, bool> next_format_char(std::string_view s, size_t pos, FormatLanguage lang) noexcept
{
  char introducer = '\0';
  switch (lang) {
    case FormatLanguage::C:
    case FormatLanguage::Python:
      introducer = '%';
      break;
    case FormatLanguage::PythonBrace:
      introducer = '{';
      break;
    case FormatLanguage::None:
      return {pos, false};
  }
  if (pos + 1 >= s.size() || s[pos] != introducer) {
    return {pos, false};
  }
  // Doubled introducer is an escape: skip the first one only
  return {pos + 1, s[pos + 1] != introducer};
}

size_t find_format_end(std::string_view s, size_t pos, FormatLanguage lang) noexcept
{
  switch (lang) {
    case FormatLanguage::C:
      return find_end_c(s, pos);
    case FormatLanguage::Python:
      return find_end_python(s, pos);
    case FormatLanguage::PythonBrace:
      return find_end_python_brace(s, pos);
    case FormatLanguage::None:
      break;
  }
  return pos;
}

}  // namespace detail

std::vector<TextSpan> find_formats(std::string_view s, FormatLanguage lang)
{
  std::vector<TextSpan> result;
  if (lang == FormatLanguage::None) {
    return result;
  }
  size_t pos = 0;
  while (pos < s.size()) {
    const size_t start = pos;
    const auto [next, is_format] = detail::next_format_char(s, pos, lang);
    pos = next;
    if (pos >= s.size()) {
      break;
    }
    if (is_format) {
      pos = detail::find_format_end(s, pos, lang);
      result.push_back(TextSpan{s.substr(start, pos - start), start, pos});
      continue;
    }
    pos += text::decode_at(s, pos).size;
  }
  return result;
}

size_t format_sort_index(std::string_view fmt) noexcept
{
  if (fmt.empty() || fmt[0] != '%') {
    return k_no_format_index;
  }
  size_t pos = 1;
  while (pos < fmt.size() && is_ascii_digit(fmt[pos])) {
    ++pos;
  }
  if (pos == 1 || pos >= fmt.size() || fmt[pos] != '$') {
    return k_no_format_index;
  }
  size_t index = 0;
  for (size_t i = 1; i < pos; ++i) {
    const size_t digit = static_cast<size_t>(fmt[i] - '0');
    if (index > (k_no_format_index - digit) / 10) {
      return k_no_format_index;
    }
    index = index * 10 + digit;
  }
  return index;
}

std::string format_strip_index(std::string_view fmt)
{
  if (format_sort_index(fmt) == k_no_format_index) {
    return std::string(fmt);
  }
  const size_t dollar = fmt.find('$');
  std::string result("%");
  result.append(fmt.substr(dollar + 1));
  return result;
}

}  // namespace poexam::po
