// poexam/po/words.cpp - Word and character positions in messages
#include "poexam/po/words.hpp"

#include <optional>

#include "poexam/text/unicode.hpp"

namespace poexam::po
{

std::vector<TextSpan> find_words(std::string_view s, FormatLanguage lang)
{
  std::vector<TextSpan> words;
  size_t pos = 0;
  std::optional<size_t> start;
  size_t end = 0;

  while (pos < s.size()) {
    if (!start) {
      const auto [next, is_format] = detail::next_format_char(s, pos, lang);
      pos = next;
      if (pos >= s.size()) {
        break;
      }
      if (is_format) {
        pos = detail::find_format_end(s, pos, lang);
        continue;
      }
    }
    const text::DecodedChar c = text::decode_at(s, pos);
    if (text::is_alphanumeric(c.cp) || (start && c.cp == '-')) {
      if (!start) {
        start = pos;
      }
      end = pos + c.size;
    } else if (start) {
      // End of word: the current char is scanned again (it may start a format)
      words.push_back(TextSpan{s.substr(*start, end - *start), *start, end});
      start.reset();
      continue;
    }
    pos += c.size;
  }

  if (start) {
    words.push_back(TextSpan{s.substr(*start, end - *start), *start, end});
  }
  return words;
}

std::vector<TextSpan> find_word_chars(std::string_view s, FormatLanguage lang)
{
  std::vector<TextSpan> chars;
  size_t pos = 0;
  while (pos < s.size()) {
    const auto [next, is_format] = detail::next_format_char(s, pos, lang);
    pos = next;
    if (pos >= s.size()) {
      break;
    }
    if (is_format) {
      pos = detail::find_format_end(s, pos, lang);
      continue;
    }
    const text::DecodedChar c = text::decode_at(s, pos);
    if (text::is_alphanumeric(c.cp) || c.cp == '-') {
      chars.push_back(TextSpan{s.substr(pos, c.size), pos, pos + c.size});
    }
    pos += c.size;
  }
  return chars;
}

size_t count_words(std::string_view s, FormatLanguage lang) { return find_words(s, lang).size(); }

size_t count_word_chars(std::string_view s, FormatLanguage lang)
{
  return find_word_chars(s, lang).size();
}

}  // namespace poexam::po
