// poexam/po/words.hpp - Word and character positions in messages
#pragma once

#include <string_view>
#include <vector>

#include "poexam/po/format.hpp"

namespace poexam::po
{

/**
 * Split `s` into words.
 *
 * A word starts with an alphanumeric character and continues with
 * alphanumeric characters or `-`. Format specifiers of `lang` are skipped.
 */
[[nodiscard]] std::vector<TextSpan> find_words(std::string_view s, FormatLanguage lang);

/**
 * Every alphanumeric or `-` character of `s`, format specifiers excluded.
 */
[[nodiscard]] std::vector<TextSpan> find_word_chars(std::string_view s, FormatLanguage lang);

/// Number of words of `s` (see find_words()).
[[nodiscard]] size_t count_words(std::string_view s, FormatLanguage lang);

/// Number of word characters of `s` (see find_word_chars()).
[[nodiscard]] size_t count_word_chars(std::string_view s, FormatLanguage lang);

}  // namespace poexam::po
