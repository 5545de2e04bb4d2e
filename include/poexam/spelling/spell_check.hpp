// poexam/spelling/spell_check.hpp - Misspelled words of a message
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/po/format.hpp"
#include "poexam/spelling/dictionary.hpp"

namespace poexam::spelling
{

struct SpellCheckResult
{
  /// Distinct misspelled words, sorted
  std::vector<std::string> words;

  /// Byte range of every occurrence of a misspelled word, in text order
  std::vector<Highlight> highlights;

  [[nodiscard]] bool empty() const noexcept { return words.empty(); }
};

/**
 * Check every word of `s` (format specifiers of `lang` are skipped).
 *
 * Each distinct word is looked up once.
 */
[[nodiscard]] SpellCheckResult check_words(
  std::string_view s, po::FormatLanguage lang, const Dictionary & dict);

}  // namespace poexam::spelling
