// poexam/spelling/spell_check.cpp - Misspelled words of a message
#include "poexam/spelling/spell_check.hpp"

#include <algorithm>
#include <unordered_map>

#include "poexam/po/words.hpp"

namespace poexam::spelling
{

SpellCheckResult check_words(std::string_view s, po::FormatLanguage lang, const Dictionary & dict)
{
  SpellCheckResult result;
  std::unordered_map<std::string_view, bool> checked;

  for (const auto & word : po::find_words(s, lang)) {
    auto it = checked.find(word.text);
    if (it == checked.end()) {
      const bool misspelled = !dict.check(word.text);
      it = checked.emplace(word.text, misspelled).first;
      if (misspelled) {
        result.words.emplace_back(word.text);
      }
    }
    if (it->second) {
      result.highlights.emplace_back(word.start, word.end);
    }
  }

  std::sort(result.words.begin(), result.words.end());
  return result;
}

}  // namespace poexam::spelling
