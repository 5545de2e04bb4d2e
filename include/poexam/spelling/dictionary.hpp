// poexam/spelling/dictionary.hpp - Hunspell dictionaries
#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class Hunspell;

namespace poexam::po
{
class CharsetEncoder;
}  // namespace poexam::po

namespace poexam::spelling
{

class Dictionary;

/**
 * Result of loading a dictionary.
 */
struct DictionaryLoadResult
{
  /// Loaded dictionary (only valid if success == true)
  std::shared_ptr<const Dictionary> dictionary;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static DictionaryLoadResult ok(std::shared_ptr<const Dictionary> dict)
  {
    DictionaryLoadResult r;
    r.dictionary = std::move(dict);
    r.success = true;
    return r;
  }

  static DictionaryLoadResult fail(std::string msg)
  {
    DictionaryLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * A hunspell dictionary of one language.
 *
 * Words are passed in UTF-8 and converted to the charset declared by the
 * `SET` line of the affix file. Hunspell is not thread safe, so calls are
 * serialized; a loaded dictionary is shared by every worker.
 */
class Dictionary
{
public:
  ~Dictionary();

  Dictionary(const Dictionary &) = delete;
  Dictionary & operator=(const Dictionary &) = delete;

  /**
   * Load a dictionary from its affix and word files.
   *
   * @param word_files Candidate extra word lists; the first readable one is
   *                   added with add_words_file()
   */
  [[nodiscard]] static DictionaryLoadResult load(
    const std::filesystem::path & aff_path, const std::filesystem::path & dic_path,
    const std::vector<std::filesystem::path> & word_files = {});

  /**
   * Check a word.
   *
   * Words without letters are always accepted. Words that cannot be
   * represented in the dictionary charset are rejected.
   */
  [[nodiscard]] bool check(std::string_view word) const;

  /// Add a word accepted in addition to the dictionary (no affixes).
  void add_word(std::string_view word);

  /**
   * Add every line of a plain word list (`word` or `word/flags`, UTF-8).
   *
   * @return false if the file cannot be read
   */
  bool add_words_file(const std::filesystem::path & path);

  /// Charset of the dictionary files
  [[nodiscard]] const std::string & encoding() const noexcept;

private:
  Dictionary(std::unique_ptr<Hunspell> hunspell, std::unique_ptr<po::CharsetEncoder> encoder);

  mutable std::mutex mutex_;
  std::unique_ptr<Hunspell> hunspell_;
  std::unique_ptr<po::CharsetEncoder> encoder_;  // guarded by mutex_
};

/**
 * Find and load the dictionary of a language (`pt_BR`, `fr`).
 *
 * `path_dicts/pt_BR.{aff,dic}` is tried first, then `path_dicts/pt.{aff,dic}`.
 * Extra words are read from `path_words/pt_BR.dic` (or `path_words/pt.dic`)
 * when `path_words` is set.
 */
[[nodiscard]] DictionaryLoadResult load_dictionary(
  const std::filesystem::path & path_dicts, const std::optional<std::filesystem::path> & path_words,
  std::string_view language);

}  // namespace poexam::spelling
