// poexam/spelling/dictionary.cpp - Hunspell dictionaries
#include "poexam/spelling/dictionary.hpp"

#include <fmt/core.h>
#include <hunspell/hunspell.hxx>

#include <fstream>
#include <vector>

#include "poexam/basic/file_io.hpp"
#include "poexam/po/charset.hpp"
#include "poexam/text/unicode.hpp"

namespace poexam::spelling
{

namespace
{

/// Word part of a word list line (`word/flags`, `word\tmorphology`).
std::string word_of_line(std::string_view line)
{
  const size_t end = line.find_first_of("\t ");
  if (end != std::string_view::npos) {
    line = line.substr(0, end);
  }
  std::string out;
  for (size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size() && line[i + 1] == '/') {
      continue;
    }
    if (line[i] == '/' && (i == 0 || line[i - 1] != '\\')) {
      break;
    }
    out += line[i];
  }
  return out;
}

bool has_letter(std::string_view word) noexcept
{
  size_t pos = 0;
  while (pos < word.size()) {
    const text::DecodedChar c = text::decode_at(word, pos);
    if (text::is_alphabetic(c.cp)) {
      return true;
    }
    pos += c.size;
  }
  return false;
}

bool is_readable(const std::filesystem::path & path)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  return in.good();
}

}  // namespace

Dictionary::Dictionary(
  std::unique_ptr<Hunspell> hunspell, std::unique_ptr<po::CharsetEncoder> encoder)
: hunspell_(std::move(hunspell)), encoder_(std::move(encoder))
{
}

Dictionary::~Dictionary() = default;

DictionaryLoadResult Dictionary::load(
  const std::filesystem::path & aff_path, const std::filesystem::path & dic_path,
  const std::vector<std::filesystem::path> & word_files)
{
  for (const auto & path : {aff_path, dic_path}) {
    if (!is_readable(path)) {
      return DictionaryLoadResult::fail(fmt::format("cannot read file: {}", path.string()));
    }
  }

  auto hunspell = std::make_unique<Hunspell>(aff_path.string().c_str(), dic_path.string().c_str());
  const std::string & charset = hunspell->get_dict_encoding();
  auto encoder = po::CharsetEncoder::open(charset);
  if (!encoder) {
    return DictionaryLoadResult::fail(
      fmt::format("unsupported dictionary encoding '{}': {}", charset, aff_path.string()));
  }
  std::shared_ptr<Dictionary> dict(new Dictionary(std::move(hunspell), std::move(encoder)));
  for (const auto & path : word_files) {
    if (dict->add_words_file(path)) {
      break;
    }
  }
  return DictionaryLoadResult::ok(std::move(dict));
}

bool Dictionary::check(std::string_view word) const
{
  if (!has_letter(word)) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto encoded = encoder_->encode(word);
  if (!encoded) {
    return false;
  }
  return hunspell_->spell(*encoded);
}

void Dictionary::add_word(std::string_view word)
{
  const std::string_view trimmed = text::trim(word);
  if (trimmed.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto encoded = encoder_->encode(trimmed)) {
    hunspell_->add(*encoded);
  }
}

bool Dictionary::add_words_file(const std::filesystem::path & path)
{
  const auto content = read_file_to_string(path);
  if (!content) {
    return false;
  }
  size_t pos = 0;
  while (pos < content->size()) {
    size_t eol = content->find('\n', pos);
    if (eol == std::string::npos) {
      eol = content->size();
    }
    std::string_view line(content->data() + pos, eol - pos);
    pos = eol + 1;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    add_word(word_of_line(line));
  }
  return true;
}

const std::string & Dictionary::encoding() const noexcept { return encoder_->name(); }

// ============================================================================
// Lookup by language
// ============================================================================

DictionaryLoadResult load_dictionary(
  const std::filesystem::path & path_dicts, const std::optional<std::filesystem::path> & path_words,
  std::string_view language)
{
  namespace fs = std::filesystem;

  const std::string full(language);
  const size_t underscore = full.find('_');
  std::vector<std::string> names{full};
  if (underscore != std::string::npos) {
    names.push_back(full.substr(0, underscore));
  }

  for (const auto & name : names) {
    const fs::path aff = path_dicts / (name + ".aff");
    const fs::path dic = path_dicts / (name + ".dic");
    std::error_code ec;
    if (!fs::is_regular_file(aff, ec) || !fs::is_regular_file(dic, ec)) {
      continue;
    }
    std::vector<fs::path> word_files;
    if (path_words) {
      for (const auto & words_name : names) {
        word_files.push_back(*path_words / (words_name + ".dic"));
      }
    }
    return Dictionary::load(aff, dic, word_files);
  }

  return DictionaryLoadResult::fail(fmt::format(
    "dictionary not found for language '{}' (path: {}), spelling rule ignored", language,
    path_dicts.string()));
}

}  // namespace poexam::spelling
