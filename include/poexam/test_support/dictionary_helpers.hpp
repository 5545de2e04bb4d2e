// poexam/test_support/dictionary_helpers.hpp - hunspell dictionaries for unit tests
//
// Dictionaries are written to a scratch directory, loaded, then the files are
// removed (hunspell keeps everything in memory once loaded).
//
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "poexam/spelling/dictionary.hpp"

namespace poexam::test_support
{

/// Create a fresh directory under the system temporary directory.
[[nodiscard]] inline std::filesystem::path make_scratch_dir(std::string_view prefix)
{
  static std::atomic<unsigned> counter{0};
  const size_t thread_hash = std::hash<std::thread::id>{}(std::this_thread::get_id());
  const std::filesystem::path dir =
    std::filesystem::temp_directory_path() /
    (std::string(prefix) + "_" + std::to_string(thread_hash) + "_" + std::to_string(counter++));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(const std::filesystem::path & path, std::string_view content)
{
  std::ofstream out(path, std::ios::binary);
  out << content;
}

/// `.dic` contents for a list of words (`word` or `word/flags`).
[[nodiscard]] inline std::string dic_contents(const std::vector<std::string> & words)
{
  std::string dic = std::to_string(words.size()) + "\n";
  for (const auto & word : words) {
    dic += word;
    dic += "\n";
  }
  return dic;
}

/// Load a dictionary made of `words`, throwing if hunspell cannot load it.
[[nodiscard]] inline spelling::DictionaryLoadResult make_dictionary(
  const std::vector<std::string> & words, std::string_view aff = "SET UTF-8\n")
{
  const std::filesystem::path dir = make_scratch_dir("poexam_dict");
  write_file(dir / "test.aff", aff);
  write_file(dir / "test.dic", dic_contents(words));
  auto loaded = spelling::Dictionary::load(dir / "test.aff", dir / "test.dic");
  std::filesystem::remove_all(dir);
  if (!loaded.success) {
    throw std::runtime_error(loaded.error);
  }
  return loaded;
}

}  // namespace poexam::test_support
