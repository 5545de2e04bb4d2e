// poexam/spelling/dictionary_cache.hpp - Per-language dictionary cache
//
// Shared by every worker of a scan. Each language is loaded at most once;
// concurrent requests for the same language wait for that single load.
//
#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "poexam/spelling/dictionary.hpp"

namespace poexam::spelling
{

class DictionaryCache
{
public:
  using Loader = std::function<DictionaryLoadResult(const std::string & language)>;

  /// Cache loading dictionaries with load_dictionary().
  DictionaryCache(std::filesystem::path path_dicts, std::optional<std::filesystem::path> path_words);

  /// Cache with a custom loader.
  explicit DictionaryCache(Loader loader);

  DictionaryCache(const DictionaryCache &) = delete;
  DictionaryCache & operator=(const DictionaryCache &) = delete;

  /**
   * Get the dictionary of a language, loading it on first use.
   *
   * Failures are cached too. The reference stays valid as long as the cache.
   */
  [[nodiscard]] const DictionaryLoadResult & get(const std::string & language);

  /// Number of times the loader was called
  [[nodiscard]] size_t load_count() const noexcept { return load_count_.load(); }

private:
  struct Slot
  {
    std::once_flag once;
    DictionaryLoadResult result;
  };

  Loader loader_;
  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<Slot>> slots_;
  std::atomic<size_t> load_count_{0};
};

}  // namespace poexam::spelling
