// poexam/spelling/dictionary_cache.cpp - Per-language dictionary cache
#include "poexam/spelling/dictionary_cache.hpp"

#include <utility>

namespace poexam::spelling
{

DictionaryCache::DictionaryCache(
  std::filesystem::path path_dicts, std::optional<std::filesystem::path> path_words)
: loader_([dicts = std::move(path_dicts), words = std::move(path_words)](
            const std::string & language) { return load_dictionary(dicts, words, language); })
{
}

DictionaryCache::DictionaryCache(Loader loader) : loader_(std::move(loader)) {}

const DictionaryLoadResult & DictionaryCache::get(const std::string & language)
{
  Slot * slot = nullptr;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    auto & entry = slots_[language];
    if (!entry) {
      entry = std::make_unique<Slot>();
    }
    slot = entry.get();
  }

  // The map lock is released: loading one language does not block others
  std::call_once(slot->once, [this, slot, &language] {
    ++load_count_;
    slot->result = loader_(language);
  });
  return slot->result;
}

}  // namespace poexam::spelling
