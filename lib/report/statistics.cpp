// poexam/report/statistics.cpp - Translation progress of catalogs
#include "poexam/report/statistics.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <tuple>

#include "poexam/po/words.hpp"

namespace poexam::report
{

EntryCounts & EntryCounts::operator+=(const EntryCounts & other) noexcept
{
  total += other.total;
  translated += other.translated;
  fuzzy += other.fuzzy;
  untranslated += other.untranslated;
  obsolete += other.obsolete;
  return *this;
}

TextCounts & TextCounts::operator+=(const TextCounts & other) noexcept
{
  id_total += other.id_total;
  id_translated += other.id_translated;
  id_fuzzy += other.id_fuzzy;
  id_untranslated += other.id_untranslated;
  id_obsolete += other.id_obsolete;
  str_translated += other.str_translated;
  str_fuzzy += other.str_fuzzy;
  str_untranslated += other.str_untranslated;
  str_obsolete += other.str_obsolete;
  return *this;
}

namespace
{

/// Add source and translation counts to the group of the entry status.
void add_text_counts(
  TextCounts & counts, const po::Entry & entry, uint64_t id_count, uint64_t str_count)
{
  counts.id_total += id_count;
  if (entry.fuzzy) {
    counts.id_fuzzy += id_count;
    counts.str_fuzzy += str_count;
  } else if (entry.obsolete) {
    counts.id_obsolete += id_count;
    counts.str_obsolete += str_count;
  } else if (entry.is_translated()) {
    counts.id_translated += id_count;
    counts.str_translated += str_count;
  } else {
    counts.id_untranslated += id_count;
  }
}

}  // namespace

FileStats compute_stats(const po::Catalog & catalog, std::string path, bool with_words)
{
  FileStats stats;
  stats.path = std::move(path);
  TextCounts words;
  TextCounts chars;

  for (const auto & entry : catalog.entries) {
    if (entry.is_header()) {
      continue;
    }
    EntryCounts & e = stats.entries;
    ++e.total;
    if (entry.fuzzy) {
      ++e.fuzzy;
    } else if (entry.obsolete) {
      ++e.obsolete;
    } else if (entry.is_translated()) {
      ++e.translated;
    } else {
      ++e.untranslated;
    }

    if (!with_words) {
      continue;
    }
    const po::FormatLanguage lang = entry.format_language();
    const std::string_view id = entry.msgid ? std::string_view(entry.msgid->value) : "";
    const auto str_it = entry.msgstr.find(0);
    const std::string_view str =
      str_it != entry.msgstr.end() ? std::string_view(str_it->second.value) : "";
    add_text_counts(words, entry, po::count_words(id, lang), po::count_words(str, lang));
    add_text_counts(chars, entry, po::count_word_chars(id, lang), po::count_word_chars(str, lang));
  }

  if (with_words) {
    stats.words = words;
    stats.chars = chars;
  }
  return stats;
}

FileStats total_stats(gsl::span<const FileStats> stats)
{
  FileStats total;
  total.path = fmt::format("Total ({})", stats.size());
  for (const auto & s : stats) {
    total.entries += s.entries;
    if (s.words) {
      if (!total.words) {
        total.words.emplace();
      }
      *total.words += *s.words;
    }
    if (s.chars) {
      if (!total.chars) {
        total.chars.emplace();
      }
      *total.chars += *s.chars;
    }
  }
  return total;
}

void sort_stats(std::vector<FileStats> & stats, StatsSort sort)
{
  if (sort == StatsSort::Path) {
    std::sort(stats.begin(), stats.end(), [](const FileStats & a, const FileStats & b) {
      return a.path < b.path;
    });
    return;
  }

  // Descending counts: compare b against a
  const auto key = [](const FileStats & s) {
    const EntryCounts & e = s.entries;
    return std::make_tuple(
      e.ratio(e.translated), e.translated, e.ratio(e.fuzzy), e.fuzzy, e.ratio(e.untranslated),
      e.untranslated, e.ratio(e.obsolete), e.obsolete);
  };
  std::sort(stats.begin(), stats.end(), [&key](const FileStats & a, const FileStats & b) {
    const auto ka = key(a);
    const auto kb = key(b);
    if (ka != kb) {
      return kb < ka;
    }
    return a.path < b.path;
  });
}

}  // namespace poexam::report
