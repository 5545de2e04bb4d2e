// poexam/report/statistics.hpp - Translation progress of catalogs
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <vector>

#include "poexam/po/catalog.hpp"

namespace poexam::report
{

/**
 * Entries of a catalog by status.
 *
 * An entry has exactly one status, checked in this order: fuzzy, obsolete,
 * translated, untranslated. The header is not counted.
 */
struct EntryCounts
{
  uint64_t total = 0;
  uint64_t translated = 0;
  uint64_t fuzzy = 0;
  uint64_t untranslated = 0;
  uint64_t obsolete = 0;

  /// Integer percentage `count * 100 / total` (0 if there are no entries)
  [[nodiscard]] uint64_t pct(uint64_t count) const noexcept
  {
    return total == 0 ? 0 : count * 100 / total;
  }

  /// Ratio scaled to 1,000,000 (used to sort by status)
  [[nodiscard]] uint64_t ratio(uint64_t count) const noexcept
  {
    return total == 0 ? 0 : count * 1000000 / total;
  }

  EntryCounts & operator+=(const EntryCounts & other) noexcept;
};

/**
 * Words or characters of the source (`id_*`) and translation (`str_*`) of
 * each group of entries.
 */
struct TextCounts
{
  uint64_t id_total = 0;
  uint64_t id_translated = 0;
  uint64_t id_fuzzy = 0;
  uint64_t id_untranslated = 0;
  uint64_t id_obsolete = 0;
  uint64_t str_translated = 0;
  uint64_t str_fuzzy = 0;
  uint64_t str_untranslated = 0;
  uint64_t str_obsolete = 0;

  [[nodiscard]] uint64_t pct_id(uint64_t count) const noexcept
  {
    return id_total == 0 ? 0 : count * 100 / id_total;
  }

  TextCounts & operator+=(const TextCounts & other) noexcept;
};

struct FileStats
{
  std::string path;
  EntryCounts entries;

  /// Only computed on demand
  std::optional<TextCounts> words;
  std::optional<TextCounts> chars;
};

enum class StatsSort : uint8_t {
  Path,
  Status,
};

/**
 * Count the entries of a catalog.
 *
 * With `with_words`, words and characters of msgid and msgstr[0] are
 * counted too (format specifiers excluded).
 */
[[nodiscard]] FileStats compute_stats(const po::Catalog & catalog, std::string path, bool with_words);

/// Sum of several files, with path "Total (N)".
[[nodiscard]] FileStats total_stats(gsl::span<const FileStats> stats);

/**
 * Sort by path, or by status: most translated first (by ratio, then
 * count), then fuzzy, untranslated and obsolete the same way, then path.
 */
void sort_stats(std::vector<FileStats> & stats, StatsSort sort);

}  // namespace poexam::report
