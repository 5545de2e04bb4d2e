// poexam/report/stats_printer.hpp - Human readable and JSON catalog statistics
#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <vector>

#include "poexam/report/statistics.hpp"

namespace poexam::report
{

/// Width of the progress bar, in cells
inline constexpr size_t k_bar_width = 20;

/**
 * Cells of the progress bar for translated, fuzzy, untranslated and
 * obsolete entries (5% per cell, obsolete takes the rest).
 */
[[nodiscard]] std::array<size_t, 4> progress_cells(const EntryCounts & entries) noexcept;

/**
 * Prints statistics.
 *
 * Produces output like:
 *   po/de.po [████████████████▒▒  ] 120 = 100 (83%) + 10 (8%) + 10 (8%) + 0 (0%)
 */
class StatsPrinter
{
public:
  explicit StatsPrinter(std::ostream & os, bool use_color = true);

  /// One line per file, or one table per file when words were counted.
  void print_human(const std::vector<FileStats> & stats);

  void print_json(const std::vector<FileStats> & stats);

private:
  void print_entries(const EntryCounts & entries);
  void print_words_table(const FileStats & stats);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace poexam::report
