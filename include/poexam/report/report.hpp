// poexam/report/report.hpp - Aggregated result of a check
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/driver/pipeline.hpp"

namespace poexam::report
{

/**
 * Display order of diagnostics.
 */
enum class SortOrder : uint8_t {
  /// Path, then line numbers
  Line,
  /// Text of the first line, then path and line numbers
  Message,
  /// Rule, then path and line numbers
  Rule,
};

/// Problems of one file, by severity
struct FileCounts
{
  std::string path;
  size_t errors = 0;
  size_t warnings = 0;
  size_t infos = 0;

  [[nodiscard]] size_t problems() const noexcept { return errors + warnings + infos; }
};

struct Report
{
  /// Files by path; within a file, by line then rule
  std::vector<Diagnostic> diagnostics;

  size_t files_checked = 0;
  size_t files_with_problems = 0;
  size_t errors = 0;
  size_t warnings = 0;
  size_t infos = 0;
  std::chrono::milliseconds elapsed{0};

  /// Diagnostics per rule, most frequent first (then by rule)
  std::vector<std::pair<std::string, size_t>> rule_counts;

  /// One entry per file, by path
  std::vector<FileCounts> file_counts;

  /// Highlighted words of spelling diagnostics, sorted and unique
  std::vector<std::string> misspelled_words;

  [[nodiscard]] size_t problems() const noexcept { return errors + warnings + infos; }

  /// 0 when no diagnostic was found, 1 otherwise
  [[nodiscard]] int exit_code() const noexcept { return problems() == 0 ? 0 : 1; }
};

/**
 * Merge the results of a scan.
 *
 * Results may come in any order; the report is the same.
 */
[[nodiscard]] Report aggregate(
  std::vector<driver::FileResult> results, std::chrono::milliseconds elapsed);

/// Sort diagnostics for display (stable).
void sort_diagnostics(std::vector<Diagnostic> & diagnostics, SortOrder order);

/// "line", "message" or "rule", std::nullopt if unknown.
[[nodiscard]] std::optional<SortOrder> parse_sort_order(std::string_view name) noexcept;

/**
 * Summary line, e.g.
 * "3 files checked: 5 problems in 2 files (1 errors, 2 warnings, 2 info) [12ms]".
 */
[[nodiscard]] std::string summary_line(const Report & report);

/// "Errors by rule:" followed by one "  rule: count" line per rule.
[[nodiscard]] std::vector<std::string> rule_stats_lines(const Report & report);

/// One "path: all OK!" or "path: N problems (...)" line per file.
[[nodiscard]] std::vector<std::string> file_stats_lines(const Report & report);

}  // namespace poexam::report
