// poexam/driver/pipeline.hpp - Parallel processing of PO files
//
// Files are read, parsed, linted and counted by a pool of worker threads.
// Results are sorted by path once every worker is done, so the output never
// depends on the order in which files complete.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <gsl/span>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/engine/linter.hpp"
#include "poexam/report/statistics.hpp"
#include "poexam/rules/selection.hpp"

namespace poexam::driver
{

/**
 * Where and how dictionaries are loaded.
 */
struct SpellingOptions
{
  std::filesystem::path path_dicts = "/usr/share/hunspell";
  std::optional<std::filesystem::path> path_words;

  /// Language of the sources (msgctxt, msgid)
  std::string lang_id = "en_US";
};

struct ScanOptions
{
  engine::LintOptions lint;
  SpellingOptions spelling;

  /// Charset forced for every file (empty: use the header charset)
  std::string encoding;

  /// Worker threads, 0 for one per hardware thread
  size_t jobs = 0;

  /// Also count words and characters in FileResult::stats
  bool words = false;
};

/**
 * Outcome for one file.
 */
struct FileResult
{
  std::string path;
  std::vector<Diagnostic> diagnostics;

  /// Set when the file could be parsed (check and stats scans)
  std::optional<report::FileStats> stats;

  /// False if the file could not be read or decoded
  bool read_ok = true;
};

/**
 * Result of a scan.
 */
struct ScanResult
{
  /// One result per file, sorted by path (only valid if success == true)
  std::vector<FileResult> files;

  /// Run-level problems that did not stop the scan
  std::vector<std::string> warnings;

  bool success = false;

  /// Error message if the scan could not start
  std::string error;

  static ScanResult ok(std::vector<FileResult> files, std::vector<std::string> warnings = {})
  {
    ScanResult r;
    r.files = std::move(files);
    r.warnings = std::move(warnings);
    r.success = true;
    return r;
  }

  static ScanResult fail(std::string msg)
  {
    ScanResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

using FileTask = std::function<FileResult(const std::string & path)>;

/// Number of workers used when none is requested.
[[nodiscard]] size_t default_jobs() noexcept;

/// Order results by path.
void sort_file_results(std::vector<FileResult> & results);

/**
 * Run `task` on every file with at most `jobs` threads.
 *
 * @return one result per file, sorted by path
 */
[[nodiscard]] std::vector<FileResult> run_parallel(
  gsl::span<const std::string> files, size_t jobs, const FileTask & task);

class Pipeline
{
public:
  explicit Pipeline(ScanOptions options);

  [[nodiscard]] const ScanOptions & options() const noexcept { return options_; }

  /**
   * Check the PO files under `roots` with the given rules.
   *
   * Fails only if a root does not exist.
   */
  [[nodiscard]] ScanResult check(
    const std::vector<std::string> & roots, const rules::RuleSet & rules) const;

  /**
   * Compute statistics of the PO files under `roots`.
   *
   * Unreadable files get a `read-error` diagnostic and no statistics.
   */
  [[nodiscard]] ScanResult stats(const std::vector<std::string> & roots) const;

  /// Read and parse one file, then lint it (no linter: statistics only).
  [[nodiscard]] FileResult process_file(const std::string & path, const engine::Linter * linter) const;

private:
  [[nodiscard]] size_t worker_count(size_t file_count) const noexcept;

  ScanOptions options_;
};

}  // namespace poexam::driver
