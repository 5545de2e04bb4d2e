// poexam/driver/pipeline.cpp - Parallel processing of PO files
#include "poexam/driver/pipeline.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

#include "poexam/basic/file_io.hpp"
#include "poexam/driver/discovery.hpp"
#include "poexam/po/parser.hpp"
#include "poexam/rules/rule.hpp"
#include "poexam/spelling/dictionary_cache.hpp"

namespace poexam::driver
{

namespace
{

/// Workers used when the hardware concurrency is unknown
constexpr size_t k_fallback_jobs = 8;

// ============================================================================
// WorkQueue
// ============================================================================

/**
 * Paths waiting for a worker. Workers block until a path is available or
 * the queue is closed.
 */
class WorkQueue
{
public:
  void push(std::string path)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push(std::move(path));
    }
    cv_.notify_one();
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  /// Next path, std::nullopt once the queue is closed and drained
  std::optional<std::string> pop()
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
      return std::nullopt;
    }
    std::string path = std::move(queue_.front());
    queue_.pop();
    return path;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  bool closed_ = false;
};

/// Results sent back by the workers, in completion order
class ResultChannel
{
public:
  void send(FileResult result)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(std::move(result));
  }

  std::vector<FileResult> drain()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::move(results_);
  }

private:
  std::mutex mutex_;
  std::vector<FileResult> results_;
};

FileResult read_error(const std::string & path, std::string message)
{
  FileResult result;
  result.path = path;
  result.read_ok = false;
  DiagnosticBag bag;
  bag.report(path, std::string(rules::k_read_error_rule), Severity::Error, std::move(message));
  result.diagnostics = bag.take();
  return result;
}

}  // namespace

size_t default_jobs() noexcept
{
  const unsigned int n = std::thread::hardware_concurrency();
  return n == 0 ? k_fallback_jobs : static_cast<size_t>(n);
}

void sort_file_results(std::vector<FileResult> & results)
{
  std::sort(results.begin(), results.end(), [](const FileResult & a, const FileResult & b) {
    return a.path < b.path;
  });
}

std::vector<FileResult> run_parallel(
  gsl::span<const std::string> files, size_t jobs, const FileTask & task)
{
  WorkQueue queue;
  ResultChannel channel;
  for (const auto & path : files) {
    queue.push(path);
  }
  queue.close();

  const size_t worker_count = std::max<size_t>(1, std::min(jobs, files.size()));
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back([&queue, &channel, &task] {
      while (auto path = queue.pop()) {
        try {
          channel.send(task(*path));
        } catch (const std::exception & e) {
          channel.send(read_error(*path, e.what()));
        }
      }
    });
  }
  for (auto & worker : workers) {
    worker.join();
  }

  std::vector<FileResult> results = channel.drain();
  sort_file_results(results);
  return results;
}

// ============================================================================
// Pipeline
// ============================================================================

Pipeline::Pipeline(ScanOptions options) : options_(std::move(options)) {}

size_t Pipeline::worker_count(size_t file_count) const noexcept
{
  const size_t jobs = options_.jobs == 0 ? default_jobs() : options_.jobs;
  return std::min(jobs, std::max<size_t>(1, file_count));
}

FileResult Pipeline::process_file(const std::string & path, const engine::Linter * linter) const
{
  FileReadResult data = read_file(path);
  if (!data.success) {
    return read_error(path, std::move(data.error));
  }

  po::ParseOptions parse_options;
  parse_options.encoding = options_.encoding;
  po::ParseResult parsed = po::parse_catalog(data.content, parse_options);
  if (!parsed.success) {
    return read_error(path, std::move(parsed.error));
  }

  FileResult result;
  result.path = path;
  if (linter) {
    result.diagnostics = linter->lint(parsed.catalog, path);
  }
  result.stats = report::compute_stats(parsed.catalog, path, options_.words);
  return result;
}

ScanResult Pipeline::check(
  const std::vector<std::string> & roots, const rules::RuleSet & rules) const
{
  DiscoveryResult discovered = find_po_files(roots);
  if (!discovered.success) {
    return ScanResult::fail(std::move(discovered.error));
  }

  std::vector<std::string> warnings;
  engine::Linter linter(rules, options_.lint);

  // Loaded before dispatch, read-only afterwards
  spelling::DictionaryLoadResult source_dictionary;
  if (linter.needs_source_dictionary()) {
    source_dictionary = spelling::load_dictionary(
      options_.spelling.path_dicts, options_.spelling.path_words, options_.spelling.lang_id);
    if (source_dictionary.success) {
      linter.with_source_dictionary(source_dictionary.dictionary.get());
    } else {
      warnings.push_back(source_dictionary.error);
    }
  }

  std::unique_ptr<spelling::DictionaryCache> cache;
  if (linter.needs_translation_dictionary()) {
    cache = std::make_unique<spelling::DictionaryCache>(
      options_.spelling.path_dicts, options_.spelling.path_words);
    linter.with_dictionary_cache(cache.get());
  }

  auto files = run_parallel(
    discovered.files, worker_count(discovered.files.size()),
    [this, &linter](const std::string & path) { return process_file(path, &linter); });
  return ScanResult::ok(std::move(files), std::move(warnings));
}

ScanResult Pipeline::stats(const std::vector<std::string> & roots) const
{
  DiscoveryResult discovered = find_po_files(roots);
  if (!discovered.success) {
    return ScanResult::fail(std::move(discovered.error));
  }
  auto files = run_parallel(
    discovered.files, worker_count(discovered.files.size()),
    [this](const std::string & path) { return process_file(path, nullptr); });
  return ScanResult::ok(std::move(files));
}

}  // namespace poexam::driver
