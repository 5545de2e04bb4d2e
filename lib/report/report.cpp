// poexam/report/report.cpp - Aggregated result of a check
#include "poexam/report/report.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

namespace poexam::report
{

namespace
{

std::vector<uint32_t> line_numbers(const Diagnostic & diag)
{
  std::vector<uint32_t> numbers;
  numbers.reserve(diag.lines.size());
  for (const auto & line : diag.lines) {
    numbers.push_back(line.line_number);
  }
  return numbers;
}

std::string_view first_line_text(const Diagnostic & diag)
{
  return diag.lines.empty() ? std::string_view{} : std::string_view(diag.lines.front().text);
}

bool is_spelling_rule(std::string_view rule) { return rule.substr(0, 9) == "spelling-"; }

}  // namespace

Report aggregate(std::vector<driver::FileResult> results, std::chrono::milliseconds elapsed)
{
  driver::sort_file_results(results);

  Report report;
  report.elapsed = elapsed;
  std::map<std::string, size_t> by_rule;
  std::set<std::string> misspelled;

  for (auto & file : results) {
    ++report.files_checked;
    FileCounts counts;
    counts.path = file.path;

    std::stable_sort(
      file.diagnostics.begin(), file.diagnostics.end(),
      [](const Diagnostic & a, const Diagnostic & b) {
        return std::make_tuple(a.line(), std::string_view(a.rule)) <
               std::make_tuple(b.line(), std::string_view(b.rule));
      });

    for (auto & diag : file.diagnostics) {
      switch (diag.severity) {
        case Severity::Error:
          ++counts.errors;
          break;
        case Severity::Warning:
          ++counts.warnings;
          break;
        case Severity::Info:
          ++counts.infos;
          break;
      }
      ++by_rule[diag.rule];
      if (is_spelling_rule(diag.rule)) {
        for (auto & text : diag.highlighted_texts()) {
          misspelled.insert(std::move(text));
        }
      }
      report.diagnostics.push_back(std::move(diag));
    }

    report.errors += counts.errors;
    report.warnings += counts.warnings;
    report.infos += counts.infos;
    if (counts.problems() > 0) {
      ++report.files_with_problems;
    }
    report.file_counts.push_back(std::move(counts));
  }

  report.rule_counts.assign(by_rule.begin(), by_rule.end());
  std::stable_sort(
    report.rule_counts.begin(), report.rule_counts.end(),
    [](const auto & a, const auto & b) { return a.second > b.second; });
  report.misspelled_words.assign(misspelled.begin(), misspelled.end());
  return report;
}

void sort_diagnostics(std::vector<Diagnostic> & diagnostics, SortOrder order)
{
  switch (order) {
    case SortOrder::Line:
      std::stable_sort(
        diagnostics.begin(), diagnostics.end(), [](const Diagnostic & a, const Diagnostic & b) {
          return std::make_tuple(std::string_view(a.path), line_numbers(a)) <
                 std::make_tuple(std::string_view(b.path), line_numbers(b));
        });
      break;
    case SortOrder::Message:
      std::stable_sort(
        diagnostics.begin(), diagnostics.end(), [](const Diagnostic & a, const Diagnostic & b) {
          return std::make_tuple(first_line_text(a), std::string_view(a.path), line_numbers(a)) <
                 std::make_tuple(first_line_text(b), std::string_view(b.path), line_numbers(b));
        });
      break;
    case SortOrder::Rule:
      std::stable_sort(
        diagnostics.begin(), diagnostics.end(), [](const Diagnostic & a, const Diagnostic & b) {
          return std::make_tuple(std::string_view(a.rule), std::string_view(a.path), line_numbers(a)) <
                 std::make_tuple(std::string_view(b.rule), std::string_view(b.path), line_numbers(b));
        });
      break;
  }
}

std::optional<SortOrder> parse_sort_order(std::string_view name) noexcept
{
  if (name == "line") {
    return SortOrder::Line;
  }
  if (name == "message") {
    return SortOrder::Message;
  }
  if (name == "rule") {
    return SortOrder::Rule;
  }
  return std::nullopt;
}

std::string summary_line(const Report & report)
{
  const auto elapsed = report.elapsed.count();
  if (report.files_with_problems == 0) {
    if (report.files_checked == 0) {
      return fmt::format("No files checked [{}ms]", elapsed);
    }
    return fmt::format("{} files checked: all OK! [{}ms]", report.files_checked, elapsed);
  }
  return fmt::format(
    "{} files checked: {} problems in {} files ({} errors, {} warnings, {} info) [{}ms]",
    report.files_checked, report.problems(), report.files_with_problems, report.errors,
    report.warnings, report.infos, elapsed);
}

std::vector<std::string> rule_stats_lines(const Report & report)
{
  std::vector<std::string> lines;
  lines.emplace_back("Errors by rule:");
  for (const auto & [rule, count] : report.rule_counts) {
    lines.push_back(fmt::format("  {}: {}", rule, count));
  }
  return lines;
}

std::vector<std::string> file_stats_lines(const Report & report)
{
  std::vector<std::string> lines;
  for (const auto & file : report.file_counts) {
    if (file.problems() == 0) {
      lines.push_back(fmt::format("{}: all OK!", file.path));
    } else {
      lines.push_back(fmt::format(
        "{}: {} problems ({} errors, {} warnings, {} info)", file.path, file.problems(),
        file.errors, file.warnings, file.infos));
    }
  }
  return lines;
}

}  // namespace poexam::report
