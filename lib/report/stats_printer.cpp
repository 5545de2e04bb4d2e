// poexam/report/stats_printer.cpp - Human readable and JSON catalog statistics
#include "poexam/report/stats_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>

#include "poexam/report/json_output.hpp"

namespace poexam::report
{

namespace
{

std::string repeat(std::string_view s, size_t count)
{
  std::string out;
  out.reserve(s.size() * count);
  for (size_t i = 0; i < count; ++i) {
    out.append(s);
  }
  return out;
}

}  // namespace

std::array<size_t, 4> progress_cells(const EntryCounts & entries) noexcept
{
  const size_t translated = static_cast<size_t>(entries.pct(entries.translated) / 5);
  const size_t fuzzy = static_cast<size_t>(entries.pct(entries.fuzzy) / 5);
  const size_t untranslated = static_cast<size_t>(entries.pct(entries.untranslated) / 5);
  const size_t used = std::min(k_bar_width, translated + fuzzy + untranslated);
  return {translated, fuzzy, untranslated, k_bar_width - used};
}

StatsPrinter::StatsPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void StatsPrinter::print_human(const std::vector<FileStats> & stats)
{
  const bool with_words = std::any_of(
    stats.begin(), stats.end(), [](const FileStats & s) { return s.words.has_value(); });

  if (with_words) {
    for (size_t i = 0; i < stats.size(); ++i) {
      if (i > 0) {
        fmt::print(os_, "\n");
      }
      fmt::print(os_, "{}:\n", stats[i].path);
      print_words_table(stats[i]);
    }
    return;
  }

  size_t width = 0;
  for (const auto & s : stats) {
    width = std::max(width, s.path.size());
  }
  for (const auto & s : stats) {
    fmt::print(os_, "{:<{}} ", s.path, width);
    print_entries(s.entries);
    fmt::print(os_, "\n");
  }
}

void StatsPrinter::print_json(const std::vector<FileStats> & stats)
{
  fmt::print(os_, "{}\n", to_json(stats).dump());
}

// =============================================================================
// Private helpers
// =============================================================================

void StatsPrinter::print_entries(const EntryCounts & e)
{
  const auto cells = progress_cells(e);

  // Fully translated files stand out
  os_ << rang::style::dim << "[" << rang::style::reset << rang::fg::green;
  if (e.translated != e.total) {
    os_ << rang::style::dim;
  }
  os_ << repeat("█", cells[0]) << rang::style::reset << rang::fg::yellow << rang::style::dim
      << repeat("▒", cells[1]) << rang::style::reset << rang::fg::reset
      << repeat(" ", cells[2] + cells[3]) << rang::style::dim << "]" << rang::style::reset;

  fmt::print(os_, " {} = ", e.total);
  os_ << rang::fg::green << rang::style::bold << e.translated << rang::style::reset
      << rang::fg::green << fmt::format(" ({}%)", e.pct(e.translated)) << rang::fg::reset;
  fmt::print(os_, " + ");
  os_ << rang::fg::yellow << rang::style::bold << e.fuzzy << rang::style::reset << rang::fg::yellow
      << fmt::format(" ({}%)", e.pct(e.fuzzy)) << rang::fg::reset;
  fmt::print(os_, " + ");
  os_ << rang::fg::red << rang::style::bold << e.untranslated << rang::style::reset
      << rang::fg::red << fmt::format(" ({}%)", e.pct(e.untranslated)) << rang::fg::reset;
  fmt::print(os_, " + ");
  os_ << rang::fg::magenta << rang::style::bold << e.obsolete << rang::style::reset
      << rang::fg::magenta << fmt::format(" ({}%)", e.pct(e.obsolete)) << rang::fg::reset;
}

void StatsPrinter::print_words_table(const FileStats & stats)
{
  const EntryCounts & e = stats.entries;
  const TextCounts words = stats.words.value_or(TextCounts{});
  const TextCounts chars = stats.chars.value_or(TextCounts{});

  fmt::print(
    os_,
    "                    Entries          Words (src / translated)     Chars (src / translated)\n");

  const auto row = [this](
                     rang::fg color, std::string_view label, uint64_t entries, uint64_t pct_entries,
                     uint64_t words_id, uint64_t pct_words, uint64_t words_str, uint64_t chars_id,
                     uint64_t pct_chars, uint64_t chars_str) {
    os_ << color << rang::style::bold;
    fmt::print(
      os_, "{:<14} {:10} ({:3}%) {:10} ({:3}%) {:10} {:10} ({:3}%) {:10}\n", label, entries,
      pct_entries, words_id, pct_words, words_str, chars_id, pct_chars, chars_str);
    os_ << rang::style::reset << rang::fg::reset;
  };

  row(
    rang::fg::green, "Translated", e.translated, e.pct(e.translated), words.id_translated,
    words.pct_id(words.id_translated), words.str_translated, chars.id_translated,
    chars.pct_id(chars.id_translated), chars.str_translated);
  row(
    rang::fg::yellow, "Fuzzy", e.fuzzy, e.pct(e.fuzzy), words.id_fuzzy,
    words.pct_id(words.id_fuzzy), words.str_fuzzy, chars.id_fuzzy, chars.pct_id(chars.id_fuzzy),
    chars.str_fuzzy);
  row(
    rang::fg::red, "Untranslated", e.untranslated, e.pct(e.untranslated), words.id_untranslated,
    words.pct_id(words.id_untranslated), words.str_untranslated, chars.id_untranslated,
    chars.pct_id(chars.id_untranslated), chars.str_untranslated);
  row(
    rang::fg::magenta, "Obsolete", e.obsolete, e.pct(e.obsolete), words.id_obsolete,
    words.pct_id(words.id_obsolete), words.str_obsolete, chars.id_obsolete,
    chars.pct_id(chars.id_obsolete), chars.str_obsolete);

  os_ << rang::style::bold;
  fmt::print(
    os_, "{:<10}    {:11}       {:11}       {:11}{:11}       {:11}\n", "Total", e.total,
    words.id_total, words.str_translated, chars.id_total, chars.str_translated);
  os_ << rang::style::reset;
}

}  // namespace poexam::report
