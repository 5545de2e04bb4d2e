// poexam/report/json_output.cpp - JSON serialization of diagnostics and statistics
#include "poexam/report/json_output.hpp"

#include <string>

#include "poexam/text/unicode.hpp"

namespace poexam::report
{
namespace
{

using nlohmann::json;

json j_line(const DiagnosticLine & line)
{
  json highlights = json::array();
  for (const auto & [start, end] : line.highlights) {
    highlights.push_back(
      json::array({text::char_offset(line.text, start), text::char_offset(line.text, end)}));
  }
  return json{
    {"line_number", line.line_number}, {"message", line.text}, {"highlights", highlights}};
}

json j_entries(const EntryCounts & e)
{
  return json{
    {"total", e.total},
    {"translated", e.translated},
    {"fuzzy", e.fuzzy},
    {"untranslated", e.untranslated},
    {"obsolete", e.obsolete}};
}

json j_counts(const TextCounts & c)
{
  return json{
    {"id_total", c.id_total},
    {"id_translated", c.id_translated},
    {"id_fuzzy", c.id_fuzzy},
    {"id_untranslated", c.id_untranslated},
    {"id_obsolete", c.id_obsolete},
    {"str_translated", c.str_translated},
    {"str_fuzzy", c.str_fuzzy},
    {"str_untranslated", c.str_untranslated},
    {"str_obsolete", c.str_obsolete}};
}

}  // namespace

nlohmann::json to_json(const Diagnostic & diag)
{
  json lines = json::array();
  for (const auto & line : diag.lines) {
    lines.push_back(j_line(line));
  }
  return json{
    {"path", diag.path},
    {"rule", diag.rule},
    {"severity", std::string(to_string(diag.severity))},
    {"message", diag.message},
    {"lines", lines}};
}

nlohmann::json to_json(const std::vector<Diagnostic> & diagnostics)
{
  json result = json::array();
  for (const auto & diag : diagnostics) {
    result.push_back(to_json(diag));
  }
  return result;
}

nlohmann::json to_json(const FileStats & stats)
{
  json result{{"path", stats.path}, {"entries", j_entries(stats.entries)}};
  if (stats.words) {
    result["words"] = j_counts(*stats.words);
  }
  if (stats.chars) {
    result["chars"] = j_counts(*stats.chars);
  }
  return result;
}

nlohmann::json to_json(const std::vector<FileStats> & stats)
{
  json result = json::array();
  for (const auto & s : stats) {
    result.push_back(to_json(s));
  }
  return result;
}

}  // namespace poexam::report
