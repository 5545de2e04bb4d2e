// poexam/basic/diagnostic.cpp - Diagnostic implementation
#include "poexam/basic/diagnostic.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iterator>
#include <utility>

#include "poexam/text/unicode.hpp"

namespace poexam
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Info:
      return "info";
    case Severity::Warning:
      return "warning";
    case Severity::Error:
      return "error";
  }
  return "error";
}

std::optional<Severity> parse_severity(std::string_view name) noexcept
{
  if (name == "info") {
    return Severity::Info;
  }
  if (name == "warning") {
    return Severity::Warning;
  }
  if (name == "error") {
    return Severity::Error;
  }
  return std::nullopt;
}

std::string DiagnosticField::name() const
{
  switch (kind) {
    case FieldKind::None:
      return {};
    case FieldKind::Context:
      return "msgctxt";
    case FieldKind::Source:
      return "msgid";
    case FieldKind::SourcePlural:
      return "msgid_plural";
    case FieldKind::Translation:
      return fmt::format("msgstr[{}]", index);
  }
  return {};
}

uint32_t Diagnostic::line() const noexcept
{
  for (const auto & l : lines) {
    if (l.line_number != 0) {
      return l.line_number;
    }
  }
  return 0;
}

std::vector<FieldSpan> Diagnostic::field_spans() const
{
  std::vector<FieldSpan> spans;
  for (const auto & l : lines) {
    for (const auto & [start, end] : l.highlights) {
      spans.push_back(
        FieldSpan{l.field, text::char_offset(l.text, start), text::char_offset(l.text, end)});
    }
  }
  return spans;
}

std::vector<std::string> Diagnostic::highlighted_texts() const
{
  std::vector<std::string> texts;
  for (const auto & l : lines) {
    for (const auto & [start, end] : l.highlights) {
      texts.push_back(l.text.substr(start, end - start));
    }
  }
  return texts;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_line(
  DiagnosticField field, uint32_t line_number, std::string text, std::vector<Highlight> highlights)
{
  const auto is_invalid = [&text](const Highlight & hl) {
    return hl.first >= hl.second || hl.second > text.size() ||
           !text::is_char_boundary(text, hl.first) || !text::is_char_boundary(text, hl.second);
  };
  highlights.erase(
    std::remove_if(highlights.begin(), highlights.end(), is_invalid), highlights.end());
  diagnostic_.lines.push_back(
    DiagnosticLine{field, line_number, std::move(text), std::move(highlights)});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_separator()
{
  diagnostic_.lines.push_back(DiagnosticLine{});
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  std::string path, std::string rule, Severity severity, std::string message)
{
  Diagnostic d;
  d.path = std::move(path);
  d.rule = std::move(rule);
  d.severity = severity;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

std::vector<Diagnostic> DiagnosticBag::take()
{
  std::vector<Diagnostic> result = std::move(diagnostics_);
  diagnostics_.clear();
  return result;
}

}  // namespace poexam
