// poexam/basic/diagnostic_printer.cpp - Human readable diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "poexam/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace poexam
{

namespace
{

/// Gutter of lines without number (borders, separators, continued lines)
constexpr std::string_view k_empty_gutter = "        |";

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: path:line: [severity:rule] message ===
  print_header(diag);

  if (!diag.lines.empty()) {
    os_ << rang::fg::cyan << k_empty_gutter << rang::fg::reset << "\n";
    for (const auto & line : diag.lines) {
      print_line(line);
    }
    os_ << rang::fg::cyan << k_empty_gutter << rang::fg::reset << "\n";
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(gsl::span<const Diagnostic> diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  os_ << rang::style::bold << diag.path;
  if (!diag.lines.empty()) {
    fmt::print(os_, ":{}", diag.lines.front().line_number);
  }
  os_ << rang::style::reset << ": [";
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red << rang::style::bold << "error";
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow << "warning";
      break;
    case Severity::Info:
      os_ << rang::fg::cyan << "info";
      break;
  }
  os_ << rang::style::reset << rang::fg::reset;
  fmt::print(os_, ":{}] {}\n", diag.rule, diag.message);
}

void DiagnosticPrinter::print_line(const DiagnosticLine & line)
{
  print_gutter(line.line_number);
  print_text(line.text, line.highlights);
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_gutter(uint32_t line_number)
{
  os_ << rang::fg::cyan;
  if (line_number > 0) {
    fmt::print(os_, "{:7} | ", line_number);
  } else {
    fmt::print(os_, "{} ", k_empty_gutter);
  }
  os_ << rang::fg::reset;
}

void DiagnosticPrinter::print_text(std::string_view text, const std::vector<Highlight> & highlights)
{
  // A final line feed does not start a new display line
  if (!text.empty() && text.back() == '\n') {
    text.remove_suffix(1);
  }

  const auto emit = [this](std::string_view piece, bool highlighted) {
    size_t start = 0;
    while (true) {
      const size_t lf = piece.find('\n', start);
      std::string_view part = piece.substr(start, lf == std::string_view::npos ? lf : lf - start);
      if (lf != std::string_view::npos && !part.empty() && part.back() == '\r') {
        part.remove_suffix(1);
      }
      if (highlighted) {
        os_ << rang::fg::yellow << rang::style::bold << rang::bg::red << part
            << rang::style::reset << rang::bg::reset << rang::fg::reset;
      } else {
        os_ << part;
      }
      if (lf == std::string_view::npos) {
        break;
      }
      fmt::print(os_, "\n");
      print_gutter(0);
      start = lf + 1;
    }
  };

  size_t pos = 0;
  for (const auto & [start, end] : highlights) {
    // Overlapping highlights are skipped
    if (start < pos || start >= text.size()) {
      continue;
    }
    const size_t stop = end < text.size() ? end : text.size();
    emit(text.substr(pos, start - pos), false);
    emit(text.substr(start, stop - start), true);
    pos = stop;
  }
  emit(text.substr(pos), false);
}

}  // namespace poexam
