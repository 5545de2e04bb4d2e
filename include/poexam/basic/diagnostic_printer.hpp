// poexam/basic/diagnostic_printer.hpp
//
// Prints diagnostics with the lines of the entry they refer to and the
// highlighted parts of each line.
//
#pragma once

#include <gsl/span>
#include <iosfwd>
#include <string_view>

#include "poexam/basic/diagnostic.hpp"

namespace poexam
{

/**
 * Prints diagnostics in human readable format.
 *
 * Produces output like:
 *   po/fr.po:42: [info:brackets] missing opening and closing square brackets ...
 *           |
 *        42 | Test [brackets]
 *           |
 *        43 | Test crochets
 *           |
 *
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cout)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic, followed by an empty line.
  void print(const Diagnostic & diag);

  /// Print diagnostics in the given order.
  void print_all(gsl::span<const Diagnostic> diags);

private:
  void print_header(const Diagnostic & diag);
  void print_line(const DiagnosticLine & line);

  /// Print `text` with highlights, continuing each new line after a gutter.
  void print_text(std::string_view text, const std::vector<Highlight> & highlights);

  void print_gutter(uint32_t line_number);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace poexam
