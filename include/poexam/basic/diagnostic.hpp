// poexam/basic/diagnostic.hpp - Diagnostic types reported by rules
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace poexam
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics (ordered: Info < Warning < Error).
 */
enum class Severity : uint8_t {
  Info,
  Warning,
  Error,
};

/// "info", "warning" or "error".
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// Parse a severity name (case-sensitive), std::nullopt if unknown.
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view name) noexcept;

/**
 * Kind of entry field a diagnostic line shows.
 */
enum class FieldKind : uint8_t {
  None,
  Context,
  Source,
  SourcePlural,
  Translation,
};

/**
 * A field of an entry: kind plus the plural index for translations.
 */
struct DiagnosticField
{
  FieldKind kind = FieldKind::None;
  uint32_t index = 0;

  static DiagnosticField none() noexcept { return {}; }
  static DiagnosticField context() noexcept { return {FieldKind::Context, 0}; }
  static DiagnosticField source() noexcept { return {FieldKind::Source, 0}; }
  static DiagnosticField source_plural() noexcept { return {FieldKind::SourcePlural, 0}; }
  static DiagnosticField translation(uint32_t n) noexcept { return {FieldKind::Translation, n}; }

  /// "msgctxt", "msgid", "msgid_plural", "msgstr[n]" or "" for none
  [[nodiscard]] std::string name() const;

  [[nodiscard]] bool operator==(const DiagnosticField & other) const noexcept
  {
    return kind == other.kind && index == other.index;
  }
  [[nodiscard]] bool operator!=(const DiagnosticField & other) const noexcept
  {
    return !(*this == other);
  }
};

/// Byte range `[first, second)` into a line text.
using Highlight = std::pair<size_t, size_t>;

/**
 * One line displayed under a diagnostic.
 *
 * A line with number 0 and empty text is a separator.
 */
struct DiagnosticLine
{
  DiagnosticField field;
  uint32_t line_number = 0;
  std::string text;
  std::vector<Highlight> highlights;
};

/**
 * A highlight expressed in character offsets of its field text.
 */
struct FieldSpan
{
  DiagnosticField field;
  size_t start = 0;
  size_t end = 0;
};

struct Diagnostic
{
  std::string path;
  std::string rule;
  Severity severity = Severity::Error;
  std::string message;
  std::vector<DiagnosticLine> lines;

  /// First non-zero line number, 0 for file-level diagnostics
  [[nodiscard]] uint32_t line() const noexcept;

  /// Every highlight as (field, char start, char end)
  [[nodiscard]] std::vector<FieldSpan> field_spans() const;

  /// Text of every highlight, in line order
  [[nodiscard]] std::vector<std::string> highlighted_texts() const;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic with a fluent interface and adds it to the bag when
 * destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  /**
   * Append a line.
   *
   * Empty highlights and highlights outside `text` or not on character
   * boundaries are dropped.
   */
  DiagnosticBuilder & with_line(
    DiagnosticField field, uint32_t line_number, std::string text,
    std::vector<Highlight> highlights = {});

  /// Append an empty separator line.
  DiagnosticBuilder & with_separator();

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starter
  DiagnosticBuilder report(
    std::string path, std::string rule, Severity severity, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const;

  // Utilities
  void merge(DiagnosticBag && other);

  /// Move the diagnostics out, leaving the bag empty
  [[nodiscard]] std::vector<Diagnostic> take();

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace poexam
