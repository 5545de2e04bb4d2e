// poexam/rules/rule.hpp - Rule metadata and hook signatures
//
// A rule is a table entry: metadata plus up to four plain function hooks.
// Hooks never mutate the catalog; they report through the RuleContext.
//
#pragma once

#include <cstdint>
#include <string_view>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/po/catalog.hpp"

namespace poexam::rules
{

class RuleContext;

/**
 * A message of an entry with the field it comes from.
 */
struct MessageRef
{
  const po::Message * message = nullptr;
  DiagnosticField field;

  [[nodiscard]] std::string_view value() const noexcept
  {
    return message ? std::string_view(message->value) : std::string_view{};
  }
  [[nodiscard]] uint32_t line() const noexcept { return message ? message->line : 0; }
};

using CatalogHook = void (*)(RuleContext & ctx, const po::Catalog & catalog);
using EntryHook = void (*)(RuleContext & ctx, const po::Entry & entry);
using ContextHook = void (*)(RuleContext & ctx, const po::Entry & entry, const MessageRef & msgctxt);
using MessageHook = void (*)(
  RuleContext & ctx, const po::Entry & entry, const MessageRef & msgid, const MessageRef & msgstr);

// Named groups a rule declares itself in; `all` and `default` are implied
inline constexpr uint8_t k_no_groups = 0;
/// Quality checks, as opposed to status reports
inline constexpr uint8_t k_checks_group = 1U << 0;
inline constexpr uint8_t k_spelling_group = 1U << 1;

struct RuleInfo
{
  std::string_view id;
  Severity default_severity = Severity::Info;
  bool default_enabled = false;

  /// Bit set of k_*_group
  uint8_t groups = k_checks_group;

  std::string_view description;

  [[nodiscard]] bool in_groups(uint8_t mask) const noexcept { return (groups & mask) != 0; }
};

struct Rule
{
  RuleInfo info;

  CatalogHook check_catalog = nullptr;
  EntryHook check_entry = nullptr;
  ContextHook check_ctxt = nullptr;
  MessageHook check_msg = nullptr;

  [[nodiscard]] std::string_view id() const noexcept { return info.id; }
};

// ============================================================================
// Pseudo rules
// ============================================================================

/// Reported when a file cannot be read or decoded
inline constexpr std::string_view k_read_error_rule = "read-error";

/// Reported for malformed lines of a file
inline constexpr std::string_view k_syntax_error_rule = "syntax-error";

}  // namespace poexam::rules
