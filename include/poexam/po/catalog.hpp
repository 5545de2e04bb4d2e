// poexam/po/catalog.hpp - Parsed PO file
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "poexam/po/entry.hpp"

namespace poexam::po
{

/**
 * Kind of problem found while parsing (parsing always continues).
 */
enum class ParseIssueKind : uint8_t {
  UnterminatedString,
  UnknownEscape,
  InvalidPluralIndex,
  UnknownKeyword,
  OrphanString,
};

/**
 * A problem found in one entry.
 */
struct ParseIssue
{
  ParseIssueKind kind = ParseIssueKind::UnknownKeyword;
  uint32_t line = 0;
  std::string message;
};

/**
 * Ordered entries of one file plus header metadata.
 */
struct Catalog
{
  /// All entries, header included, in file order
  std::vector<Entry> entries;

  /// `Language` header value, e.g. "pt_BR"
  std::string language;

  /// Language code, e.g. "pt"
  std::string language_code;

  /// Country, e.g. "BR"
  std::string country;

  /// Charset declared in the `Content-Type` header (empty if none)
  std::string declared_charset;

  /// Charset actually used to decode the strings
  std::string encoding = "UTF-8";

  /// `nplurals` of the `Plural-Forms` header, 0 if absent
  uint32_t nplurals = 0;

  std::vector<ParseIssue> issues;

  /// The header entry, nullptr if the catalog has none
  [[nodiscard]] const Entry * header() const noexcept;
};

}  // namespace poexam::po
