// poexam/po/parser.hpp - PO file parser
//
// Line oriented parser turning the raw bytes of a PO file into a Catalog.
// Malformed lines are recorded as parse issues and parsing continues.
//
#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "poexam/po/catalog.hpp"

namespace poexam::po
{

/**
 * Parser options.
 */
struct ParseOptions
{
  /// Charset forced for the whole file (empty: use the header charset)
  std::string encoding;
};

/**
 * Result of parsing a PO file.
 */
struct ParseResult
{
  /// Parsed catalog (only valid if success == true)
  Catalog catalog;

  bool success = false;

  /// Error message if parsing failed
  std::string error;

  static ParseResult ok(Catalog catalog)
  {
    ParseResult r;
    r.catalog = std::move(catalog);
    r.success = true;
    return r;
  }

  static ParseResult fail(std::string msg)
  {
    ParseResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Parse the content of a PO file.
 *
 * Strings are decoded from UTF-8 until the header declares another charset,
 * or from `options.encoding` for the whole file when it is set. The parse
 * only fails when the forced encoding is not supported.
 */
[[nodiscard]] ParseResult parse_catalog(std::string_view data, const ParseOptions & options = {});

}  // namespace poexam::po
