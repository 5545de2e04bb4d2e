// poexam/rules/rule_context.hpp - What a rule hook sees and reports to
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/po/catalog.hpp"
#include "poexam/rules/rule.hpp"

namespace poexam::spelling
{
class Dictionary;
}  // namespace poexam::spelling

namespace poexam::rules
{

/**
 * Per-file context passed to rule hooks.
 *
 * Reports are stamped with the path and with the id and effective severity
 * of the rule being run (see set_rule()).
 */
class RuleContext
{
public:
  RuleContext(std::string path, const po::Catalog & catalog, DiagnosticBag & diagnostics);

  [[nodiscard]] const std::string & path() const noexcept { return path_; }
  [[nodiscard]] const po::Catalog & catalog() const noexcept { return catalog_; }

  /// Language code of the catalog ("pt" for "pt_BR")
  [[nodiscard]] std::string_view language_code() const noexcept { return catalog_.language_code; }

  /// Dictionary of the source language, nullptr if unavailable
  [[nodiscard]] const spelling::Dictionary * source_dictionary() const noexcept
  {
    return source_dictionary_;
  }

  /// Dictionary of the catalog language, nullptr if unavailable
  [[nodiscard]] const spelling::Dictionary * translation_dictionary() const noexcept
  {
    return translation_dictionary_;
  }

  void set_dictionaries(
    const spelling::Dictionary * source, const spelling::Dictionary * translation) noexcept
  {
    source_dictionary_ = source;
    translation_dictionary_ = translation;
  }

  /// Select the rule that subsequent reports are attributed to.
  void set_rule(std::string_view id, Severity severity) noexcept
  {
    rule_ = id;
    severity_ = severity;
  }

  [[nodiscard]] std::string_view rule() const noexcept { return rule_; }
  [[nodiscard]] Severity severity() const noexcept { return severity_; }

  // Reporting

  /// Report a problem about the whole file (no lines).
  void report_file(std::string message);

  /// Report a problem about an entry, showing all its PO lines.
  void report_entry(const po::Entry & entry, std::string message);

  /// Report a problem in the context of an entry.
  void report_ctxt(const MessageRef & msgctxt, std::vector<Highlight> highlights, std::string message);

  /**
   * Report a problem in a source/translation pair.
   *
   * The diagnostic shows the source line, a separator and the translation
   * line, each with its own highlights.
   */
  void report_msg(
    const MessageRef & msgid, std::vector<Highlight> id_highlights, const MessageRef & msgstr,
    std::vector<Highlight> str_highlights, std::string message);

private:
  std::string path_;
  const po::Catalog & catalog_;
  DiagnosticBag & diagnostics_;

  const spelling::Dictionary * source_dictionary_ = nullptr;
  const spelling::Dictionary * translation_dictionary_ = nullptr;

  std::string_view rule_;
  Severity severity_ = Severity::Info;
};

}  // namespace poexam::rules
