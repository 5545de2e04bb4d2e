// poexam/engine/linter.hpp - Run enabled rules over a catalog
#pragma once

#include <string>
#include <vector>

#include "poexam/basic/diagnostic.hpp"
#include "poexam/po/catalog.hpp"
#include "poexam/rules/selection.hpp"

namespace poexam::spelling
{
class Dictionary;
class DictionaryCache;
}  // namespace poexam::spelling

namespace poexam::engine
{

/**
 * Which kinds of entries are checked beyond the defaults.
 */
struct LintOptions
{
  /// Check fuzzy entries even if the `fuzzy` rule is off
  bool fuzzy = false;

  /// Check entries flagged `noqa`
  bool noqa = false;

  /// Check obsolete entries even if the `obsolete` rule is off
  bool obsolete = false;
};

/**
 * Applies a rule set to catalogs.
 *
 * A linter holds no per-file state: lint() may be called concurrently from
 * several threads, provided the dictionaries are not modified meanwhile.
 */
class Linter
{
public:
  explicit Linter(const rules::RuleSet & rules, LintOptions options = {});

  /// Dictionary used by spelling-ctxt and spelling-id.
  Linter & with_source_dictionary(const spelling::Dictionary * dictionary) noexcept
  {
    source_dictionary_ = dictionary;
    return *this;
  }

  /// Cache providing the dictionary of each catalog language (spelling-str).
  Linter & with_dictionary_cache(spelling::DictionaryCache * cache) noexcept
  {
    dictionary_cache_ = cache;
    return *this;
  }

  [[nodiscard]] const rules::RuleSet & rules() const noexcept { return rules_; }
  [[nodiscard]] const LintOptions & options() const noexcept { return options_; }

  /// True if a rule using the source dictionary is enabled
  [[nodiscard]] bool needs_source_dictionary() const noexcept;

  /// True if a rule using the translation dictionary is enabled
  [[nodiscard]] bool needs_translation_dictionary() const noexcept;

  /**
   * Check a catalog.
   *
   * Diagnostics come in line order; at the same line, in entry and rule
   * registration order. Parse issues of the catalog are reported as
   * `syntax-error` diagnostics.
   */
  [[nodiscard]] std::vector<Diagnostic> lint(const po::Catalog & catalog, const std::string & path) const;

private:
  const rules::RuleSet & rules_;
  LintOptions options_;

  const spelling::Dictionary * source_dictionary_ = nullptr;
  spelling::DictionaryCache * dictionary_cache_ = nullptr;

  bool untranslated_rule_ = false;
  bool fuzzy_rule_ = false;
  bool obsolete_rule_ = false;
};

}  // namespace poexam::engine
