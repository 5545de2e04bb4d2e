// poexam/rules/builtin_rules.hpp - Registration of the built-in rule families
#pragma once

#include <vector>

#include "poexam/rules/rule.hpp"

namespace poexam::rules
{

/// blank, changed, encoding, fuzzy, obsolete, plurals, unchanged, untranslated
void add_status_rules(std::vector<Rule> & rules);

/// brackets, double-quotes, double-spaces, escapes, newlines, pipes, tabs
void add_character_rules(std::vector<Rule> & rules);

/// c-formats, python-formats
void add_format_rules(std::vector<Rule> & rules);

/// punc-start, punc-end, whitespace-start, whitespace-end
void add_punctuation_rules(std::vector<Rule> & rules);

/// long, short
void add_length_rules(std::vector<Rule> & rules);

/// spelling-ctxt, spelling-id, spelling-str
void add_spelling_rules(std::vector<Rule> & rules);

}  // namespace poexam::rules
