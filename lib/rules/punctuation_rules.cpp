// poexam/rules/punctuation_rules.cpp - Leading/trailing punctuation and whitespace
//
//   punc-start, punc-end, whitespace-start, whitespace-end
//
#include <fmt/core.h>

#include <string>

#include "poexam/rules/builtin_rules.hpp"
#include "poexam/rules/rule_context.hpp"
#include "poexam/text/unicode.hpp"

namespace poexam::rules
{

namespace
{

bool is_punctuation(char32_t cp) noexcept
{
  switch (cp) {
    case U':':
    case U'：':  // fullwidth colon
    case U';':
    case U'；':  // fullwidth semicolon
    case U'؛':  // arabic semicolon
    case U'.':
    case U'。':  // ideographic full stop
    case U'…':  // ellipsis
    case U',':
    case U'，':  // fullwidth comma
    case U'،':  // arabic comma
    case U'!':
    case U'！':  // fullwidth exclamation mark
    case U'?':
    case U'？':  // fullwidth question mark
    case U'؟':  // arabic question mark
      return true;
    default:
      return false;
  }
}

bool is_inline_whitespace(char32_t cp) noexcept { return cp != U'\n' && text::is_whitespace(cp); }

/**
 * Byte length of the leading run of whitespace (except `\n`) and punctuation.
 *
 * Whitespace is only taken before the first punctuation character.
 */
size_t punctuation_start_length(std::string_view s) noexcept
{
  bool punctuation_seen = false;
  size_t pos = 0;
  while (pos < s.size()) {
    const text::DecodedChar c = text::decode_at(s, pos);
    if (is_punctuation(c.cp)) {
      punctuation_seen = true;
    } else if (!is_inline_whitespace(c.cp) || punctuation_seen) {
      break;
    }
    pos += c.size;
  }
  return pos;
}

/// Same as punctuation_start_length(), from the end.
size_t punctuation_end_length(std::string_view s) noexcept
{
  bool punctuation_seen = false;
  size_t end = s.size();
  while (end > 0) {
    const text::DecodedChar c = text::decode_before(s, end);
    if (is_punctuation(c.cp)) {
      punctuation_seen = true;
    } else if (!is_inline_whitespace(c.cp) || punctuation_seen) {
      break;
    }
    end -= c.size;
  }
  return s.size() - end;
}

/// Map punctuation variants of other scripts to their ASCII form.
std::string normalize_punctuation(std::string_view s, std::string_view language)
{
  std::string out;
  size_t pos = 0;
  while (pos < s.size()) {
    const text::DecodedChar c = text::decode_at(s, pos);
    pos += c.size;
    char32_t cp = c.cp;
    switch (cp) {
      case U'?':
        // Greek question mark is ';'
        if (language == "el") {
          cp = U';';
        }
        break;
      case U'：':
        cp = U':';
        break;
      case U'；':
      case U'؛':
        cp = U';';
        break;
      case U'。':
        cp = U'.';
        break;
      case U'，':
      case U'،':
        cp = U',';
        break;
      case U'！':
        cp = U'!';
        break;
      case U'？':
      case U'؟':
        cp = U'?';
        break;
      default:
        break;
    }
    text::append_utf8(out, cp);
  }

  std::string result;
  size_t start = 0;
  size_t dots = out.find("...");
  while (dots != std::string::npos) {
    result.append(out, start, dots - start);
    result.append("…");
    start = dots + 3;
    dots = out.find("...", start);
  }
  result.append(out, start, std::string::npos);
  return result;
}

size_t whitespace_start_length(std::string_view s) noexcept
{
  size_t pos = 0;
  while (pos < s.size()) {
    const text::DecodedChar c = text::decode_at(s, pos);
    if (!is_inline_whitespace(c.cp)) {
      break;
    }
    pos += c.size;
  }
  return pos;
}

size_t whitespace_end_length(std::string_view s) noexcept
{
  size_t end = s.size();
  while (end > 0) {
    const text::DecodedChar c = text::decode_before(s, end);
    if (!is_inline_whitespace(c.cp)) {
      break;
    }
    end -= c.size;
  }
  return s.size() - end;
}

// ============================================================================
// Hooks
// ============================================================================

void check_punc_start(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view id = msgid.value();
  const std::string_view str = msgstr.value();
  const size_t id_len = punctuation_start_length(id);
  const size_t str_len = punctuation_start_length(str);
  const std::string id_punc =
    normalize_punctuation(text::trim(id.substr(0, id_len)), ctx.language_code());
  const std::string str_punc =
    normalize_punctuation(text::trim(str.substr(0, str_len)), ctx.language_code());

  // Leading dots are used for hidden files and extensions, and may move
  if (
    (!id_punc.empty() && id_punc.front() == '.') ||
    (!str_punc.empty() && str_punc.front() == '.'))
  {
    return;
  }
  if (id_punc != str_punc) {
    ctx.report_msg(
      msgid, {{0, id_len}}, msgstr, {{0, str_len}},
      fmt::format("inconsistent leading punctuation ('{}' / '{}')", id_punc, str_punc));
  }
}

void check_punc_end(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view id = msgid.value();
  const std::string_view str = msgstr.value();
  const size_t id_len = punctuation_end_length(id);
  const size_t str_len = punctuation_end_length(str);
  const std::string id_punc =
    normalize_punctuation(text::trim(id.substr(id.size() - id_len)), ctx.language_code());
  const std::string str_punc =
    normalize_punctuation(text::trim(str.substr(str.size() - str_len)), ctx.language_code());

  if (id_punc != str_punc) {
    ctx.report_msg(
      msgid, {{id.size() - id_len, id.size()}}, msgstr, {{str.size() - str_len, str.size()}},
      fmt::format("inconsistent trailing punctuation ('{}' / '{}')", id_punc, str_punc));
  }
}

void check_whitespace_start(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view id = msgid.value();
  const std::string_view str = msgstr.value();
  if (text::is_blank(id) || text::is_blank(str)) {
    return;
  }
  const std::string_view id_ws = id.substr(0, whitespace_start_length(id));
  const std::string_view str_ws = str.substr(0, whitespace_start_length(str));
  if (id_ws != str_ws) {
    ctx.report_msg(
      msgid, {{0, id_ws.size()}}, msgstr, {{0, str_ws.size()}},
      fmt::format("inconsistent leading whitespace ('{}' / '{}')", id_ws, str_ws));
  }
}

void check_whitespace_end(
  RuleContext & ctx, const po::Entry & /*entry*/, const MessageRef & msgid,
  const MessageRef & msgstr)
{
  const std::string_view id = msgid.value();
  const std::string_view str = msgstr.value();
  if (text::is_blank(id) || text::is_blank(str)) {
    return;
  }
  const std::string_view id_ws = id.substr(id.size() - whitespace_end_length(id));
  const std::string_view str_ws = str.substr(str.size() - whitespace_end_length(str));
  if (id_ws != str_ws) {
    ctx.report_msg(
      msgid, {{id.size() - id_ws.size(), id.size()}}, msgstr,
      {{str.size() - str_ws.size(), str.size()}},
      fmt::format("inconsistent trailing whitespace ('{}' / '{}')", id_ws, str_ws));
  }
}

}  // namespace

void add_punctuation_rules(std::vector<Rule> & rules)
{
  // {info}, check_catalog, check_entry, check_ctxt, check_msg
  rules.push_back(
    {{"punc-end", Severity::Info, true, k_checks_group, "inconsistent trailing punctuation"},
     nullptr,
     nullptr,
     nullptr,
     check_punc_end});
  rules.push_back(
    {{"punc-start", Severity::Info, true, k_checks_group, "inconsistent leading punctuation"},
     nullptr,
     nullptr,
     nullptr,
     check_punc_start});
  rules.push_back(
    {{"whitespace-end", Severity::Info, true, k_checks_group, "inconsistent trailing whitespace"},
     nullptr,
     nullptr,
     nullptr,
     check_whitespace_end});
  rules.push_back(
    {{"whitespace-start", Severity::Info, true, k_checks_group, "inconsistent leading whitespace"},
     nullptr,
     nullptr,
     nullptr,
     check_whitespace_start});
}

}  // namespace poexam::rules
