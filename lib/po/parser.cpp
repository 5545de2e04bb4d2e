// poexam/po/parser.cpp - PO file parser
#include "poexam/po/parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <memory>

#include "poexam/po/charset.hpp"
#include "poexam/po/escape.hpp"
#include "poexam/text/unicode.hpp"

namespace poexam::po
{

namespace
{

constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

/// Field receiving continuation strings.
enum class FieldKind : uint8_t {
  None,
  Ignored,
  Ctxt,
  Id,
  IdPlural,
  Str,
};

bool starts_with(std::string_view s, std::string_view prefix) noexcept
{
  return s.substr(0, prefix.size()) == prefix;
}

bool is_blank_line(std::string_view line) noexcept
{
  return line.find_first_not_of(" \t\f\v") == std::string_view::npos;
}

std::string_view trim_ascii(std::string_view s) noexcept
{
  const size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  const size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ascii_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

/// True if the quote at `pos` is preceded by an odd number of backslashes.
bool is_escaped(std::string_view s, size_t pos) noexcept
{
  size_t count = 0;
  while (pos > 0 && s[pos - 1] == '\\') {
    ++count;
    --pos;
  }
  return count % 2 == 1;
}

// ============================================================================
// CatalogParser
// ============================================================================

class CatalogParser
{
public:
  CatalogParser(std::string_view data, std::unique_ptr<CharsetDecoder> decoder, bool forced)
  : data_(data), decoder_(std::move(decoder)), forced_encoding_(forced)
  {
    catalog_.encoding = decoder_->name();
  }

  [[nodiscard]] Catalog parse();

private:
  void parse_line(std::string_view line);
  void parse_keywords(std::string_view keywords);
  void parse_message(std::string_view line, uint32_t column_offset);
  void parse_header(const Entry & entry);
  void finish_entry();
  void finish_message(Message & msg);

  /// Extract and decode the quoted string of a message line.
  void append_string(Message & msg, std::string_view line, uint32_t column_offset);

  [[nodiscard]] Message * current_message();

  /// Decode source bytes quoted in an issue message.
  [[nodiscard]] std::string display(std::string_view bytes)
  {
    bool had_errors = false;
    return decoder_->decode(bytes, had_errors);
  }

  void add_issue(ParseIssueKind kind, std::string message)
  {
    catalog_.issues.push_back(ParseIssue{kind, line_number_, std::move(message)});
  }

  std::string_view data_;
  std::unique_ptr<CharsetDecoder> decoder_;
  bool forced_encoding_ = false;

  Catalog catalog_;
  Entry entry_;
  bool started_ = false;
  bool encoding_error_ = false;
  FieldKind field_ = FieldKind::None;
  uint32_t str_index_ = 0;
  uint32_t line_number_ = 0;
};

Catalog CatalogParser::parse()
{
  size_t offset = 0;
  if (starts_with(data_, k_utf8_bom)) {
    offset = k_utf8_bom.size();
  }

  while (offset < data_.size()) {
    size_t end = data_.find('\n', offset);
    if (end == std::string_view::npos) {
      end = data_.size();
    }
    std::string_view line = data_.substr(offset, end - offset);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    ++line_number_;
    parse_line(line);
    offset = end + 1;
  }

  if (started_) {
    finish_entry();
  }
  return std::move(catalog_);
}

void CatalogParser::parse_line(std::string_view line)
{
  if (is_blank_line(line)) {
    if (started_) {
      finish_entry();
    }
    return;
  }

  if (!started_) {
    started_ = true;
    entry_.line = line_number_;
  }

  if (starts_with(line, "#,") || starts_with(line, "#=")) {
    // Workflow and sticky flags
    parse_keywords(line.substr(2));
  } else if (starts_with(line, "#~ ")) {
    entry_.obsolete = true;
    parse_message(line.substr(3), 3);
  } else if (starts_with(line, "#")) {
    // Translator, extracted, reference and previous comments
  } else if (starts_with(line, "msg") || starts_with(line, "\"")) {
    parse_message(line, 0);
  } else {
    const std::string_view word = line.substr(0, line.find_first_of(" \t\""));
    add_issue(ParseIssueKind::UnknownKeyword, fmt::format("unknown keyword '{}'", display(word)));
  }
}

void CatalogParser::parse_keywords(std::string_view keywords)
{
  size_t pos = 0;
  while (pos <= keywords.size()) {
    size_t comma = keywords.find(',', pos);
    if (comma == std::string_view::npos) {
      comma = keywords.size();
    }
    const std::string_view kw = trim_ascii(keywords.substr(pos, comma - pos));
    pos = comma + 1;
    if (kw.empty()) {
      continue;
    }

    if (kw == "fuzzy") {
      entry_.fuzzy = true;
    } else if (kw == "noqa") {
      entry_.noqa = true;
    } else if (starts_with(kw, "noqa:")) {
      std::string_view rules = kw.substr(5);
      entry_.noqa_rules.clear();
      size_t rpos = 0;
      while (rpos <= rules.size()) {
        size_t semi = rules.find(';', rpos);
        if (semi == std::string_view::npos) {
          semi = rules.size();
        }
        const std::string_view rule = trim_ascii(rules.substr(rpos, semi - rpos));
        if (!rule.empty()) {
          entry_.noqa_rules.emplace_back(rule);
        }
        rpos = semi + 1;
      }
    } else if (kw == "no-wrap") {
      entry_.nowrap = true;
    } else if (kw.size() > 7 && kw.substr(kw.size() - 7) == "-format" && !starts_with(kw, "no-")) {
      entry_.format = std::string(kw.substr(0, kw.size() - 7));
    }
    entry_.keywords.emplace_back(kw);
  }
}

void CatalogParser::parse_message(std::string_view line, uint32_t column_offset)
{
  if (starts_with(line, "msgctxt")) {
    field_ = FieldKind::Ctxt;
    entry_.msgctxt = Message{line_number_, {}, {}, {}};
    append_string(*entry_.msgctxt, line, column_offset);
  } else if (starts_with(line, "msgid_plural")) {
    field_ = FieldKind::IdPlural;
    entry_.msgid_plural = Message{line_number_, {}, {}, {}};
    append_string(*entry_.msgid_plural, line, column_offset);
  } else if (starts_with(line, "msgid")) {
    field_ = FieldKind::Id;
    entry_.msgid = Message{line_number_, {}, {}, {}};
    append_string(*entry_.msgid, line, column_offset);
  } else if (starts_with(line, "msgstr[")) {
    const size_t close = line.find(']');
    const std::string_view digits =
      close == std::string_view::npos ? std::string_view{} : line.substr(7, close - 7);
    const bool valid = !digits.empty() && digits.size() <= 9 &&
                       std::all_of(digits.begin(), digits.end(), [](char c) {
                         return c >= '0' && c <= '9';
                       });
    if (!valid) {
      field_ = FieldKind::Ignored;
      const std::string_view keyword = line.substr(0, line.find_first_of(" \t\""));
      add_issue(
        ParseIssueKind::InvalidPluralIndex,
        fmt::format("invalid plural index in '{}'", display(keyword)));
      return;
    }
    str_index_ = static_cast<uint32_t>(std::stoul(std::string(digits)));
    field_ = FieldKind::Str;
    Message & msg = entry_.msgstr[str_index_];
    msg = Message{line_number_, {}, {}, {}};
    append_string(msg, line, column_offset);
  } else if (starts_with(line, "msgstr")) {
    str_index_ = 0;
    field_ = FieldKind::Str;
    Message & msg = entry_.msgstr[0];
    msg = Message{line_number_, {}, {}, {}};
    append_string(msg, line, column_offset);
  } else if (starts_with(line, "\"")) {
    if (field_ == FieldKind::Ignored) {
      return;
    }
    Message * msg = current_message();
    if (msg == nullptr) {
      add_issue(ParseIssueKind::OrphanString, "string without keyword");
      return;
    }
    append_string(*msg, line, column_offset);
  } else {
    const std::string_view word = line.substr(0, line.find_first_of(" \t\""));
    add_issue(ParseIssueKind::UnknownKeyword, fmt::format("unknown keyword '{}'", display(word)));
  }
}

Message * CatalogParser::current_message()
{
  switch (field_) {
    case FieldKind::Ctxt:
      return entry_.msgctxt ? &*entry_.msgctxt : nullptr;
    case FieldKind::Id:
      return entry_.msgid ? &*entry_.msgid : nullptr;
    case FieldKind::IdPlural:
      return entry_.msgid_plural ? &*entry_.msgid_plural : nullptr;
    case FieldKind::Str: {
      const auto it = entry_.msgstr.find(str_index_);
      return it == entry_.msgstr.end() ? nullptr : &it->second;
    }
    case FieldKind::None:
    case FieldKind::Ignored:
      break;
  }
  return nullptr;
}

void CatalogParser::append_string(Message & msg, std::string_view line, uint32_t column_offset)
{
  const size_t first = line.find('"');
  if (first == std::string_view::npos) {
    add_issue(ParseIssueKind::UnterminatedString, "missing quoted string");
    return;
  }
  const size_t last = line.rfind('"');
  size_t end = last;
  if (last == first || is_escaped(line, last)) {
    add_issue(ParseIssueKind::UnterminatedString, "unterminated string");
    end = line.size();
  }

  const std::string_view raw = line.substr(first + 1, end - first - 1);
  const size_t offset = msg.raw.size();
  msg.raw += decoder_->decode(raw, encoding_error_);
  msg.fragments.push_back(Fragment{
    line_number_, static_cast<uint32_t>(column_offset + first + 2), static_cast<uint32_t>(offset),
    static_cast<uint32_t>(msg.raw.size() - offset)});
}

void CatalogParser::finish_message(Message & msg)
{
  UnescapeResult unescaped = unescape(msg.raw);
  for (const auto & seq : unescaped.unknown_sequences) {
    catalog_.issues.push_back(ParseIssue{
      ParseIssueKind::UnknownEscape, msg.line_at(seq.offset),
      fmt::format("unknown escape sequence '{}'", seq.text)});
  }
  // Octal and hex escapes can produce invalid UTF-8
  if (text::is_valid_utf8(unescaped.value)) {
    msg.value = std::move(unescaped.value);
  } else {
    msg.value = text::to_valid_utf8(unescaped.value, encoding_error_);
  }
}

void CatalogParser::finish_entry()
{
  if (entry_.msgctxt) {
    finish_message(*entry_.msgctxt);
  }
  if (entry_.msgid) {
    finish_message(*entry_.msgid);
  }
  if (entry_.msgid_plural) {
    finish_message(*entry_.msgid_plural);
  }
  for (auto & [index, msg] : entry_.msgstr) {
    finish_message(msg);
  }
  entry_.encoding_error = encoding_error_;

  if (entry_.is_header()) {
    parse_header(entry_);
  }
  catalog_.entries.push_back(std::move(entry_));

  entry_ = Entry{};
  started_ = false;
  encoding_error_ = false;
  field_ = FieldKind::None;
  str_index_ = 0;
}

void CatalogParser::parse_header(const Entry & entry)
{
  const auto it = entry.msgstr.find(0);
  if (it == entry.msgstr.end() || it->second.value.empty()) {
    return;
  }

  std::string_view header = it->second.value;
  size_t pos = 0;
  while (pos < header.size()) {
    size_t eol = header.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = header.size();
    }
    const std::string_view line = header.substr(pos, eol - pos);
    pos = eol + 1;

    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    const std::string keyword = ascii_lower(trim_ascii(line.substr(0, colon)));
    const std::string_view value = line.substr(colon + 1);

    if (keyword == "language") {
      catalog_.language = std::string(trim_ascii(value));
      const size_t underscore = value.find('_');
      if (underscore != std::string_view::npos) {
        catalog_.language_code = std::string(trim_ascii(value.substr(0, underscore)));
        catalog_.country = std::string(trim_ascii(value.substr(underscore + 1)));
      } else {
        catalog_.language_code = catalog_.language;
      }
    } else if (keyword == "content-type") {
      const size_t charset_pos = value.find("charset=");
      if (charset_pos == std::string_view::npos) {
        continue;
      }
      std::string_view charset = value.substr(charset_pos + 8);
      charset = charset.substr(0, charset.find_first_of(" \t\r;"));
      catalog_.declared_charset = std::string(charset);
      if (forced_encoding_ || charset.empty() || is_utf8_charset(charset) ||
          !is_known_charset(charset))
      {
        continue;
      }
      auto decoder = CharsetDecoder::open(charset);
      if (decoder) {
        decoder_ = std::move(decoder);
        catalog_.encoding = decoder_->name();
      }
    } else if (keyword == "plural-forms") {
      const size_t np = value.find("nplurals=");
      if (np == std::string_view::npos) {
        continue;
      }
      const std::string_view digits = value.substr(np + 9);
      uint32_t nplurals = 0;
      size_t i = 0;
      while (i < digits.size() && i < 9 && digits[i] >= '0' && digits[i] <= '9') {
        nplurals = nplurals * 10 + static_cast<uint32_t>(digits[i] - '0');
        ++i;
      }
      if (i > 0) {
        catalog_.nplurals = nplurals;
      }
    }
  }
}

}  // namespace

ParseResult parse_catalog(std::string_view data, const ParseOptions & options)
{
  const bool forced = !options.encoding.empty();
  auto decoder = CharsetDecoder::open(forced ? options.encoding : k_default_charset);
  if (!decoder) {
    return ParseResult::fail(fmt::format("unsupported encoding '{}'", options.encoding));
  }
  CatalogParser parser(data, std::move(decoder), forced);
  return ParseResult::ok(parser.parse());
}

}  // namespace poexam::po
