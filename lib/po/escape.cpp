// poexam/po/escape.cpp - PO string escape sequences
#include "poexam/po/escape.hpp"

#include "poexam/text/unicode.hpp"

namespace poexam::po
{

namespace
{

constexpr bool is_octal(char c) noexcept { return c >= '0' && c <= '7'; }

int hex_value(char c) noexcept
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string escape(std::string_view value)
{
  std::string out;
  out.reserve(value.size() * 2);
  for (const char c : value) {
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

UnescapeResult unescape(std::string_view raw)
{
  UnescapeResult result;
  std::string & out = result.value;
  out.reserve(raw.size());

  size_t i = 0;
  while (i < raw.size()) {
    const char c = raw[i];
    if (c != '\\') {
      out.push_back(c);
      ++i;
      continue;
    }
    if (i + 1 >= raw.size()) {
      out.push_back('\\');
      ++i;
      continue;
    }

    const char next = raw[i + 1];
    switch (next) {
      case 'n':
        out.push_back('\n');
        i += 2;
        continue;
      case 'r':
        out.push_back('\r');
        i += 2;
        continue;
      case 't':
        out.push_back('\t');
        i += 2;
        continue;
      case '"':
        out.push_back('"');
        i += 2;
        continue;
      case '\\':
        out.push_back('\\');
        i += 2;
        continue;
      case 'a':
        out.push_back('\a');
        i += 2;
        continue;
      case 'b':
        out.push_back('\b');
        i += 2;
        continue;
      case 'f':
        out.push_back('\f');
        i += 2;
        continue;
      case 'v':
        out.push_back('\v');
        i += 2;
        continue;
      default:
        break;
    }

    if (is_octal(next)) {
      unsigned value = 0;
      size_t j = i + 1;
      while (j < raw.size() && j < i + 4 && is_octal(raw[j])) {
        value = value * 8 + static_cast<unsigned>(raw[j] - '0');
        ++j;
      }
      out.push_back(static_cast<char>(value & 0xFFU));
      i = j;
      continue;
    }

    if (next == 'x' && i + 2 < raw.size() && hex_value(raw[i + 2]) >= 0) {
      unsigned value = 0;
      size_t j = i + 2;
      while (j < raw.size() && j < i + 4 && hex_value(raw[j]) >= 0) {
        value = value * 16 + static_cast<unsigned>(hex_value(raw[j]));
        ++j;
      }
      out.push_back(static_cast<char>(value));
      i = j;
      continue;
    }

    // Unknown sequence: keep it literally
    const size_t len = 1 + text::decode_at(raw, i + 1).size;
    out.append(raw.substr(i, len));
    result.unknown_sequences.push_back(UnknownEscape{std::string(raw.substr(i, len)), i});
    i += len;
  }

  return result;
}

}  // namespace poexam::po
