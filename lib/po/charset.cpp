// poexam/po/charset.cpp - Charset conversion between PO strings and UTF-8
#include "poexam/po/charset.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iterator>
#include <utility>

#include "poexam/text/unicode.hpp"

namespace poexam::po
{

namespace
{

// Portable charsets listed by gettext for the Content-Type header.
constexpr const char * k_known_charsets[] = {
  "ASCII",      "BIG5",       "BIG5-HKSCS", "CP1250",     "CP1251",      "CP1252",
  "CP1253",     "CP1254",     "CP1255",     "CP1256",     "CP1257",      "CP1258",
  "CP850",      "CP866",      "CP874",      "CP932",      "CP949",       "CP950",
  "EUC-JP",     "EUC-KR",     "EUC-TW",     "GB18030",    "GB2312",      "GBK",
  "GEORGIAN-PS", "ISO-8859-1", "ISO-8859-13", "ISO-8859-14", "ISO-8859-15", "ISO-8859-2",
  "ISO-8859-3", "ISO-8859-4", "ISO-8859-5", "ISO-8859-6", "ISO-8859-7",  "ISO-8859-8",
  "ISO-8859-9", "JOHAB",      "KOI8-R",     "KOI8-T",     "KOI8-U",      "SHIFT_JIS",
  "TIS-620",    "UTF-8",      "VISCII",
};

bool iequals(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::toupper(static_cast<unsigned char>(x)) ==
                  std::toupper(static_cast<unsigned char>(y));
         });
}

}  // namespace

bool is_known_charset(std::string_view name) noexcept
{
  return std::any_of(std::begin(k_known_charsets), std::end(k_known_charsets), [&](const char * c) {
    return iequals(name, c);
  });
}

bool is_utf8_charset(std::string_view name) noexcept
{
  return iequals(name, "UTF-8") || iequals(name, "UTF8");
}

// ============================================================================
// CharsetDecoder
// ============================================================================

CharsetDecoder::CharsetDecoder(std::string name, iconv_t handle)
: name_(std::move(name)), handle_(handle)
{
}

CharsetDecoder::~CharsetDecoder()
{
  if (handle_ != nullptr) {
    iconv_close(handle_);
  }
}

std::unique_ptr<CharsetDecoder> CharsetDecoder::open(std::string_view charset)
{
  std::string name(charset);
  if (name.empty() || is_utf8_charset(name)) {
    return std::unique_ptr<CharsetDecoder>(new CharsetDecoder(k_default_charset, nullptr));
  }
  iconv_t cd = iconv_open("UTF-8", name.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    return nullptr;
  }
  return std::unique_ptr<CharsetDecoder>(new CharsetDecoder(std::move(name), cd));
}

std::string CharsetDecoder::decode(std::string_view bytes, bool & had_errors)
{
  if (handle_ == nullptr) {
    if (text::is_valid_utf8(bytes)) {
      return std::string(bytes);
    }
    return text::to_valid_utf8(bytes, had_errors);
  }

  // Reset shift state
  iconv(handle_, nullptr, nullptr, nullptr, nullptr);

  std::string out;
  std::string buffer(bytes.size() * 4 + 16, '\0');
  char * in_ptr = const_cast<char *>(bytes.data());
  size_t in_left = bytes.size();

  while (in_left > 0) {
    char * out_ptr = buffer.data();
    size_t out_left = buffer.size();
    const size_t rc = iconv(handle_, &in_ptr, &in_left, &out_ptr, &out_left);
    out.append(buffer.data(), buffer.size() - out_left);
    if (rc != static_cast<size_t>(-1)) {
      continue;
    }
    if (errno == E2BIG) {
      continue;
    }
    // EILSEQ or EINVAL: replace one byte and go on
    had_errors = true;
    text::append_utf8(out, text::k_replacement_char);
    ++in_ptr;
    --in_left;
    iconv(handle_, nullptr, nullptr, nullptr, nullptr);
  }

  // Flush any pending shift sequence
  char * out_ptr = buffer.data();
  size_t out_left = buffer.size();
  if (iconv(handle_, nullptr, nullptr, &out_ptr, &out_left) != static_cast<size_t>(-1)) {
    out.append(buffer.data(), buffer.size() - out_left);
  }
  return out;
}

// ============================================================================
// CharsetEncoder
// ============================================================================

CharsetEncoder::CharsetEncoder(std::string name, iconv_t handle)
: name_(std::move(name)), handle_(handle)
{
}

CharsetEncoder::~CharsetEncoder()
{
  if (handle_ != nullptr) {
    iconv_close(handle_);
  }
}

std::unique_ptr<CharsetEncoder> CharsetEncoder::open(std::string_view charset)
{
  std::string name(charset);
  if (name.empty() || is_utf8_charset(name)) {
    return std::unique_ptr<CharsetEncoder>(new CharsetEncoder(k_default_charset, nullptr));
  }
  iconv_t cd = iconv_open(name.c_str(), "UTF-8");
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    return nullptr;
  }
  return std::unique_ptr<CharsetEncoder>(new CharsetEncoder(std::move(name), cd));
}

std::optional<std::string> CharsetEncoder::encode(std::string_view utf8)
{
  if (!text::is_valid_utf8(utf8)) {
    return std::nullopt;
  }
  if (handle_ == nullptr) {
    return std::string(utf8);
  }

  iconv(handle_, nullptr, nullptr, nullptr, nullptr);

  std::string out;
  std::string buffer(utf8.size() * 2 + 16, '\0');
  char * in_ptr = const_cast<char *>(utf8.data());
  size_t in_left = utf8.size();

  while (in_left > 0) {
    char * out_ptr = buffer.data();
    size_t out_left = buffer.size();
    const size_t rc = iconv(handle_, &in_ptr, &in_left, &out_ptr, &out_left);
    out.append(buffer.data(), buffer.size() - out_left);
    if (rc == static_cast<size_t>(-1) && errno != E2BIG) {
      return std::nullopt;
    }
  }

  char * out_ptr = buffer.data();
  size_t out_left = buffer.size();
  if (iconv(handle_, nullptr, nullptr, &out_ptr, &out_left) == static_cast<size_t>(-1)) {
    return std::nullopt;
  }
  out.append(buffer.data(), buffer.size() - out_left);
  return out;
}

}  // namespace poexam::po
