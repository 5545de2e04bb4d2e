// poexam/po/charset.hpp - Charset conversion between PO strings and UTF-8
//
// Wraps iconv(3). Strings are converted one at a time, so stateful
// encodings are reset before every call.
//
#pragma once

#include <iconv.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace poexam::po
{

/// Charset used when the header declares none.
inline constexpr const char * k_default_charset = "UTF-8";

/**
 * Check a charset name against the portable charsets accepted by gettext
 * (case-insensitive).
 */
[[nodiscard]] bool is_known_charset(std::string_view name) noexcept;

/// True if `name` designates UTF-8 (`UTF-8` or `UTF8`, any case).
[[nodiscard]] bool is_utf8_charset(std::string_view name) noexcept;

/**
 * Converts byte strings from one charset to UTF-8.
 *
 * Bytes that cannot be converted are replaced by U+FFFD.
 */
class CharsetDecoder
{
public:
  /**
   * Open a decoder for `charset`.
   *
   * @return nullptr if the conversion is not supported by iconv
   */
  [[nodiscard]] static std::unique_ptr<CharsetDecoder> open(std::string_view charset);

  ~CharsetDecoder();

  CharsetDecoder(const CharsetDecoder &) = delete;
  CharsetDecoder & operator=(const CharsetDecoder &) = delete;

  /**
   * Decode `bytes` into UTF-8.
   *
   * @param had_errors Set to true if some bytes could not be decoded
   */
  [[nodiscard]] std::string decode(std::string_view bytes, bool & had_errors);

  /// Charset name as given to open()
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  [[nodiscard]] bool is_utf8() const noexcept { return handle_ == nullptr; }

private:
  CharsetDecoder(std::string name, iconv_t handle);

  std::string name_;
  iconv_t handle_ = nullptr;  // nullptr for UTF-8 input
};

/**
 * Converts UTF-8 strings to another charset.
 *
 * Used to hand words to libraries that work in the charset of their data
 * files (hunspell dictionaries).
 */
class CharsetEncoder
{
public:
  /**
   * Open an encoder to `charset`.
   *
   * @return nullptr if the conversion is not supported by iconv
   */
  [[nodiscard]] static std::unique_ptr<CharsetEncoder> open(std::string_view charset);

  ~CharsetEncoder();

  CharsetEncoder(const CharsetEncoder &) = delete;
  CharsetEncoder & operator=(const CharsetEncoder &) = delete;

  /**
   * Encode a UTF-8 string.
   *
   * @return std::nullopt if a character has no representation in the target
   *         charset or `utf8` is not valid UTF-8
   */
  [[nodiscard]] std::optional<std::string> encode(std::string_view utf8);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  CharsetEncoder(std::string name, iconv_t handle);

  std::string name_;
  iconv_t handle_ = nullptr;  // nullptr for UTF-8 output
};

}  // namespace poexam::po
