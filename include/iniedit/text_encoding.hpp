/**
 * @file text_encoding.hpp
 * @brief Byte <-> UTF-8 text conversion for load and save.
 *
 * The in-memory model is always UTF-8. The encoding is chosen by the
 * caller; no detection is attempted beyond stripping a UTF-8 BOM.
 */

#ifndef INIEDIT_TEXT_ENCODING_HPP_
#define INIEDIT_TEXT_ENCODING_HPP_

#include <cstdint>
#include <string>

namespace iniedit {

enum class TextEncoding : uint8_t {
  kUtf8 = 0,  ///< UTF-8; a leading BOM is skipped on load, none written.
  kUtf8Bom,   ///< UTF-8; a leading BOM is skipped on load and written on save.
  kLatin1,    ///< ISO-8859-1; unmappable characters are saved as '?'.
};

namespace detail {

constexpr const char kUtf8Bom[] = "\xEF\xBB\xBF";

inline bool StartsWithBom(const std::string& bytes) noexcept {
  return bytes.size() >= 3 && bytes.compare(0, 3, kUtf8Bom) == 0;
}

inline std::string Latin1ToUtf8(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (char ch : bytes) {
    auto c = static_cast<unsigned char>(ch);
    if (c < 0x80) {
      out.push_back(ch);
    } else {
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }
  return out;
}

inline std::string Utf8ToLatin1(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    size_t len = 1;
    uint32_t cp = c;
    if (c >= 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else if (c >= 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if (c >= 0xC0) {
      len = 2;
      cp = c & 0x1F;
    }
    if (i + len > text.size()) {
      out.push_back('?');
      break;
    }
    for (size_t k = 1; k < len; ++k) {
      cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
    }
    out.push_back(cp <= 0xFF ? static_cast<char>(cp) : '?');
    i += len;
  }
  return out;
}

}  // namespace detail

/// @brief Convert raw file bytes to UTF-8 text.
inline std::string DecodeText(const std::string& bytes, TextEncoding encoding) {
  switch (encoding) {
    case TextEncoding::kLatin1:
      return detail::Latin1ToUtf8(bytes);
    case TextEncoding::kUtf8:
    case TextEncoding::kUtf8Bom:
      break;
  }
  return detail::StartsWithBom(bytes) ? bytes.substr(3) : bytes;
}

/// @brief Convert UTF-8 text to the bytes written for @p encoding.
inline std::string EncodeText(const std::string& text, TextEncoding encoding) {
  switch (encoding) {
    case TextEncoding::kLatin1:
      return detail::Utf8ToLatin1(text);
    case TextEncoding::kUtf8Bom:
      return std::string(detail::kUtf8Bom) + text;
    case TextEncoding::kUtf8:
      break;
  }
  return text;
}

}  // namespace iniedit

#endif  // INIEDIT_TEXT_ENCODING_HPP_
