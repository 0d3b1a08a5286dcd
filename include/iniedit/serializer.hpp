/**
 * @file serializer.hpp
 * @brief Writes a Document back to INI text.
 *
 * Output layout:
 *   default-section properties (no header)
 *   <blank line>
 *   ; pre-comments
 *   [section] ; inline
 *   key=value ; inline
 *   <blank line between sections>
 *
 * Every line ends with '\n'. Serialization never modifies the document.
 * Unquoted values are written with comment prefixes escaped as "\;". A
 * value with no unquoted form is quoted on output without touching
 * Property::IsQuoted(), so it reads back quoted.
 *
 * A key that starts with one of the document's comment prefixes would read
 * back as a comment; saving such a document fails with kInvalidName.
 */

#ifndef INIEDIT_SERIALIZER_HPP_
#define INIEDIT_SERIALIZER_HPP_

#include "iniedit/document.hpp"
#include "iniedit/log.hpp"
#include "iniedit/string_util.hpp"
#include "iniedit/text_encoding.hpp"
#include "iniedit/vocabulary.hpp"

#include <fstream>
#include <future>
#include <ostream>
#include <string>
#include <utility>

namespace iniedit {

/**
 * @brief True when @p value has no unquoted form that parses back unchanged.
 *
 * That is the case for leading or trailing whitespace, a leading '"' and
 * control characters other than an inner tab.
 */
inline bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return false;
  if (IsWhitespace(value.front()) || IsWhitespace(value.back()) ||
      value.front() == '"') {
    return true;
  }
  for (char c : value) {
    auto u = static_cast<unsigned char>(c);
    if ((u < 0x20 && c != '\t') || u == 0x7F) return true;
  }
  return false;
}

namespace detail {

inline void WriteEscaped(const std::string& value, std::string& out) {
  for (char c : value) {
    switch (c) {
      case '\0': out += "\\0"; break;
      case '\a': out += "\\a"; break;
      case '\b': out += "\\b"; break;
      case '\t': out += "\\t"; break;
      case '\r': out += "\\r"; break;
      case '\n': out += "\\n"; break;
      case ';':  out += "\\;"; break;
      case '#':  out += "\\#"; break;
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      default:   out.push_back(c); break;
    }
  }
}

inline void WriteUnquoted(const std::string& value,
                          const std::string& prefix_chars, std::string& out) {
  for (char c : value) {
    if (prefix_chars.find(c) != std::string::npos) out.push_back('\\');
    out.push_back(c);
  }
}

inline void WritePreComments(const ElementBase& element, std::string& out) {
  for (const auto& comment : element.PreComments()) {
    out.push_back(comment.Prefix());
    out += comment.Value();
    out.push_back('\n');
  }
}

inline void WriteInlineComment(const ElementBase& element, std::string& out) {
  if (!element.HasInlineComment()) return;
  const Comment& comment = element.InlineComment().value();
  out.push_back(' ');
  out.push_back(comment.Prefix());
  out += comment.Value();
}

inline void WriteProperty(const Property& prop, const std::string& prefix_chars,
                          std::string& out) {
  WritePreComments(prop, out);
  out += prop.Name();
  out.push_back('=');
  if (prop.IsQuoted() || NeedsQuoting(prop.Value())) {
    out.push_back('"');
    WriteEscaped(prop.Value(), out);
    out.push_back('"');
  } else {
    WriteUnquoted(prop.Value(), prefix_chars, out);
  }
  WriteInlineComment(prop, out);
  out.push_back('\n');
}

inline bool KeysReadBack(const Section& section,
                         const std::string& prefix_chars) {
  for (const auto& prop : section) {
    if (prefix_chars.find(prop.Name().front()) != std::string::npos) {
      INIEDIT_LOG_WARN("Serializer",
                       "key '%s' in '%s' starts with a comment prefix",
                       prop.Name().c_str(), section.Name().c_str());
      return false;
    }
  }
  return true;
}

}  // namespace detail

/// @brief Render @p doc as UTF-8 INI text.
inline expected<std::string, IniError> SaveString(const Document& doc) {
  const std::string& prefixes = doc.CommentPrefixChars();
  bool valid = detail::KeysReadBack(doc.DefaultSection(), prefixes);
  for (auto it = doc.begin(); valid && it != doc.end(); ++it) {
    valid = detail::KeysReadBack(*it, prefixes);
  }
  if (!valid) {
    return expected<std::string, IniError>::error(IniError::kInvalidName);
  }

  std::string out;

  const Section& defaults = doc.DefaultSection();
  for (const auto& prop : defaults) {
    detail::WriteProperty(prop, prefixes, out);
  }
  bool need_separator = !defaults.Empty();

  for (const auto& sec : doc) {
    if (need_separator) out.push_back('\n');
    need_separator = true;

    detail::WritePreComments(sec, out);
    out.push_back('[');
    out += sec.Name();
    out.push_back(']');
    detail::WriteInlineComment(sec, out);
    out.push_back('\n');
    for (const auto& prop : sec) {
      detail::WriteProperty(prop, prefixes, out);
    }
  }
  return expected<std::string, IniError>::success(std::move(out));
}

inline expected<void, IniError> Save(const Document& doc, std::ostream& out,
                                     TextEncoding encoding = TextEncoding::kUtf8) {
  auto text = SaveString(doc);
  if (!text) {
    return expected<void, IniError>::error(text.get_error());
  }
  std::string bytes = EncodeText(text.value(), encoding);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    INIEDIT_LOG_ERROR("Serializer", "stream write failed");
    return expected<void, IniError>::error(IniError::kIoError);
  }
  return expected<void, IniError>::success();
}

inline expected<void, IniError> SaveFile(
    const Document& doc, const std::string& path,
    TextEncoding encoding = TextEncoding::kUtf8) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    INIEDIT_LOG_ERROR("Serializer", "cannot open '%s' for writing",
                      path.c_str());
    return expected<void, IniError>::error(IniError::kIoError);
  }
  auto result = Save(doc, out, encoding);
  if (result) {
    INIEDIT_LOG_INFO("Serializer", "saved '%s' (%zu section(s))", path.c_str(),
                     doc.SectionCount());
  }
  return result;
}

/**
 * @brief Serialize @p doc now and write the bytes on a separate thread.
 *
 * The document may be modified or destroyed as soon as this returns.
 */
inline std::future<expected<void, IniError>> SaveFileAsync(
    const Document& doc, const std::string& path,
    TextEncoding encoding = TextEncoding::kUtf8) {
  auto text = SaveString(doc);
  if (!text) {
    std::promise<expected<void, IniError>> failed;
    failed.set_value(expected<void, IniError>::error(text.get_error()));
    return failed.get_future();
  }
  std::string bytes = EncodeText(text.value(), encoding);
  return std::async(std::launch::async, [path, bytes]() {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      INIEDIT_LOG_ERROR("Serializer", "cannot open '%s' for writing",
                        path.c_str());
      return expected<void, IniError>::error(IniError::kIoError);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      INIEDIT_LOG_ERROR("Serializer", "write to '%s' failed", path.c_str());
      return expected<void, IniError>::error(IniError::kIoError);
    }
    return expected<void, IniError>::success();
  });
}

}  // namespace iniedit

#endif  // INIEDIT_SERIALIZER_HPP_
