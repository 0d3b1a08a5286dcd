/**
 * @file exporter.hpp
 * @brief One-way export of a document to CSV and, optionally, JSON or XML.
 *
 * JSON export requires nlohmann/json and is compiled only when
 * INIEDIT_EXPORT_JSON_ENABLED is defined. XML export requires tinyxml2 and
 * is compiled only when INIEDIT_EXPORT_XML_ENABLED is defined.
 */

#ifndef INIEDIT_EXPORTER_HPP_
#define INIEDIT_EXPORTER_HPP_

#include "iniedit/convert.hpp"
#include "iniedit/document.hpp"
#include "iniedit/log.hpp"
#include "iniedit/string_util.hpp"
#include "iniedit/vocabulary.hpp"

#include <cmath>
#include <fstream>
#include <string>
#include <utility>

#ifdef INIEDIT_EXPORT_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef INIEDIT_EXPORT_XML_ENABLED
#include <tinyxml2.h>
#endif

namespace iniedit {

namespace detail {

inline expected<void, IniError> WriteTextFile(const std::string& path,
                                              const std::string& text) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    INIEDIT_LOG_ERROR("Export", "cannot open '%s' for writing", path.c_str());
    return expected<void, IniError>::error(IniError::kIoError);
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!out.flush()) {
    INIEDIT_LOG_ERROR("Export", "write to '%s' failed", path.c_str());
    return expected<void, IniError>::error(IniError::kIoError);
  }
  return expected<void, IniError>::success();
}

}  // namespace detail

// ============================================================================
// CSV
// ============================================================================

struct CsvExportOptions {
  char delimiter = ',';
  bool include_header = true;
  bool include_comments = false;  ///< Adds a column with the inline comment.
  bool always_quote = false;
};

namespace detail {

inline void AppendCsvField(const std::string& value,
                           const CsvExportOptions& options, std::string& out) {
  if (value.empty()) {
    if (options.always_quote) out += "\"\"";
    return;
  }
  bool quote = options.always_quote ||
               value.find(options.delimiter) != std::string::npos ||
               value.find_first_of("\"\r\n") != std::string::npos;
  if (!quote) {
    out += value;
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
}

inline void AppendCsvRow(const std::string& section, const Property& prop,
                         const CsvExportOptions& options, std::string& out) {
  AppendCsvField(section, options, out);
  out.push_back(options.delimiter);
  AppendCsvField(prop.Name(), options, out);
  out.push_back(options.delimiter);
  AppendCsvField(prop.Value(), options, out);
  if (options.include_comments) {
    out.push_back(options.delimiter);
    AppendCsvField(prop.HasInlineComment() ? prop.InlineComment()->Value()
                                           : std::string(),
                   options, out);
  }
  out.push_back('\n');
}

}  // namespace detail

/**
 * @brief One row per property: Section, Key, Value[, Comment].
 *
 * Default-section properties come first with an empty section column.
 */
inline std::string ToCsv(const Document& doc,
                         const CsvExportOptions& options = CsvExportOptions()) {
  std::string out;
  if (options.include_header) {
    out += "Section";
    out.push_back(options.delimiter);
    out += "Key";
    out.push_back(options.delimiter);
    out += "Value";
    if (options.include_comments) {
      out.push_back(options.delimiter);
      out += "Comment";
    }
    out.push_back('\n');
  }
  for (const auto& prop : doc.DefaultSection()) {
    detail::AppendCsvRow(std::string(), prop, options, out);
  }
  for (const auto& sec : doc) {
    for (const auto& prop : sec) {
      detail::AppendCsvRow(sec.Name(), prop, options, out);
    }
  }
  return out;
}

inline expected<void, IniError> ToCsvFile(
    const Document& doc, const std::string& path,
    const CsvExportOptions& options = CsvExportOptions()) {
  return detail::WriteTextFile(path, ToCsv(doc, options));
}

// ============================================================================
// JSON (nlohmann/json)
// ============================================================================

#ifdef INIEDIT_EXPORT_JSON_ENABLED

struct JsonExportOptions {
  bool indented = true;
  bool include_comments = false;
  /// Put default-section properties at the root instead of under "_default".
  bool flatten_default_section = false;
  /// Emit bool / integer / floating values as JSON scalars.
  bool auto_convert_types = false;
};

namespace detail {

using JsonObject = nlohmann::ordered_json;

inline JsonObject AutoTypedJson(const std::string& value) {
  bool flag = false;
  if (Convert<bool>::Decode(value, flag)) return JsonObject(flag);
  long long integer = 0;
  if (ParseSigned(value, integer)) return JsonObject(integer);
  double real = 0.0;
  if (DecodeFloating(value, real) && std::isfinite(real)) return JsonObject(real);
  return JsonObject(value);
}

inline JsonObject CommentArray(const CommentCollection& comments) {
  JsonObject arr = JsonObject::array();
  for (const auto& c : comments) {
    arr.push_back(c.Value());
  }
  return arr;
}

/// @return false when @p key is already taken in @p obj.
inline bool PutJsonMember(JsonObject& obj, const std::string& key,
                          JsonObject value) {
  if (obj.contains(key)) {
    INIEDIT_LOG_WARN("Export", "JSON member '%s' would be written twice",
                     key.c_str());
    return false;
  }
  obj[key] = std::move(value);
  return true;
}

inline bool AddJsonProperty(JsonObject& obj, const Property& prop,
                            const JsonExportOptions& options) {
  if (options.include_comments &&
      (!prop.PreComments().empty() || prop.HasInlineComment())) {
    JsonObject entry = JsonObject::object();
    entry["value"] = prop.Value();
    if (!prop.PreComments().empty()) {
      entry["preComments"] = CommentArray(prop.PreComments());
    }
    if (prop.HasInlineComment()) {
      entry["comment"] = prop.InlineComment()->Value();
    }
    return PutJsonMember(obj, prop.Name(), std::move(entry));
  }
  return PutJsonMember(obj, prop.Name(),
                       options.auto_convert_types ? AutoTypedJson(prop.Value())
                                                  : JsonObject(prop.Value()));
}

inline bool SectionJson(const Section& sec, const JsonExportOptions& options,
                        JsonObject& obj) {
  if (options.include_comments) {
    if (!sec.PreComments().empty()) {
      obj["_preComments"] = CommentArray(sec.PreComments());
    }
    if (sec.HasInlineComment()) {
      obj["_comment"] = sec.InlineComment()->Value();
    }
  }
  for (const auto& prop : sec) {
    if (!AddJsonProperty(obj, prop, options)) return false;
  }
  return true;
}

inline bool AddJsonSection(JsonObject& root, const std::string& key,
                           const Section& sec, const JsonExportOptions& options) {
  JsonObject obj = JsonObject::object();
  return SectionJson(sec, options, obj) &&
         PutJsonMember(root, key, std::move(obj));
}

}  // namespace detail

/**
 * @brief Object keyed by section name; each section an object keyed by
 *        property name. Non-empty default section goes under "_default".
 *
 * Fails with kDuplicateName when two members would share a key: a section
 * named "_default", a property named "_comment" or "_preComments" next to
 * exported section comments, or a flattened default property named like a
 * section.
 */
inline expected<std::string, IniError> ToJson(
    const Document& doc, const JsonExportOptions& options = JsonExportOptions()) {
  detail::JsonObject root = detail::JsonObject::object();
  const Section& defaults = doc.DefaultSection();
  bool unique = true;
  if (!defaults.Empty()) {
    if (options.flatten_default_section) {
      for (const auto& prop : defaults) {
        unique = unique && detail::AddJsonProperty(root, prop, options);
      }
    } else {
      unique = detail::AddJsonSection(root, "_default", defaults, options);
    }
  }
  for (auto it = doc.begin(); unique && it != doc.end(); ++it) {
    unique = detail::AddJsonSection(root, it->Name(), *it, options);
  }
  if (!unique) {
    return expected<std::string, IniError>::error(IniError::kDuplicateName);
  }
  return expected<std::string, IniError>::success(
      root.dump(options.indented ? 2 : -1, ' ', false,
                nlohmann::json::error_handler_t::replace));
}

inline expected<void, IniError> ToJsonFile(
    const Document& doc, const std::string& path,
    const JsonExportOptions& options = JsonExportOptions()) {
  auto json = ToJson(doc, options);
  if (!json) {
    return expected<void, IniError>::error(json.get_error());
  }
  return detail::WriteTextFile(path, json.value());
}

#endif  // INIEDIT_EXPORT_JSON_ENABLED

// ============================================================================
// XML (tinyxml2)
// ============================================================================

#ifdef INIEDIT_EXPORT_XML_ENABLED

struct XmlExportOptions {
  bool indented = true;
  bool include_declaration = true;
  /// Pre-comments become XML comments; inline comments become a comment
  /// on a section and a "comment" attribute on a property.
  bool include_comments = false;
  std::string root_element_name = "configuration";
  std::string section_element_name = "section";
  std::string property_element_name = "property";
  /// Write the value as a "value" attribute instead of element text.
  bool use_attribute_for_value = false;
};

namespace detail {

/// ASCII subset of the XML Name production, without ':'.
inline bool IsXmlName(const std::string& name) {
  auto name_start = [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
  };
  if (name.empty() || !name_start(name[0])) return false;
  for (char c : name) {
    if (!name_start(c) && !(c >= '0' && c <= '9') && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

/// Replace the control characters XML 1.0 cannot carry with '?'.
inline std::string XmlText(const std::string& text) {
  std::string out(text);
  for (auto& c : out) {
    auto u = static_cast<unsigned char>(c);
    if (u < 0x20 && c != '\t' && c != '\n' && c != '\r') c = '?';
  }
  return out;
}

/// A comment may not contain "--" nor end with '-'.
inline std::string XmlCommentText(const std::string& text) {
  std::string out;
  for (char c : XmlText(text)) {
    if (c == '-' && !out.empty() && out.back() == '-') out.push_back(' ');
    out.push_back(c);
  }
  if (!out.empty() && out.back() == '-') out.push_back(' ');
  return out;
}

inline void AddXmlComments(tinyxml2::XMLDocument& xml,
                           tinyxml2::XMLElement* parent,
                           const CommentCollection& comments) {
  for (const auto& comment : comments) {
    parent->InsertEndChild(
        xml.NewComment(XmlCommentText(comment.Value()).c_str()));
  }
}

inline void AddXmlProperty(tinyxml2::XMLDocument& xml,
                           tinyxml2::XMLElement* parent, const Property& prop,
                           const XmlExportOptions& options) {
  if (options.include_comments) {
    AddXmlComments(xml, parent, prop.PreComments());
  }
  tinyxml2::XMLElement* item =
      xml.NewElement(options.property_element_name.c_str());
  parent->InsertEndChild(item);
  item->SetAttribute("key", XmlText(prop.Name()).c_str());
  if (options.use_attribute_for_value) {
    item->SetAttribute("value", XmlText(prop.Value()).c_str());
  } else if (!prop.Value().empty()) {
    item->SetText(XmlText(prop.Value()).c_str());
  }
  if (options.include_comments && prop.HasInlineComment()) {
    item->SetAttribute("comment",
                       XmlText(prop.InlineComment()->Value()).c_str());
  }
}

/// The default section carries default="true" instead of a name.
inline void AddXmlSection(tinyxml2::XMLDocument& xml,
                          tinyxml2::XMLElement* root, const Section& sec,
                          bool is_default, const XmlExportOptions& options) {
  tinyxml2::XMLElement* node =
      xml.NewElement(options.section_element_name.c_str());
  root->InsertEndChild(node);
  if (is_default) {
    node->SetAttribute("default", true);
  } else {
    node->SetAttribute("name", XmlText(sec.Name()).c_str());
  }
  if (options.include_comments) {
    AddXmlComments(xml, node, sec.PreComments());
    if (sec.HasInlineComment()) {
      node->InsertEndChild(xml.NewComment(
          XmlCommentText("Inline: " + sec.InlineComment()->Value()).c_str()));
    }
  }
  for (const auto& prop : sec) {
    AddXmlProperty(xml, node, prop, options);
  }
}

}  // namespace detail

/**
 * @brief Root element with one section element per section, each holding
 *        one property element per property.
 *
 * Names travel in "name" and "key" attributes, so any section or key name
 * is representable. Fails with kInvalidArgument when an element name in
 * @p options is not an XML name.
 */
inline expected<std::string, IniError> ToXml(
    const Document& doc, const XmlExportOptions& options = XmlExportOptions()) {
  if (!detail::IsXmlName(options.root_element_name) ||
      !detail::IsXmlName(options.section_element_name) ||
      !detail::IsXmlName(options.property_element_name)) {
    INIEDIT_LOG_WARN("Export", "invalid XML element name in export options");
    return expected<std::string, IniError>::error(IniError::kInvalidArgument);
  }

  tinyxml2::XMLDocument xml;
  if (options.include_declaration) {
    xml.InsertEndChild(xml.NewDeclaration());
  }
  tinyxml2::XMLElement* root = xml.NewElement(options.root_element_name.c_str());
  xml.InsertEndChild(root);

  if (!doc.DefaultSection().Empty()) {
    detail::AddXmlSection(xml, root, doc.DefaultSection(), true, options);
  }
  for (const auto& sec : doc) {
    detail::AddXmlSection(xml, root, sec, false, options);
  }

  tinyxml2::XMLPrinter printer(nullptr, !options.indented);
  xml.Print(&printer);
  return expected<std::string, IniError>::success(std::string(printer.CStr()));
}

inline expected<void, IniError> ToXmlFile(
    const Document& doc, const std::string& path,
    const XmlExportOptions& options = XmlExportOptions()) {
  auto xml = ToXml(doc, options);
  if (!xml) {
    return expected<void, IniError>::error(xml.get_error());
  }
  return detail::WriteTextFile(path, xml.value());
}

#endif  // INIEDIT_EXPORT_XML_ENABLED

}  // namespace iniedit

#endif  // INIEDIT_EXPORTER_HPP_
