/**
 * @file extensions.hpp
 * @brief Sorting, filtering, and environment-variable substitution helpers
 *        layered on the document model.
 */

#ifndef INIEDIT_EXTENSIONS_HPP_
#define INIEDIT_EXTENSIONS_HPP_

#include "iniedit/document.hpp"
#include "iniedit/log.hpp"
#include "iniedit/property.hpp"
#include "iniedit/section.hpp"
#include "iniedit/vocabulary.hpp"

#include <cstdlib>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace iniedit {

// ============================================================================
// Sorting (case-insensitive, stable)
// ============================================================================

inline void SortPropertiesByName(Section& section) {
  section.SortPropertiesByName();
}

/// Sorts properties inside every named section; the default section is left.
inline void SortPropertiesByName(Document& doc) {
  for (auto& sec : doc) {
    sec.SortPropertiesByName();
  }
}

inline void SortSectionsByName(Document& doc) { doc.SortSectionsByName(); }

inline void SortAllByName(Document& doc) {
  SortSectionsByName(doc);
  SortPropertiesByName(doc);
}

// ============================================================================
// Filtering
// ============================================================================

/// A property found by a document-wide search and the section holding it.
struct PropertyMatch {
  const Section* section;
  const Property* property;
};

inline std::vector<const Section*> GetSectionsWhere(
    const Document& doc, function_ref<bool(const Section&)> pred) {
  std::vector<const Section*> out;
  for (const auto& sec : doc) {
    if (pred(sec)) out.push_back(&sec);
  }
  return out;
}

inline std::vector<const Property*> GetPropertiesWhere(
    const Section& section, function_ref<bool(const Property&)> pred) {
  std::vector<const Property*> out;
  for (const auto& prop : section) {
    if (pred(prop)) out.push_back(&prop);
  }
  return out;
}

namespace detail {

inline expected<std::regex, IniError> CompilePattern(const std::string& pattern) {
  if (pattern.empty()) {
    return expected<std::regex, IniError>::error(IniError::kInvalidArgument);
  }
  try {
    return expected<std::regex, IniError>::success(
        std::regex(pattern, std::regex::ECMAScript | std::regex::icase));
  } catch (const std::regex_error& e) {
    INIEDIT_LOG_WARN("Filter", "bad pattern '%s': %s", pattern.c_str(),
                     e.what());
    return expected<std::regex, IniError>::error(IniError::kInvalidPattern);
  }
}

}  // namespace detail

/**
 * @brief Sections whose name contains a match of @p pattern (ECMAScript,
 *        case-insensitive).
 *
 * Fails with kInvalidArgument on an empty pattern and kInvalidPattern when
 * the pattern does not compile.
 */
inline expected<std::vector<const Section*>, IniError> GetSectionsByPattern(
    const Document& doc, const std::string& pattern) {
  using Result = expected<std::vector<const Section*>, IniError>;
  auto re = detail::CompilePattern(pattern);
  if (!re) return Result::error(re.get_error());
  const std::regex& rx = re.value();
  return Result::success(GetSectionsWhere(
      doc, [&rx](const Section& s) { return std::regex_search(s.Name(), rx); }));
}

/// @brief Properties whose name contains a match of @p pattern.
inline expected<std::vector<const Property*>, IniError> GetPropertiesByPattern(
    const Section& section, const std::string& pattern) {
  using Result = expected<std::vector<const Property*>, IniError>;
  auto re = detail::CompilePattern(pattern);
  if (!re) return Result::error(re.get_error());
  const std::regex& rx = re.value();
  return Result::success(GetPropertiesWhere(section, [&rx](const Property& p) {
    return std::regex_search(p.Name(), rx);
  }));
}

inline std::vector<const Property*> GetPropertiesWithValue(
    const Section& section, const std::string& value) {
  return GetPropertiesWhere(
      section, [&value](const Property& p) { return p.Value() == value; });
}

inline std::vector<const Property*> GetPropertiesContaining(
    const Section& section, const std::string& substring) {
  return GetPropertiesWhere(section, [&substring](const Property& p) {
    return p.Value().find(substring) != std::string::npos;
  });
}

/// @brief Every property named @p name, default section first.
inline std::vector<PropertyMatch> FindPropertiesByName(const Document& doc,
                                                       const std::string& name) {
  std::vector<PropertyMatch> out;
  const Property* found = doc.DefaultSection().FindProperty(name);
  if (found != nullptr) out.push_back({&doc.DefaultSection(), found});
  for (const auto& sec : doc) {
    found = sec.FindProperty(name);
    if (found != nullptr) out.push_back({&sec, found});
  }
  return out;
}

/// @brief Every property whose value equals @p value, default section first.
inline std::vector<PropertyMatch> FindPropertiesByValue(const Document& doc,
                                                        const std::string& value) {
  std::vector<PropertyMatch> out;
  for (const auto& prop : doc.DefaultSection()) {
    if (prop.Value() == value) out.push_back({&doc.DefaultSection(), &prop});
  }
  for (const auto& sec : doc) {
    for (const auto& prop : sec) {
      if (prop.Value() == value) out.push_back({&sec, &prop});
    }
  }
  return out;
}

/**
 * @brief Deep copy of @p source keeping the default section's properties and
 *        the sections accepted by @p pred.
 */
inline Document CopyWithSections(const Document& source,
                                 function_ref<bool(const Section&)> pred) {
  Document copy;
  (void)copy.SetCommentPrefixes(source.CommentPrefixChars(),
                                source.DefaultCommentPrefix());
  for (const auto& prop : source.DefaultSection()) {
    (void)copy.DefaultSection().AddProperty(prop.Clone());
  }
  for (const auto& sec : source) {
    if (pred(sec)) (void)copy.AddSection(sec.Clone());
  }
  return copy;
}

/// @brief New section named like @p source holding copies of the accepted
///        properties. Section comments are not copied.
inline Section CopyWithProperties(const Section& source,
                                  function_ref<bool(const Property&)> pred) {
  Section copy = std::move(Section::Create(source.Name())).value();
  for (const auto& prop : source) {
    if (pred(prop)) (void)copy.AddProperty(prop.Clone());
  }
  return copy;
}

// ============================================================================
// Environment variables: ${VAR} and %VAR%
// ============================================================================

/// @brief Replace known `${VAR}` / `%VAR%` references; unknown ones stay.
inline std::string SubstituteEnvironmentVariables(const std::string& value) {
  if (value.empty()) return value;
  static const std::regex kPattern(R"(\$\{([^}]+)\}|%([^%]+)%)");

  std::string out;
  auto last = value.cbegin();
  for (std::sregex_iterator it(value.begin(), value.end(), kPattern), end;
       it != end; ++it) {
    const std::smatch& m = *it;
    out.append(last, m[0].first);
    std::string name = m[1].matched ? m[1].str() : m[2].str();
    const char* env = std::getenv(name.c_str());
    out += (env != nullptr) ? std::string(env) : m[0].str();
    last = m[0].second;
  }
  out.append(last, value.cend());
  return out;
}

inline void SubstituteEnvironmentVariables(Property& prop) {
  prop.SetValue(SubstituteEnvironmentVariables(prop.Value()));
}

inline void SubstituteEnvironmentVariables(Section& section) {
  for (auto& prop : section) {
    SubstituteEnvironmentVariables(prop);
  }
}

/// Default section included.
inline void SubstituteEnvironmentVariables(Document& doc) {
  SubstituteEnvironmentVariables(doc.DefaultSection());
  for (auto& sec : doc) {
    SubstituteEnvironmentVariables(sec);
  }
}

/**
 * @brief Compute the substituted value of @p prop without modifying it.
 * @return true when at least one reference was replaced.
 */
inline bool TrySubstituteEnvironmentVariables(const Property& prop,
                                              std::string& result) {
  result = SubstituteEnvironmentVariables(prop.Value());
  return result != prop.Value();
}

}  // namespace iniedit

#endif  // INIEDIT_EXTENSIONS_HPP_
