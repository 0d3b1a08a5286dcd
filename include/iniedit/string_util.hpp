/**
 * @file string_util.hpp
 * @brief Whitespace trimming and ASCII case-insensitive comparison helpers.
 */

#ifndef INIEDIT_STRING_UTIL_HPP_
#define INIEDIT_STRING_UTIL_HPP_

#include <cstddef>
#include <string>

namespace iniedit {

/** Characters treated as whitespace by the trim helpers. */
constexpr const char* Whitespaces() { return " \t\n\r\f\v"; }

inline bool IsWhitespace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

inline char ToLowerAscii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

/** Trims a string in place. */
inline void Trim(std::string& str) {
  auto lastpos = str.find_last_not_of(Whitespaces());
  if (lastpos == std::string::npos) {
    str.clear();
    return;
  }
  str.erase(lastpos + 1);
  str.erase(0, str.find_first_not_of(Whitespaces()));
}

inline std::string TrimCopy(std::string str) {
  Trim(str);
  return str;
}

inline std::string TrimStart(const std::string& str) {
  auto pos = str.find_first_not_of(Whitespaces());
  return (pos == std::string::npos) ? std::string() : str.substr(pos);
}

inline std::string TrimEnd(const std::string& str) {
  auto pos = str.find_last_not_of(Whitespaces());
  return (pos == std::string::npos) ? std::string() : str.substr(0, pos + 1);
}

inline bool IsBlank(const std::string& str) noexcept {
  return str.find_first_not_of(Whitespaces()) == std::string::npos;
}

inline bool ContainsLineTerminator(const std::string& str) noexcept {
  return str.find_first_of("\r\n") != std::string::npos;
}

inline std::string ToLowerCopy(std::string str) {
  for (auto& c : str) {
    c = ToLowerAscii(c);
  }
  return str;
}

inline bool EqualsIgnoreCase(const std::string& lhs,
                             const std::string& rhs) noexcept {
  if (lhs.size() != rhs.size()) return false;
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (ToLowerAscii(lhs[i]) != ToLowerAscii(rhs[i])) return false;
  }
  return true;
}

/** Three-way ordinal comparison after ASCII case folding. */
inline int CompareIgnoreCase(const std::string& lhs,
                             const std::string& rhs) noexcept {
  size_t n = lhs.size() < rhs.size() ? lhs.size() : rhs.size();
  for (size_t i = 0; i < n; ++i) {
    auto a = static_cast<unsigned char>(ToLowerAscii(lhs[i]));
    auto b = static_cast<unsigned char>(ToLowerAscii(rhs[i]));
    if (a != b) return (a < b) ? -1 : 1;
  }
  if (lhs.size() == rhs.size()) return 0;
  return (lhs.size() < rhs.size()) ? -1 : 1;
}

// ============================================================================
// Functors for case-insensitive associative containers
// ============================================================================

struct CaseInsensitiveHash {
  size_t operator()(const std::string& str) const noexcept {
    // FNV-1a over folded bytes
    size_t hash = static_cast<size_t>(14695981039346656037ULL);
    for (char c : str) {
      hash ^= static_cast<unsigned char>(ToLowerAscii(c));
      hash *= static_cast<size_t>(1099511628211ULL);
    }
    return hash;
  }
};

struct CaseInsensitiveEqual {
  bool operator()(const std::string& lhs, const std::string& rhs) const noexcept {
    return EqualsIgnoreCase(lhs, rhs);
  }
};

struct CaseInsensitiveLess {
  bool operator()(const std::string& lhs, const std::string& rhs) const noexcept {
    return CompareIgnoreCase(lhs, rhs) < 0;
  }
};

}  // namespace iniedit

#endif  // INIEDIT_STRING_UTIL_HPP_
