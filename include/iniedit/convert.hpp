/**
 * @file convert.hpp
 * @brief String <-> typed value conversion functors and the array codec.
 *
 * Convert<T> is specialized per supported type:
 *   static bool Decode(const std::string& value, T& result);
 *   static void Encode(const T& value, std::string& result);
 *
 * Decode never throws; it reports failure through its return value and
 * leaves @p result unspecified on failure. Numbers are parsed as decimal
 * and surrounding whitespace is ignored.
 *
 * Array values use the form `{a, b, "c,d"}`. Elements that contain one of
 * `, { } "` or a space are wrapped in quotes with inner quotes escaped as
 * `\"`.
 */

#ifndef INIEDIT_CONVERT_HPP_
#define INIEDIT_CONVERT_HPP_

#include "iniedit/string_util.hpp"
#include "iniedit/vocabulary.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <locale>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace iniedit {

#ifndef INIEDIT_MAX_ARRAY_ELEMENTS
#define INIEDIT_MAX_ARRAY_ELEMENTS 10000U
#endif

namespace detail {

inline bool ParseSigned(const std::string& value, long long& result) {
  std::string str = TrimCopy(value);
  if (str.empty()) return false;
  char* end = nullptr;
  errno = 0;
  result = std::strtoll(str.c_str(), &end, 10);
  return errno != ERANGE && end == str.c_str() + str.size();
}

inline bool ParseUnsigned(const std::string& value, unsigned long long& result) {
  std::string str = TrimCopy(value);
  // strtoull silently wraps negative input
  if (str.empty() || str[0] == '-') return false;
  char* end = nullptr;
  errno = 0;
  result = std::strtoull(str.c_str(), &end, 10);
  return errno != ERANGE && end == str.c_str() + str.size();
}

template <typename T>
bool DecodeSigned(const std::string& value, T& result) {
  long long tmp = 0;
  if (!ParseSigned(value, tmp)) return false;
  if (tmp < static_cast<long long>(std::numeric_limits<T>::min()) ||
      tmp > static_cast<long long>(std::numeric_limits<T>::max())) {
    return false;
  }
  result = static_cast<T>(tmp);
  return true;
}

template <typename T>
bool DecodeUnsigned(const std::string& value, T& result) {
  unsigned long long tmp = 0;
  if (!ParseUnsigned(value, tmp)) return false;
  if (tmp > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
    return false;
  }
  result = static_cast<T>(tmp);
  return true;
}

template <typename T>
bool DecodeFloating(const std::string& value, T& result) {
  std::string str = TrimCopy(value);
  if (str.empty()) return false;
  char* end = nullptr;
  errno = 0;
  if constexpr (std::is_same<T, float>::value) {
    result = static_cast<T>(std::strtof(str.c_str(), &end));
  } else if constexpr (std::is_same<T, double>::value) {
    result = static_cast<T>(std::strtod(str.c_str(), &end));
  } else {
    result = static_cast<T>(std::strtold(str.c_str(), &end));
  }
  return errno != ERANGE && end == str.c_str() + str.size();
}

template <typename T>
void EncodeNumber(const T& value, std::string& result) {
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << value;
  result = ss.str();
}

/// Shortest representation that parses back to the same value.
template <typename T>
void EncodeFloating(const T& value, std::string& result) {
  for (int precision = std::numeric_limits<T>::digits10;
       precision <= std::numeric_limits<T>::max_digits10; ++precision) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss.precision(precision);
    ss << value;
    result = ss.str();
    T parsed{};
    if (DecodeFloating(result, parsed) && parsed == value) return;
  }
}

}  // namespace detail

template <typename T>
struct Convert {};

template <>
struct Convert<bool> {
  /// Accepts true/false, yes/no (case-insensitive) and 1/0.
  static bool Decode(const std::string& value, bool& result) {
    std::string str = TrimCopy(value);
    if (EqualsIgnoreCase(str, "true") || EqualsIgnoreCase(str, "yes") ||
        str == "1") {
      result = true;
      return true;
    }
    if (EqualsIgnoreCase(str, "false") || EqualsIgnoreCase(str, "no") ||
        str == "0") {
      result = false;
      return true;
    }
    return false;
  }

  static void Encode(const bool value, std::string& result) {
    result = value ? "true" : "false";
  }
};

template <>
struct Convert<char> {
  static bool Decode(const std::string& value, char& result) {
    if (value.size() != 1) return false;
    result = value[0];
    return true;
  }

  static void Encode(const char value, std::string& result) {
    result.assign(1, value);
  }
};

template <>
struct Convert<short> {
  static bool Decode(const std::string& value, short& result) {
    return detail::DecodeSigned(value, result);
  }
  static void Encode(const short value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<unsigned short> {
  static bool Decode(const std::string& value, unsigned short& result) {
    return detail::DecodeUnsigned(value, result);
  }
  static void Encode(const unsigned short value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<int> {
  static bool Decode(const std::string& value, int& result) {
    return detail::DecodeSigned(value, result);
  }
  static void Encode(const int value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<unsigned int> {
  static bool Decode(const std::string& value, unsigned int& result) {
    return detail::DecodeUnsigned(value, result);
  }
  static void Encode(const unsigned int value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<long> {
  static bool Decode(const std::string& value, long& result) {
    return detail::DecodeSigned(value, result);
  }
  static void Encode(const long value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<unsigned long> {
  static bool Decode(const std::string& value, unsigned long& result) {
    return detail::DecodeUnsigned(value, result);
  }
  static void Encode(const unsigned long value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<long long> {
  static bool Decode(const std::string& value, long long& result) {
    return detail::DecodeSigned(value, result);
  }
  static void Encode(const long long value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<unsigned long long> {
  static bool Decode(const std::string& value, unsigned long long& result) {
    return detail::DecodeUnsigned(value, result);
  }
  static void Encode(const unsigned long long value, std::string& result) {
    detail::EncodeNumber(value, result);
  }
};

template <>
struct Convert<float> {
  static bool Decode(const std::string& value, float& result) {
    return detail::DecodeFloating(value, result);
  }
  static void Encode(const float value, std::string& result) {
    detail::EncodeFloating(value, result);
  }
};

template <>
struct Convert<double> {
  static bool Decode(const std::string& value, double& result) {
    return detail::DecodeFloating(value, result);
  }
  static void Encode(const double value, std::string& result) {
    detail::EncodeFloating(value, result);
  }
};

/// Decimal values map to long double.
template <>
struct Convert<long double> {
  static bool Decode(const std::string& value, long double& result) {
    return detail::DecodeFloating(value, result);
  }
  static void Encode(const long double value, std::string& result) {
    detail::EncodeFloating(value, result);
  }
};

template <>
struct Convert<std::string> {
  static bool Decode(const std::string& value, std::string& result) {
    result = value;
    return true;
  }
  static void Encode(const std::string& value, std::string& result) {
    result = value;
  }
};

// ============================================================================
// Array codec
// ============================================================================

namespace detail {

inline bool ArrayElementNeedsQuotes(const std::string& item) noexcept {
  return item.find_first_of(",{}\" ") != std::string::npos;
}

inline void AppendArrayElement(const std::string& item, std::string& out) {
  if (!ArrayElementNeedsQuotes(item)) {
    out += item;
    return;
  }
  out.push_back('"');
  for (char c : item) {
    if (c == '"') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

inline std::string UnescapeArrayElement(const std::string& item) {
  std::string out;
  out.reserve(item.size());
  for (size_t i = 0; i < item.size(); ++i) {
    if (item[i] == '\\' && i + 1 < item.size() && item[i + 1] == '"') {
      out.push_back('"');
      ++i;
    } else {
      out.push_back(item[i]);
    }
  }
  return out;
}

}  // namespace detail

inline std::string EncodeArray(const std::vector<std::string>& items) {
  std::string out;
  out.push_back('{');
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    detail::AppendArrayElement(items[i], out);
  }
  out.push_back('}');
  return out;
}

/**
 * @brief Split an array value into its raw element strings.
 *
 * Empty elements are skipped. @p max_elements of 0 means unlimited.
 * Fails with kInvalidArrayFormat on missing braces, an unterminated quote
 * or when the element count exceeds @p max_elements.
 */
inline expected<std::vector<std::string>, IniError> DecodeArray(
    const std::string& value, size_t max_elements = INIEDIT_MAX_ARRAY_ELEMENTS) {
  using Result = expected<std::vector<std::string>, IniError>;
  std::string body = TrimCopy(value);
  if (body.size() < 2 || body.front() != '{' || body.back() != '}') {
    return Result::error(IniError::kInvalidArrayFormat);
  }
  body = body.substr(1, body.size() - 2);

  std::vector<std::string> items;
  bool in_quotes = false;
  size_t start = 0;
  for (size_t i = 0; i <= body.size(); ++i) {
    if (i < body.size()) {
      if (body[i] == '"') {
        if (i == 0 || body[i - 1] != '\\') in_quotes = !in_quotes;
        continue;
      }
      if (in_quotes || body[i] != ',') continue;
    } else if (in_quotes) {
      return Result::error(IniError::kInvalidArrayFormat);
    }

    std::string item = TrimCopy(body.substr(start, i - start));
    start = i + 1;
    if (item.empty()) continue;
    if (max_elements > 0 && items.size() >= max_elements) {
      return Result::error(IniError::kInvalidArrayFormat);
    }
    if (item.size() >= 2 && item.front() == '"' && item.back() == '"') {
      item = detail::UnescapeArrayElement(item.substr(1, item.size() - 2));
    }
    items.push_back(std::move(item));
  }
  return Result::success(std::move(items));
}

}  // namespace iniedit

#endif  // INIEDIT_CONVERT_HPP_
