/**
 * @file property.hpp
 * @brief Property: a named string value with quoting hint and comments.
 *
 * Typed access is a projection over the stored string; no parsed state
 * is cached.
 *
 * Usage:
 * @code
 *   auto prop = iniedit::Property::Create("port", "8080");
 *   int port = prop.value().GetValueOrDefault<int>(80);
 * @endcode
 */

#ifndef INIEDIT_PROPERTY_HPP_
#define INIEDIT_PROPERTY_HPP_

#include "iniedit/convert.hpp"
#include "iniedit/element.hpp"
#include "iniedit/vocabulary.hpp"

#include <string>
#include <utility>
#include <vector>

namespace iniedit {

class Property final : public ElementBase {
 public:
  static expected<Property, IniError> Create(std::string name,
                                             std::string value = std::string()) {
    auto valid = ValidateKeyName(name);
    if (!valid) {
      return expected<Property, IniError>::error(valid.get_error());
    }
    return expected<Property, IniError>::success(
        Property(std::move(name), std::move(value)));
  }

  // No assignment: a property held by a Section must keep its name.
  Property(const Property&) = default;
  Property(Property&&) = default;
  Property& operator=(const Property&) = delete;
  Property& operator=(Property&&) = delete;
  ~Property() = default;

  const std::string& Value() const noexcept { return value_; }
  void SetValue(std::string value) { value_ = std::move(value); }
  bool IsEmpty() const noexcept { return value_.empty(); }

  /// Serialization hint: write the value between double quotes.
  bool IsQuoted() const noexcept { return is_quoted_; }
  void SetQuoted(bool quoted) noexcept { is_quoted_ = quoted; }

  // --------------------------------------------------------------------------
  // Typed access
  // --------------------------------------------------------------------------

  template <typename T>
  expected<T, IniError> GetValue() const {
    T result{};
    if (!Convert<T>::Decode(value_, result)) {
      return expected<T, IniError>::error(IniError::kConversionFailed);
    }
    return expected<T, IniError>::success(std::move(result));
  }

  template <typename T>
  bool TryGetValue(T& out) const {
    T result{};
    if (!Convert<T>::Decode(value_, result)) return false;
    out = std::move(result);
    return true;
  }

  template <typename T>
  T GetValueOrDefault(const T& default_val = T{}) const {
    T result{};
    return Convert<T>::Decode(value_, result) ? result : default_val;
  }

  template <typename T>
  void SetValueAs(const T& value) {
    Convert<T>::Encode(value, value_);
  }

  /**
   * @brief Parse `{a, b, "c,d"}` into typed elements.
   * @param max_elements Element limit, 0 for unlimited.
   */
  template <typename T>
  expected<std::vector<T>, IniError> GetValueArray(
      size_t max_elements = INIEDIT_MAX_ARRAY_ELEMENTS) const {
    using Result = expected<std::vector<T>, IniError>;
    auto raw = DecodeArray(value_, max_elements);
    if (!raw) return Result::error(raw.get_error());

    std::vector<T> values;
    values.reserve(raw.value().size());
    for (const auto& item : raw.value()) {
      T converted{};
      if (!Convert<T>::Decode(item, converted)) {
        return Result::error(IniError::kConversionFailed);
      }
      values.push_back(std::move(converted));
    }
    return Result::success(std::move(values));
  }

  template <typename T>
  void SetValueArray(const std::vector<T>& values) {
    std::vector<std::string> encoded;
    encoded.reserve(values.size());
    for (const auto& v : values) {
      std::string item;
      Convert<T>::Encode(v, item);
      encoded.push_back(std::move(item));
    }
    value_ = EncodeArray(encoded);
  }

  /// @brief Deep copy, comments included.
  Property Clone() const { return Property(*this); }

 private:
  Property(std::string name, std::string value)
      : ElementBase(std::move(name)), value_(std::move(value)) {}

  std::string value_;
  bool is_quoted_ = false;
};

}  // namespace iniedit

#endif  // INIEDIT_PROPERTY_HPP_
