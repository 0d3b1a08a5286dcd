/**
 * @file section.hpp
 * @brief Section: an ordered, case-insensitively keyed set of properties.
 *
 * Lookup never creates. GetOrCreateProperty() is the only accessor that
 * inserts on a miss.
 */

#ifndef INIEDIT_SECTION_HPP_
#define INIEDIT_SECTION_HPP_

#include "iniedit/element.hpp"
#include "iniedit/named_list.hpp"
#include "iniedit/property.hpp"
#include "iniedit/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace iniedit {

/// Resolution of a key that already exists in the target section.
enum class DuplicateKeyPolicy : uint8_t {
  kFirstWin = 0,  ///< Keep the existing property.
  kLastWin,       ///< Overwrite the existing property in place.
  kThrowError,    ///< Reject the whole operation.
};

class Section final : public ElementBase {
 public:
  using iterator = NamedList<Property>::iterator;
  using const_iterator = NamedList<Property>::const_iterator;

  static expected<Section, IniError> Create(std::string name) {
    auto valid = ValidateSectionName(name);
    if (!valid) {
      return expected<Section, IniError>::error(valid.get_error());
    }
    return expected<Section, IniError>::success(Section(std::move(name)));
  }

  // No assignment: a section held by a Document must keep its name.
  Section(Section&&) = default;
  Section& operator=(Section&&) = delete;
  Section(const Section&) = delete;
  Section& operator=(const Section&) = delete;
  ~Section() = default;

  iterator begin() { return properties_.begin(); }
  iterator end() { return properties_.end(); }
  const_iterator begin() const { return properties_.begin(); }
  const_iterator end() const { return properties_.end(); }

  size_t PropertyCount() const noexcept { return properties_.size(); }
  bool Empty() const noexcept { return properties_.empty(); }

  // --------------------------------------------------------------------------
  // Lookup
  // --------------------------------------------------------------------------

  Property* FindProperty(const std::string& key) noexcept {
    return properties_.Find(key);
  }
  const Property* FindProperty(const std::string& key) const noexcept {
    return properties_.Find(key);
  }

  Property* PropertyAt(size_t index) noexcept { return properties_.At(index); }
  const Property* PropertyAt(size_t index) const noexcept {
    return properties_.At(index);
  }

  bool HasProperty(const std::string& key) const noexcept {
    return properties_.Contains(key);
  }

  /// @return Position of @p key, or NamedList<Property>::kNpos.
  size_t IndexOfProperty(const std::string& key) const noexcept {
    return properties_.IndexOf(key);
  }

  // --------------------------------------------------------------------------
  // Mutation
  // --------------------------------------------------------------------------

  /// @brief Return the property named @p key, appending an empty one on a miss.
  expected<Property*, IniError> GetOrCreateProperty(const std::string& key) {
    Property* existing = properties_.Find(key);
    if (existing != nullptr) {
      return expected<Property*, IniError>::success(existing);
    }
    auto created = Property::Create(key);
    if (!created) {
      return expected<Property*, IniError>::error(created.get_error());
    }
    return AddProperty(std::move(created.value()));
  }

  expected<Property*, IniError> AddProperty(Property property) {
    return properties_.Append(std::make_unique<Property>(std::move(property)));
  }

  expected<Property*, IniError> AddProperty(std::string key, std::string value) {
    auto created = Property::Create(std::move(key), std::move(value));
    if (!created) {
      return expected<Property*, IniError>::error(created.get_error());
    }
    return AddProperty(std::move(created.value()));
  }

  expected<Property*, IniError> InsertProperty(size_t index, Property property) {
    return properties_.Insert(index,
                              std::make_unique<Property>(std::move(property)));
  }

  /// @brief Insert @p property directly before the property named @p target.
  expected<Property*, IniError> InsertPropertyBefore(const std::string& target,
                                                     Property property) {
    size_t index = properties_.IndexOf(target);
    if (index == NamedList<Property>::kNpos) {
      return expected<Property*, IniError>::error(IniError::kNotFound);
    }
    return InsertProperty(index, std::move(property));
  }

  /// @brief Update the value of @p key, appending the property on a miss.
  expected<Property*, IniError> SetProperty(const std::string& key,
                                            std::string value) {
    auto prop = GetOrCreateProperty(key);
    if (prop) {
      prop.value()->SetValue(std::move(value));
    }
    return prop;
  }

  /// @brief Swap the property at @p index for @p property, keeping its slot.
  expected<Property*, IniError> ReplacePropertyAt(size_t index,
                                                  Property property) {
    return properties_.Replace(index,
                               std::make_unique<Property>(std::move(property)));
  }

  bool RemoveProperty(const std::string& key) { return properties_.Erase(key); }
  bool RemovePropertyAt(size_t index) { return properties_.EraseAt(index); }

  bool MoveProperty(size_t from, size_t to) { return properties_.Move(from, to); }

  void SortPropertiesByName() { properties_.SortByName(); }

  /// @brief Remove every property. Comments on the section are kept.
  void Clear() noexcept { properties_.Clear(); }

  /**
   * @brief Fold the properties of @p other into this section.
   *
   * @p other is copied first and is never modified. With kThrowError any
   * key collision fails with kDuplicateName and leaves this section intact.
   */
  expected<void, IniError> MergeFrom(const Section& other,
                                     DuplicateKeyPolicy policy =
                                         DuplicateKeyPolicy::kFirstWin) {
    Section source = other.Clone();
    switch (policy) {
      case DuplicateKeyPolicy::kFirstWin:
        for (const auto& prop : source) {
          if (HasProperty(prop.Name())) continue;
          (void)AddProperty(prop);
        }
        break;

      case DuplicateKeyPolicy::kLastWin:
        CopyCommentsFrom(source);
        for (const auto& prop : source) {
          size_t index = properties_.IndexOf(prop.Name());
          if (index != NamedList<Property>::kNpos) {
            (void)ReplacePropertyAt(index, prop);
          } else {
            (void)AddProperty(prop);
          }
        }
        break;

      case DuplicateKeyPolicy::kThrowError:
        for (const auto& prop : source) {
          if (HasProperty(prop.Name())) {
            return expected<void, IniError>::error(IniError::kDuplicateName);
          }
        }
        PreComments().AddRange(source.PreComments());
        if (source.HasInlineComment()) {
          AppendInlineComment(source.InlineComment().value());
        }
        for (const auto& prop : source) {
          (void)AddProperty(prop);
        }
        break;
    }
    return expected<void, IniError>::success();
  }

  // --------------------------------------------------------------------------
  // Typed access by key
  // --------------------------------------------------------------------------

  template <typename T>
  expected<T, IniError> GetPropertyValue(const std::string& key) const {
    const Property* prop = FindProperty(key);
    if (prop == nullptr) {
      return expected<T, IniError>::error(IniError::kNotFound);
    }
    return prop->GetValue<T>();
  }

  template <typename T>
  bool TryGetPropertyValue(const std::string& key, T& out) const {
    const Property* prop = FindProperty(key);
    return (prop != nullptr) && prop->TryGetValue(out);
  }

  template <typename T>
  T GetPropertyValueOrDefault(const std::string& key,
                              const T& default_val = T{}) const {
    const Property* prop = FindProperty(key);
    return (prop != nullptr) ? prop->GetValueOrDefault(default_val)
                             : default_val;
  }

  /// @brief Deep copy: properties and every comment are duplicated.
  Section Clone() const {
    Section copy(Name());
    copy.CopyCommentsFrom(*this);
    for (const auto& prop : properties_) {
      (void)copy.AddProperty(prop.Clone());
    }
    return copy;
  }

 private:
  explicit Section(std::string name) : ElementBase(std::move(name)) {}

  NamedList<Property> properties_;
};

}  // namespace iniedit

#endif  // INIEDIT_SECTION_HPP_
