/**
 * @file named_list.hpp
 * @brief Insertion-ordered container keyed by case-insensitive element name.
 *
 * NamedList<T> owns its elements and keeps the ordered sequence and the
 * name index in one object, so every mutation updates both together.
 * Element addresses are stable across insert, erase, sort and move.
 *
 * T must expose `const std::string& Name() const`.
 */

#ifndef INIEDIT_NAMED_LIST_HPP_
#define INIEDIT_NAMED_LIST_HPP_

#include "iniedit/platform.hpp"
#include "iniedit/string_util.hpp"
#include "iniedit/vocabulary.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace iniedit {

template <typename T>
class NamedList final {
  using Slot = std::unique_ptr<T>;
  using Storage = std::vector<Slot>;

 public:
  static constexpr size_t kNpos = static_cast<size_t>(-1);

  // --------------------------------------------------------------------------
  // Iteration (dereferences to T&, not to the owning pointer)
  // --------------------------------------------------------------------------

  template <typename Elem, typename BaseIt>
  class IteratorBase {
   public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = Elem*;
    using reference = Elem&;

    IteratorBase() = default;
    explicit IteratorBase(BaseIt it) : it_(it) {}

    reference operator*() const { return **it_; }
    pointer operator->() const { return it_->get(); }
    IteratorBase& operator++() {
      ++it_;
      return *this;
    }
    IteratorBase operator++(int) {
      IteratorBase tmp(*this);
      ++it_;
      return tmp;
    }
    IteratorBase& operator--() {
      --it_;
      return *this;
    }
    bool operator==(const IteratorBase& other) const { return it_ == other.it_; }
    bool operator!=(const IteratorBase& other) const { return it_ != other.it_; }

   private:
    BaseIt it_{};
  };

  using iterator = IteratorBase<T, typename Storage::iterator>;
  using const_iterator = IteratorBase<const T, typename Storage::const_iterator>;

  NamedList() = default;
  NamedList(NamedList&&) = default;
  NamedList& operator=(NamedList&&) = default;
  NamedList(const NamedList&) = delete;
  NamedList& operator=(const NamedList&) = delete;

  iterator begin() { return iterator(items_.begin()); }
  iterator end() { return iterator(items_.end()); }
  const_iterator begin() const { return const_iterator(items_.begin()); }
  const_iterator end() const { return const_iterator(items_.end()); }

  size_t size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }

  // --------------------------------------------------------------------------
  // Lookup
  // --------------------------------------------------------------------------

  T* Find(const std::string& name) noexcept {
    auto it = index_.find(name);
    return (it != index_.end()) ? it->second : nullptr;
  }

  const T* Find(const std::string& name) const noexcept {
    auto it = index_.find(name);
    return (it != index_.end()) ? it->second : nullptr;
  }

  bool Contains(const std::string& name) const noexcept {
    return index_.find(name) != index_.end();
  }

  T* At(size_t index) noexcept {
    return (index < items_.size()) ? items_[index].get() : nullptr;
  }

  const T* At(size_t index) const noexcept {
    return (index < items_.size()) ? items_[index].get() : nullptr;
  }

  size_t IndexOf(const std::string& name) const noexcept {
    const T* target = Find(name);
    if (target == nullptr) return kNpos;
    for (size_t i = 0; i < items_.size(); ++i) {
      if (items_[i].get() == target) return i;
    }
    return kNpos;
  }

  // --------------------------------------------------------------------------
  // Mutation
  // --------------------------------------------------------------------------

  expected<T*, IniError> Append(Slot item) {
    return Insert(items_.size(), std::move(item));
  }

  expected<T*, IniError> Insert(size_t index, Slot item) {
    INIEDIT_ASSERT(item != nullptr);
    if (index > items_.size()) {
      return expected<T*, IniError>::error(IniError::kIndexOutOfRange);
    }
    if (Contains(item->Name())) {
      return expected<T*, IniError>::error(IniError::kDuplicateName);
    }
    T* raw = item.get();
    index_.emplace(raw->Name(), raw);
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index),
                  std::move(item));
    return expected<T*, IniError>::success(raw);
  }

  /**
   * @brief Replace the element at @p index with @p item in place.
   *
   * @p item must not collide with any element other than the one replaced.
   */
  expected<T*, IniError> Replace(size_t index, Slot item) {
    INIEDIT_ASSERT(item != nullptr);
    if (index >= items_.size()) {
      return expected<T*, IniError>::error(IniError::kIndexOutOfRange);
    }
    const T* existing = Find(item->Name());
    if (existing != nullptr && existing != items_[index].get()) {
      return expected<T*, IniError>::error(IniError::kDuplicateName);
    }
    index_.erase(items_[index]->Name());
    T* raw = item.get();
    index_.emplace(raw->Name(), raw);
    items_[index] = std::move(item);
    return expected<T*, IniError>::success(raw);
  }

  bool Erase(const std::string& name) {
    size_t idx = IndexOf(name);
    return (idx != kNpos) && EraseAt(idx);
  }

  bool EraseAt(size_t index) {
    if (index >= items_.size()) return false;
    index_.erase(items_[index]->Name());
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
  }

  void Clear() noexcept {
    index_.clear();
    items_.clear();
  }

  /// @brief Relocate the element at @p from so that it ends at @p to.
  bool Move(size_t from, size_t to) {
    if (from >= items_.size() || to >= items_.size()) return false;
    if (from == to) return true;
    Slot item = std::move(items_[from]);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(from));
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(to),
                  std::move(item));
    return true;
  }

  /// @brief Stable sort by name using ASCII case-insensitive ordering.
  void SortByName() {
    std::stable_sort(items_.begin(), items_.end(),
                     [](const Slot& a, const Slot& b) {
                       return CompareIgnoreCase(a->Name(), b->Name()) < 0;
                     });
  }

 private:
  Storage items_;
  std::unordered_map<std::string, T*, CaseInsensitiveHash, CaseInsensitiveEqual>
      index_;
};

}  // namespace iniedit

#endif  // INIEDIT_NAMED_LIST_HPP_
