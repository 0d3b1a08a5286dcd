/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, function_ref and IniError.
 *
 * Errors are returned by value rather than thrown. Fallible operations
 * return expected<V, IniError> (or a richer error type where the caller
 * needs more than a code, see LoadError in parser.hpp).
 */

#ifndef INIEDIT_VOCABULARY_HPP_
#define INIEDIT_VOCABULARY_HPP_

#include "iniedit/platform.hpp"

#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace iniedit {

// ============================================================================
// IniError
// ============================================================================

enum class IniError : uint8_t {
  kInvalidName = 0,
  kInvalidComment,
  kDuplicateName,
  kIndexOutOfRange,
  kNotFound,
  kConversionFailed,
  kInvalidPrefix,
  kInvalidArrayFormat,
  kParseFailed,
  kDuplicateSection,
  kDuplicateKey,
  kFileNotFound,
  kIoError,
  kInvalidPattern,
  kInvalidArgument,
};

inline const char* IniErrorToString(IniError err) noexcept {
  switch (err) {
    case IniError::kInvalidName:        return "InvalidName";
    case IniError::kInvalidComment:     return "InvalidComment";
    case IniError::kDuplicateName:      return "DuplicateName";
    case IniError::kIndexOutOfRange:    return "IndexOutOfRange";
    case IniError::kNotFound:           return "NotFound";
    case IniError::kConversionFailed:   return "ConversionFailed";
    case IniError::kInvalidPrefix:      return "InvalidPrefix";
    case IniError::kInvalidArrayFormat: return "InvalidArrayFormat";
    case IniError::kParseFailed:        return "ParseFailed";
    case IniError::kDuplicateSection:   return "DuplicateSection";
    case IniError::kDuplicateKey:       return "DuplicateKey";
    case IniError::kFileNotFound:       return "FileNotFound";
    case IniError::kIoError:            return "IoError";
    case IniError::kInvalidPattern:     return "InvalidPattern";
    case IniError::kInvalidArgument:    return "InvalidArgument";
  }
  return "Unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through success() / error(). Accessing the wrong
 * alternative is a programming error caught by INIEDIT_ASSERT.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) { return expected(ValueTag{}, val); }
  static expected success(V&& val) {
    return expected(ValueTag{}, std::move(val));
  }
  static expected error(const E& err) { return expected(ErrorTag{}, err); }
  static expected error(E&& err) { return expected(ErrorTag{}, std::move(err)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_)) V(other.ValueRef());
    } else {
      ::new (static_cast<void*>(&storage_)) E(other.ErrorRef());
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_)) V(std::move(other.ValueRef()));
    } else {
      ::new (static_cast<void*>(&storage_)) E(std::move(other.ErrorRef()));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      expected tmp(other);
      Destroy();
      MoveFrom(std::move(tmp));
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      MoveFrom(std::move(other));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    INIEDIT_ASSERT(has_value_);
    return ValueRef();
  }
  const V& value() const& {
    INIEDIT_ASSERT(has_value_);
    return ValueRef();
  }
  V&& value() && {
    INIEDIT_ASSERT(has_value_);
    return std::move(ValueRef());
  }

  E& get_error() & {
    INIEDIT_ASSERT(!has_value_);
    return ErrorRef();
  }
  const E& get_error() const& {
    INIEDIT_ASSERT(!has_value_);
    return ErrorRef();
  }

  V value_or(const V& default_val) const& {
    return has_value_ ? ValueRef() : default_val;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename U>
  expected(ValueTag, U&& val) : has_value_(true) {
    ::new (static_cast<void*>(&storage_)) V(std::forward<U>(val));
  }

  template <typename U>
  expected(ErrorTag, U&& err) : has_value_(false) {
    ::new (static_cast<void*>(&storage_)) E(std::forward<U>(err));
  }

  V& ValueRef() noexcept { return *reinterpret_cast<V*>(&storage_); }
  const V& ValueRef() const noexcept {
    return *reinterpret_cast<const V*>(&storage_);
  }
  E& ErrorRef() noexcept { return *reinterpret_cast<E*>(&storage_); }
  const E& ErrorRef() const noexcept {
    return *reinterpret_cast<const E*>(&storage_);
  }

  void MoveFrom(expected&& other) {
    has_value_ = other.has_value_;
    if (has_value_) {
      ::new (static_cast<void*>(&storage_)) V(std::move(other.ValueRef()));
    } else {
      ::new (static_cast<void*>(&storage_)) E(std::move(other.ErrorRef()));
    }
  }

  void Destroy() noexcept {
    if (has_value_) {
      ValueRef().~V();
    } else {
      ErrorRef().~E();
    }
  }

  static constexpr size_t kSize = sizeof(V) > sizeof(E) ? sizeof(V) : sizeof(E);
  static constexpr size_t kAlign =
      alignof(V) > alignof(E) ? alignof(V) : alignof(E);

  alignas(kAlign) unsigned char storage_[kSize];
  bool has_value_;
};

/**
 * @brief expected specialization for operations that return nothing.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) { return expected(false, std::move(err)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const {
    INIEDIT_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E err) : err_(std::move(err)), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (static_cast<void*>(&storage_)) T(val);
  }

  optional(T&& val) : has_value_(true) {  // NOLINT(runtime/explicit)
    ::new (static_cast<void*>(&storage_)) T(std::move(val));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_)) T(*other.Ptr());
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_)) T(std::move(*other.Ptr()));
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_)) T(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&storage_)) T(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() {
    INIEDIT_ASSERT(has_value_);
    return *Ptr();
  }
  const T& value() const {
    INIEDIT_ASSERT(has_value_);
    return *Ptr();
  }

  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

  T value_or(const T& default_val) const {
    return has_value_ ? *Ptr() : default_val;
  }

  template <typename... Args>
  T& emplace(Args&&... args) {
    reset();
    ::new (static_cast<void*>(&storage_)) T(std::forward<Args>(args)...);
    has_value_ = true;
    return *Ptr();
  }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  T* Ptr() noexcept { return reinterpret_cast<T*>(&storage_); }
  const T* Ptr() const noexcept { return reinterpret_cast<const T*>(&storage_); }

  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_;
};

// ============================================================================
// function_ref
// ============================================================================

template <typename Signature>
class function_ref;

/**
 * @brief Non-owning reference to a callable.
 *
 * The referenced callable must outlive the function_ref. Intended for
 * predicate parameters that are invoked before the call returns.
 */
template <typename Ret, typename... Args>
class function_ref<Ret(Args...)> final {
 public:
  template <typename F,
            typename = typename std::enable_if<!std::is_same<
                typename std::decay<F>::type, function_ref>::value>::type>
  function_ref(F&& fn) noexcept  // NOLINT(runtime/explicit)
      : obj_(const_cast<void*>(
            static_cast<const void*>(std::addressof(fn)))),
        callback_([](void* obj, Args... args) -> Ret {
          return (*static_cast<typename std::add_pointer<F>::type>(obj))(
              std::forward<Args>(args)...);
        }) {}

  Ret operator()(Args... args) const {
    return callback_(obj_, std::forward<Args>(args)...);
  }

 private:
  void* obj_;
  Ret (*callback_)(void*, Args...);
};

}  // namespace iniedit

#endif  // INIEDIT_VOCABULARY_HPP_
