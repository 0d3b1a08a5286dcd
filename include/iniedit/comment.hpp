/**
 * @file comment.hpp
 * @brief Single-line Comment and the ordered CommentCollection.
 *
 * A Comment never contains a line terminator. Both types are plain values:
 * copying an element copies its comments, so no two elements ever share one.
 */

#ifndef INIEDIT_COMMENT_HPP_
#define INIEDIT_COMMENT_HPP_

#include "iniedit/string_util.hpp"
#include "iniedit/vocabulary.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace iniedit {

#ifndef INIEDIT_DEFAULT_COMMENT_PREFIX
#define INIEDIT_DEFAULT_COMMENT_PREFIX ';'
#endif

// ============================================================================
// Comment
// ============================================================================

class Comment final {
 public:
  static constexpr char kDefaultPrefix = INIEDIT_DEFAULT_COMMENT_PREFIX;

  static expected<Comment, IniError> Create(char prefix, std::string value) {
    if (prefix == '\r' || prefix == '\n' || prefix == '\0' ||
        ContainsLineTerminator(value)) {
      return expected<Comment, IniError>::error(IniError::kInvalidComment);
    }
    return expected<Comment, IniError>::success(
        Comment(prefix, std::move(value)));
  }

  static expected<Comment, IniError> Create(std::string value) {
    return Create(kDefaultPrefix, std::move(value));
  }

  char Prefix() const noexcept { return prefix_; }
  const std::string& Value() const noexcept { return value_; }

  /// @brief Replace the text. Rejected (value unchanged) on a line terminator.
  expected<void, IniError> SetValue(std::string value) {
    if (ContainsLineTerminator(value)) {
      return expected<void, IniError>::error(IniError::kInvalidComment);
    }
    value_ = std::move(value);
    return expected<void, IniError>::success();
  }

  expected<void, IniError> SetPrefix(char prefix) {
    if (prefix == '\r' || prefix == '\n' || prefix == '\0') {
      return expected<void, IniError>::error(IniError::kInvalidComment);
    }
    prefix_ = prefix;
    return expected<void, IniError>::success();
  }

  bool operator==(const Comment& other) const noexcept {
    return prefix_ == other.prefix_ && value_ == other.value_;
  }
  bool operator!=(const Comment& other) const noexcept {
    return !(*this == other);
  }

 private:
  Comment(char prefix, std::string value)
      : prefix_(prefix), value_(std::move(value)) {}

  char prefix_;
  std::string value_;
};

// ============================================================================
// CommentCollection
// ============================================================================

/**
 * @brief Ordered pre-comments of a section or property.
 *
 * Converts losslessly to and from a multi-line text blob, one comment per
 * line. SetMultiLineText() is all-or-nothing.
 */
class CommentCollection final {
 public:
  using const_iterator = std::vector<Comment>::const_iterator;
  using iterator = std::vector<Comment>::iterator;

  size_t size() const noexcept { return comments_.size(); }
  bool empty() const noexcept { return comments_.empty(); }

  iterator begin() noexcept { return comments_.begin(); }
  iterator end() noexcept { return comments_.end(); }
  const_iterator begin() const noexcept { return comments_.begin(); }
  const_iterator end() const noexcept { return comments_.end(); }

  const Comment& operator[](size_t index) const { return comments_[index]; }
  Comment& operator[](size_t index) { return comments_[index]; }

  void Add(Comment comment) { comments_.push_back(std::move(comment)); }

  /// @brief Build a comment from text and append it.
  expected<void, IniError> Add(char prefix, std::string value) {
    auto comment = Comment::Create(prefix, std::move(value));
    if (!comment) {
      return expected<void, IniError>::error(comment.get_error());
    }
    comments_.push_back(std::move(comment.value()));
    return expected<void, IniError>::success();
  }

  void AddRange(const CommentCollection& other) {
    comments_.insert(comments_.end(), other.comments_.begin(),
                     other.comments_.end());
  }

  bool RemoveAt(size_t index) {
    if (index >= comments_.size()) return false;
    comments_.erase(comments_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
  }

  void Clear() noexcept { comments_.clear(); }

  std::string ToMultiLineText() const {
    std::string text;
    for (size_t i = 0; i < comments_.size(); ++i) {
      if (i > 0) text.push_back('\n');
      text += comments_[i].Value();
    }
    return text;
  }

  /**
   * @brief Replace all comments with one comment per line of @p text.
   *
   * Lines split on "\r\n", "\r" or "\n". An empty text clears the
   * collection. On failure the collection is left untouched.
   */
  expected<void, IniError> SetMultiLineText(const std::string& text,
                                            char prefix = Comment::kDefaultPrefix) {
    if (text.empty()) {
      comments_.clear();
      return expected<void, IniError>::success();
    }

    std::vector<Comment> parsed;
    size_t start = 0;
    for (size_t i = 0; i <= text.size(); ++i) {
      if (i < text.size() && text[i] != '\r' && text[i] != '\n') continue;
      auto comment = Comment::Create(prefix, text.substr(start, i - start));
      if (!comment) {
        return expected<void, IniError>::error(comment.get_error());
      }
      parsed.push_back(std::move(comment.value()));
      if (i + 1 < text.size() && text[i] == '\r' && text[i + 1] == '\n') ++i;
      start = i + 1;
    }

    comments_ = std::move(parsed);
    return expected<void, IniError>::success();
  }

  bool operator==(const CommentCollection& other) const {
    return comments_ == other.comments_;
  }
  bool operator!=(const CommentCollection& other) const {
    return !(*this == other);
  }

 private:
  std::vector<Comment> comments_;
};

}  // namespace iniedit

#endif  // INIEDIT_COMMENT_HPP_
