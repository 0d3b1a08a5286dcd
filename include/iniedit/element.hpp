/**
 * @file element.hpp
 * @brief ElementBase: the name and comment metadata shared by Section and
 *        Property.
 */

#ifndef INIEDIT_ELEMENT_HPP_
#define INIEDIT_ELEMENT_HPP_

#include "iniedit/comment.hpp"
#include "iniedit/string_util.hpp"
#include "iniedit/vocabulary.hpp"

#include <string>
#include <utility>

namespace iniedit {

class ElementBase {
 public:
  /**
   * @brief Check that @p name is usable as a section or key name.
   *
   * A name must be non-empty, must not start or end with whitespace and
   * must not contain a line terminator.
   */
  static expected<void, IniError> ValidateName(const std::string& name) {
    if (name.empty() || IsBlank(name) || IsWhitespace(name.front()) ||
        IsWhitespace(name.back()) || ContainsLineTerminator(name)) {
      return expected<void, IniError>::error(IniError::kInvalidName);
    }
    return expected<void, IniError>::success();
  }

  /// @brief ValidateName() plus the key grammar: no '=', no leading '['.
  static expected<void, IniError> ValidateKeyName(const std::string& name) {
    auto valid = ValidateName(name);
    if (!valid) return valid;
    if (name.front() == '[' || name.find('=') != std::string::npos) {
      return expected<void, IniError>::error(IniError::kInvalidName);
    }
    return expected<void, IniError>::success();
  }

  /// @brief ValidateName() plus the header grammar: no ']'.
  static expected<void, IniError> ValidateSectionName(const std::string& name) {
    auto valid = ValidateName(name);
    if (!valid) return valid;
    if (name.find(']') != std::string::npos) {
      return expected<void, IniError>::error(IniError::kInvalidName);
    }
    return expected<void, IniError>::success();
  }

  const std::string& Name() const noexcept { return name_; }

  CommentCollection& PreComments() noexcept { return pre_comments_; }
  const CommentCollection& PreComments() const noexcept {
    return pre_comments_;
  }

  bool HasInlineComment() const noexcept { return inline_comment_.has_value(); }
  const optional<Comment>& InlineComment() const noexcept {
    return inline_comment_;
  }

  void SetInlineComment(Comment comment) {
    inline_comment_.emplace(std::move(comment));
  }

  expected<void, IniError> SetInlineComment(char prefix, std::string text) {
    auto comment = Comment::Create(prefix, std::move(text));
    if (!comment) {
      return expected<void, IniError>::error(comment.get_error());
    }
    inline_comment_.emplace(std::move(comment.value()));
    return expected<void, IniError>::success();
  }

  void ClearInlineComment() noexcept { inline_comment_.reset(); }

  /// @brief Append @p comment's text to the inline comment, keeping its prefix.
  void AppendInlineComment(const Comment& comment) {
    if (!inline_comment_.has_value()) {
      inline_comment_.emplace(comment);
      return;
    }
    // Neither operand holds a line terminator, so the result is valid too.
    auto merged = Comment::Create(inline_comment_->Prefix(),
                                  inline_comment_->Value() + comment.Value());
    if (merged) {
      inline_comment_.emplace(std::move(merged.value()));
    }
  }

 protected:
  explicit ElementBase(std::string name) : name_(std::move(name)) {}
  ElementBase(const ElementBase&) = default;
  ElementBase(ElementBase&&) = default;
  ElementBase& operator=(const ElementBase&) = delete;
  ElementBase& operator=(ElementBase&&) = delete;
  ~ElementBase() = default;

  /// @brief Copy pre-comments and the inline comment from @p other.
  void CopyCommentsFrom(const ElementBase& other) {
    pre_comments_ = other.pre_comments_;
    inline_comment_ = other.inline_comment_;
  }

 private:
  std::string name_;
  CommentCollection pre_comments_;
  optional<Comment> inline_comment_;
};

}  // namespace iniedit

#endif  // INIEDIT_ELEMENT_HPP_
