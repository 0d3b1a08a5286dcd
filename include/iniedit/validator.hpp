/**
 * @file validator.hpp
 * @brief User-input checks for names, values and comments before they are
 *        applied to a document.
 *
 * Each check returns a ValidationResult with a message suitable for display.
 */

#ifndef INIEDIT_VALIDATOR_HPP_
#define INIEDIT_VALIDATOR_HPP_

#include "iniedit/document.hpp"
#include "iniedit/string_util.hpp"

#include <string>
#include <utility>

namespace iniedit {

struct ValidationResult {
  bool valid = true;
  std::string message;  ///< Empty when valid.

  static ValidationResult Ok() { return ValidationResult{}; }
  static ValidationResult Error(std::string msg) {
    return ValidationResult{false, std::move(msg)};
  }

  explicit operator bool() const noexcept { return valid; }
};

class Validator final {
 public:
  explicit Validator(std::string comment_prefix_chars =
                         INIEDIT_DEFAULT_COMMENT_PREFIX_CHARS)
      : prefix_chars_(std::move(comment_prefix_chars)) {}

  /// Uses the comment prefixes configured on @p doc.
  explicit Validator(const Document& doc)
      : prefix_chars_(doc.CommentPrefixChars()) {}

  ValidationResult ValidateSectionName(const std::string& value) const {
    if (value.empty()) return ValidationResult::Error("Section name cannot be empty");
    if (ContainsLineTerminator(value)) {
      return ValidationResult::Error(
          "Section name cannot contain newline characters");
    }
    if (value.find_first_of("[]") != std::string::npos) {
      return ValidationResult::Error("Section name cannot contain brackets");
    }
    return ValidationResult::Ok();
  }

  ValidationResult ValidateKey(const std::string& value) const {
    if (value.empty()) return ValidationResult::Error("Key cannot be empty");
    if (ContainsLineTerminator(value)) {
      return ValidationResult::Error("Key cannot contain newline characters");
    }
    if (value.find('=') != std::string::npos) {
      return ValidationResult::Error("Key cannot contain equals sign");
    }
    // such a line would read back as a comment or a section header
    if (prefix_chars_.find(value[0]) != std::string::npos || value[0] == '[') {
      return ValidationResult::Error(
          "Key cannot start with a comment prefix or bracket");
    }
    return ValidationResult::Ok();
  }

  ValidationResult ValidateValue(const std::string& value, bool quoted) const {
    if (!quoted && ContainsLineTerminator(value)) {
      return ValidationResult::Error(
          "Unquoted value cannot contain newline characters");
    }
    return ValidationResult::Ok();
  }

  ValidationResult ValidatePreComment(const std::string& value) const {
    if (value.empty()) return ValidationResult::Error("Pre-comment cannot be empty");
    if (ContainsLineTerminator(value)) {
      return ValidationResult::Error(
          "Pre-comment cannot contain newline characters");
    }
    return ValidationResult::Ok();
  }

  /// Multi-line form as edited in a text box; split later per line.
  ValidationResult ValidatePreCommentAsMultiLine(const std::string& value) const {
    if (value.empty()) return ValidationResult::Error("Pre-comment cannot be empty");
    return ValidationResult::Ok();
  }

  ValidationResult ValidateInlineComment(const std::string& value) const {
    if (value.empty()) {
      return ValidationResult::Error("Inline comment cannot be empty");
    }
    if (ContainsLineTerminator(value)) {
      return ValidationResult::Error(
          "Inline comment cannot contain newline characters");
    }
    return ValidationResult::Ok();
  }

 private:
  std::string prefix_chars_;
};

}  // namespace iniedit

#endif  // INIEDIT_VALIDATOR_HPP_
