/**
 * @file parser.hpp
 * @brief Line-oriented INI parser with duplicate policies, resource limits
 *        and optional error collection.
 *
 * Grammar, one construct per line (leading/trailing whitespace ignored):
 *   ; comment            # comment
 *   [section]            [section] ; inline comment
 *   key = value          key = value ; inline comment
 *   key = "quoted \"value\""  ; inline comment
 *
 * Usage:
 * @code
 *   iniedit::LoadOptions opts;
 *   opts.collect_parsing_errors = true;
 *   auto doc = iniedit::LoadFile("app.ini", iniedit::TextEncoding::kUtf8, opts);
 *   if (!doc) {
 *     // doc.get_error().code / .message
 *   }
 * @endcode
 */

#ifndef INIEDIT_PARSER_HPP_
#define INIEDIT_PARSER_HPP_

#include "iniedit/comment.hpp"
#include "iniedit/document.hpp"
#include "iniedit/log.hpp"
#include "iniedit/section.hpp"
#include "iniedit/string_util.hpp"
#include "iniedit/text_encoding.hpp"
#include "iniedit/vocabulary.hpp"

#include <cstdint>
#include <deque>
#include <fstream>
#include <functional>
#include <future>
#include <istream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace iniedit {

/// Resolution of a section header whose name already exists.
enum class DuplicateSectionPolicy : uint8_t {
  kFirstWin = 0,  ///< Drop the later section and its properties.
  kLastWin,       ///< Drop the earlier section.
  kMerge,         ///< Fold the later section into the earlier one.
  kThrowError,    ///< Abort the load with kDuplicateSection.
};

/// Parser configuration. Every limit uses 0 for unlimited.
struct LoadOptions {
  std::string comment_prefix_chars = INIEDIT_DEFAULT_COMMENT_PREFIX_CHARS;
  char default_comment_prefix = Comment::kDefaultPrefix;
  DuplicateKeyPolicy duplicate_key_policy = DuplicateKeyPolicy::kFirstWin;
  DuplicateSectionPolicy duplicate_section_policy =
      DuplicateSectionPolicy::kFirstWin;
  bool collect_parsing_errors = false;

  uint32_t max_sections = 0;
  uint32_t max_properties_per_section = 0;
  uint32_t max_value_length = 0;
  uint32_t max_line_length = 0;
  uint32_t max_parsing_errors = 0;  ///< Only limits how many are recorded.
  uint32_t max_pending_comments = 0;

  /// Sections for which this returns false are removed after the load.
  std::function<bool(const std::string&)> section_filter;
  /// Invoked once for every malformed line, recorded or not.
  std::function<void(const ParsingError&)> on_error;
};

/// Reason a load produced no document.
struct LoadError {
  IniError code = IniError::kParseFailed;
  std::string message;
  std::vector<ParsingError> errors;  ///< Errors seen up to the failure.
};

using LoadResult = expected<Document, LoadError>;

namespace detail {

inline char UnescapeChar(char c) noexcept {
  switch (c) {
    case '0': return '\0';
    case 'a': return '\a';
    case 'b': return '\b';
    case 't': return '\t';
    case 'r': return '\r';
    case 'n': return '\n';
    default:  return c;
  }
}

/**
 * @brief State of one load. Feeds lines into a Document in place.
 *
 * ParseLine() and Finish() return false on a hard failure; TakeError()
 * then describes it.
 */
class ParserRun final {
 public:
  ParserRun(const LoadOptions& options, Document& doc)
      : opts_(options), doc_(doc), current_(doc.default_section_.get()) {}

  ParserRun(const ParserRun&) = delete;
  ParserRun& operator=(const ParserRun&) = delete;

  bool ParseLine(uint32_t line_number, const std::string& raw) {
    if (opts_.max_line_length > 0 && raw.size() > opts_.max_line_length) {
      return Report(line_number, raw,
                    "Line exceeds maximum length of " +
                        std::to_string(opts_.max_line_length) + " characters");
    }

    // Trailing whitespace belongs to a comment, so only the front is trimmed.
    std::string span = TrimStart(raw);
    if (span.empty()) return true;

    if (doc_.IsCommentPrefix(span[0])) {
      AddPending(span[0], span.substr(1));
      return true;
    }
    if (span[0] == '[') {
      return ParseSectionHeader(line_number, raw, span);
    }
    return ParseProperty(line_number, raw, span);
  }

  bool Finish() {
    if (!FlushMerge()) return false;

    if (!pending_.empty()) {
      INIEDIT_LOG_DEBUG("Parser", "dropping %zu trailing comment(s)",
                        pending_.size());
      pending_.clear();
    }

    if (opts_.section_filter) {
      std::vector<std::string> rejected;
      for (const auto& sec : doc_) {
        if (!opts_.section_filter(sec.Name())) rejected.push_back(sec.Name());
      }
      for (const auto& name : rejected) {
        (void)doc_.RemoveSection(name);
      }
    }

    doc_.parsing_errors_ = std::move(errors_);
    return true;
  }

  LoadError TakeError() { return std::move(error_); }

 private:
  enum class Sink : uint8_t {
    kSection = 0,  ///< current_ receives properties.
    kDiscard,      ///< Header was rejected or dropped; properties vanish.
  };

  // --------------------------------------------------------------------------
  // Error reporting
  // --------------------------------------------------------------------------

  /// @return true to keep parsing.
  bool Report(uint32_t line_number, const std::string& raw, std::string reason) {
    ParsingError err{line_number, raw, std::move(reason)};
    INIEDIT_LOG_DEBUG("Parser", "line %u: %s", line_number, err.reason.c_str());
    if (opts_.on_error) opts_.on_error(err);

    if (!opts_.collect_parsing_errors) {
      std::string message =
          "line " + std::to_string(line_number) + ": " + err.reason;
      errors_.push_back(std::move(err));
      return Fail(IniError::kParseFailed, std::move(message));
    }
    if (opts_.max_parsing_errors == 0 ||
        errors_.size() < opts_.max_parsing_errors) {
      errors_.push_back(std::move(err));
    }
    return true;
  }

  bool Fail(IniError code, std::string message) {
    INIEDIT_LOG_WARN("Parser", "load aborted: %s", message.c_str());
    error_.code = code;
    error_.message = std::move(message);
    error_.errors = errors_;
    return false;
  }

  // --------------------------------------------------------------------------
  // Comments
  // --------------------------------------------------------------------------

  void AddPending(char prefix, std::string text) {
    auto comment = Comment::Create(prefix, std::move(text));
    if (!comment) return;  // lines never hold a terminator
    pending_.push_back(std::move(comment.value()));
    if (opts_.max_pending_comments > 0 &&
        pending_.size() > opts_.max_pending_comments) {
      pending_.pop_front();
    }
  }

  void AttachPending(ElementBase& element) {
    for (auto& comment : pending_) {
      element.PreComments().Add(std::move(comment));
    }
    pending_.clear();
  }

  // --------------------------------------------------------------------------
  // Sections
  // --------------------------------------------------------------------------

  bool ParseSectionHeader(uint32_t line_number, const std::string& raw,
                          const std::string& span) {
    size_t close = span.find(']');
    if (close == std::string::npos) {
      return Report(line_number, raw,
                    "Missing closing bracket in section declaration");
    }
    std::string name = TrimCopy(span.substr(1, close - 1));
    if (name.empty()) {
      return Report(line_number, raw, "Section name cannot be empty");
    }
    // Unreachable: a trimmed, non-empty name cut at the first ']' already
    // meets every Section::Create rule.
    auto created = Section::Create(name);
    if (!created) {
      return Report(line_number, raw, "Invalid section name '" + name + "'");
    }
    if (!FlushMerge()) return false;

    Section section = std::move(created.value());
    AttachPending(section);
    std::string after = TrimStart(span.substr(close + 1));
    if (!after.empty() && doc_.IsCommentPrefix(after[0])) {
      (void)section.SetInlineComment(after[0], after.substr(1));
    }
    return CommitSection(line_number, raw, std::move(section));
  }

  bool CommitSection(uint32_t line_number, const std::string& raw,
                     Section section) {
    Section* existing = doc_.FindSection(section.Name());
    if (existing == nullptr) {
      if (opts_.max_sections > 0 && doc_.SectionCount() >= opts_.max_sections) {
        Discard();
        return Report(line_number, raw,
                      "Maximum section limit (" +
                          std::to_string(opts_.max_sections) + ") exceeded");
      }
      return Activate(doc_.AddSection(std::move(section)));
    }

    switch (opts_.duplicate_section_policy) {
      case DuplicateSectionPolicy::kFirstWin:
        INIEDIT_LOG_DEBUG("Parser", "line %u: duplicate section '%s' ignored",
                          line_number, section.Name().c_str());
        Discard();
        return true;

      case DuplicateSectionPolicy::kLastWin:
        (void)doc_.RemoveSectionAt(doc_.IndexOfSection(section.Name()));
        return Activate(doc_.AddSection(std::move(section)));

      case DuplicateSectionPolicy::kMerge:
        merge_target_ = existing;
        current_ = &merge_buffer_.emplace(std::move(section));
        sink_ = Sink::kSection;
        return true;

      case DuplicateSectionPolicy::kThrowError:
        break;
    }
    return Fail(IniError::kDuplicateSection,
                "Duplicate section name '" + section.Name() + "' found");
  }

  bool Activate(expected<Section*, IniError> added) {
    if (!added) {
      return Fail(added.get_error(), "failed to add section");
    }
    current_ = added.value();
    sink_ = Sink::kSection;
    return true;
  }

  void Discard() noexcept {
    current_ = nullptr;
    sink_ = Sink::kDiscard;
  }

  /// Fold a buffered duplicate section into its first occurrence.
  bool FlushMerge() {
    if (!merge_buffer_.has_value()) return true;
    std::string name = merge_target_->Name();
    auto merged =
        merge_target_->MergeFrom(merge_buffer_.value(), opts_.duplicate_key_policy);
    merge_buffer_.reset();
    merge_target_ = nullptr;
    if (!merged) {
      return Fail(IniError::kDuplicateKey,
                  "Duplicate property name found while merging section '" +
                      name + "'");
    }
    return true;
  }

  // --------------------------------------------------------------------------
  // Properties
  // --------------------------------------------------------------------------

  struct ParsedValue {
    std::string value;
    bool quoted = false;
    bool has_comment = false;
    char comment_prefix = '\0';
    std::string comment;
  };

  bool ParseProperty(uint32_t line_number, const std::string& raw,
                     const std::string& span) {
    size_t eq = span.find('=');
    if (eq == std::string::npos) {
      return Report(line_number, raw, "Missing equals sign in key-value pair");
    }
    std::string key = TrimCopy(span.substr(0, eq));
    if (key.empty()) {
      return Report(line_number, raw, "Key is empty");
    }

    std::string rest = TrimStart(span.substr(eq + 1));
    ParsedValue parsed;
    if (!rest.empty() && rest[0] == '"') {
      std::string reason;
      if (!ParseQuotedValue(rest, parsed, reason)) {
        return Report(line_number, raw, std::move(reason));
      }
    } else {
      ParseUnquotedValue(rest, parsed);
    }

    if (sink_ == Sink::kDiscard) {
      pending_.clear();
      return true;
    }

    if (opts_.max_value_length > 0 &&
        parsed.value.size() > opts_.max_value_length) {
      return Report(line_number, raw,
                    "Value length (" + std::to_string(parsed.value.size()) +
                        ") exceeds maximum (" +
                        std::to_string(opts_.max_value_length) + ")");
    }

    // Unreachable: the key is trimmed, non-empty, stops at the first '='
    // and cannot start with '[' or a comment prefix on a property line.
    auto created = Property::Create(key, std::move(parsed.value));
    if (!created) {
      return Report(line_number, raw, "Invalid key name '" + key + "'");
    }
    Property prop = std::move(created.value());
    prop.SetQuoted(parsed.quoted);
    if (parsed.has_comment) {
      (void)prop.SetInlineComment(parsed.comment_prefix,
                                  std::move(parsed.comment));
    }
    return CommitProperty(line_number, raw, std::move(prop));
  }

  /// @p rest starts with the opening quote.
  bool ParseQuotedValue(const std::string& rest, ParsedValue& out,
                        std::string& reason) const {
    out.quoted = true;
    bool escaped = false;
    bool terminated = false;
    size_t i = 1;
    for (; i < rest.size(); ++i) {
      char c = rest[i];
      if (escaped) {
        out.value.push_back(UnescapeChar(c));
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        terminated = true;
        ++i;
        break;
      } else {
        out.value.push_back(c);
      }
    }
    if (escaped) {
      reason = "Invalid escape sequence: incomplete escape marker";
      return false;
    }
    if (!terminated) {
      reason = "Unterminated quote: missing closing quotation mark";
      return false;
    }

    std::string remains = TrimStart(rest.substr(i));
    size_t sign = remains.find_first_of(doc_.CommentPrefixChars());
    if (sign == 0) {
      out.has_comment = true;
      out.comment_prefix = remains[0];
      out.comment = remains.substr(1);
      return true;
    }
    if (sign != std::string::npos) {
      reason = "Invalid content after closing quote";
      return false;
    }
    if (!remains.empty()) {
      reason = "Invalid quote format";
      return false;
    }
    return true;
  }

  void ParseUnquotedValue(const std::string& rest, ParsedValue& out) const {
    for (size_t i = 0; i < rest.size(); ++i) {
      char c = rest[i];
      if (c == '\\' && i + 1 < rest.size() && doc_.IsCommentPrefix(rest[i + 1])) {
        out.value.push_back(rest[++i]);
        continue;
      }
      if (doc_.IsCommentPrefix(c)) {
        out.has_comment = true;
        out.comment_prefix = c;
        out.comment = rest.substr(i + 1);
        break;
      }
      out.value.push_back(c);
    }
    out.value = TrimEnd(out.value);
  }

  bool CommitProperty(uint32_t line_number, const std::string& raw,
                      Property prop) {
    Section& target = *current_;
    size_t index = target.IndexOfProperty(prop.Name());
    if (index == NamedList<Property>::kNpos) {
      if (opts_.max_properties_per_section > 0 &&
          target.PropertyCount() >= opts_.max_properties_per_section) {
        pending_.clear();
        return Report(line_number, raw,
                      "Maximum properties per section (" +
                          std::to_string(opts_.max_properties_per_section) +
                          ") exceeded");
      }
      AttachPending(prop);
      (void)target.AddProperty(std::move(prop));
      return true;
    }

    switch (opts_.duplicate_key_policy) {
      case DuplicateKeyPolicy::kFirstWin:
        pending_.clear();
        return true;

      case DuplicateKeyPolicy::kLastWin:
        AttachPending(prop);
        (void)target.ReplacePropertyAt(index, std::move(prop));
        return true;

      case DuplicateKeyPolicy::kThrowError:
        break;
    }
    return Fail(IniError::kDuplicateKey,
                "Duplicate property name '" + prop.Name() +
                    "' found in section '" + target.Name() + "'");
  }

  const LoadOptions& opts_;
  Document& doc_;
  Section* current_;
  Sink sink_ = Sink::kSection;
  optional<Section> merge_buffer_;
  Section* merge_target_ = nullptr;
  std::deque<Comment> pending_;
  std::vector<ParsingError> errors_;
  LoadError error_;
};

}  // namespace detail

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Parse INI text that is already UTF-8.
 *
 * Fails with kInvalidPrefix when the prefix options are invalid, with
 * kParseFailed on the first malformed line unless error collection is on,
 * and with kDuplicateSection / kDuplicateKey under the kThrowError policies.
 */
inline LoadResult LoadString(const std::string& text,
                             const LoadOptions& options = LoadOptions()) {
  auto created = Document::Create(options.comment_prefix_chars,
                                  options.default_comment_prefix);
  if (!created) {
    return LoadResult::error(LoadError{created.get_error(),
                                       "invalid comment prefix configuration",
                                       {}});
  }
  Document doc = std::move(created).value();

  uint32_t line_number = 0;
  {
    detail::ParserRun run(options, doc);
    size_t start = 0;
    for (size_t i = 0; i <= text.size(); ++i) {
      if (i < text.size() && text[i] != '\r' && text[i] != '\n') continue;
      if (i == text.size() && start == text.size()) break;
      ++line_number;
      if (!run.ParseLine(line_number, text.substr(start, i - start))) {
        return LoadResult::error(run.TakeError());
      }
      if (i + 1 < text.size() && text[i] == '\r' && text[i + 1] == '\n') ++i;
      start = i + 1;
    }
    if (!run.Finish()) {
      return LoadResult::error(run.TakeError());
    }
  }

  INIEDIT_LOG_DEBUG("Parser", "parsed %u line(s): %zu section(s), %zu error(s)",
                    line_number, doc.SectionCount(), doc.ParsingErrors().size());
  return LoadResult::success(std::move(doc));
}

/// @brief Read every byte of @p in, decode with @p encoding and parse.
inline LoadResult Load(std::istream& in,
                       TextEncoding encoding = TextEncoding::kUtf8,
                       const LoadOptions& options = LoadOptions()) {
  std::string bytes((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
  if (in.bad()) {
    INIEDIT_LOG_ERROR("Parser", "stream read failed");
    return LoadResult::error(LoadError{IniError::kIoError, "read failed", {}});
  }
  return LoadString(DecodeText(bytes, encoding), options);
}

inline LoadResult LoadFile(const std::string& path,
                           TextEncoding encoding = TextEncoding::kUtf8,
                           const LoadOptions& options = LoadOptions()) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    INIEDIT_LOG_ERROR("Parser", "cannot open '%s'", path.c_str());
    return LoadResult::error(
        LoadError{IniError::kFileNotFound, "cannot open '" + path + "'", {}});
  }
  auto result = Load(in, encoding, options);
  if (result) {
    INIEDIT_LOG_INFO("Parser", "loaded '%s' (%zu section(s))", path.c_str(),
                     result.value().SectionCount());
  }
  return result;
}

/// @brief LoadFile() on a separate thread. @p path and @p options are copied.
inline std::future<LoadResult> LoadFileAsync(
    const std::string& path, TextEncoding encoding = TextEncoding::kUtf8,
    const LoadOptions& options = LoadOptions()) {
  return std::async(std::launch::async, [path, encoding, options]() {
    return LoadFile(path, encoding, options);
  });
}

}  // namespace iniedit

#endif  // INIEDIT_PARSER_HPP_
