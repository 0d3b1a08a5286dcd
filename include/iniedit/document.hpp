/**
 * @file document.hpp
 * @brief Document: the default section, ordered named sections and the
 *        comment-prefix configuration.
 *
 * The default section holds properties that appear before any section
 * header. It is not part of the named section list and is never written
 * with a header line.
 *
 * Usage:
 * @code
 *   iniedit::Document doc;
 *   auto sec = doc.GetOrCreateSection("network");
 *   sec.value()->SetProperty("port", "8080");
 *   int port = doc.GetValueOrDefault<int>("network", "port", 80);
 * @endcode
 */

#ifndef INIEDIT_DOCUMENT_HPP_
#define INIEDIT_DOCUMENT_HPP_

#include "iniedit/named_list.hpp"
#include "iniedit/section.hpp"
#include "iniedit/string_util.hpp"
#include "iniedit/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace iniedit {

#ifndef INIEDIT_DEFAULT_COMMENT_PREFIX_CHARS
#define INIEDIT_DEFAULT_COMMENT_PREFIX_CHARS ";#"
#endif

/// A malformed source line recorded by the parser.
struct ParsingError {
  uint32_t line_number = 0;  ///< 1-based, blank lines included.
  std::string line;          ///< Raw text, unmodified.
  std::string reason;
};

namespace detail {
class ParserRun;
}  // namespace detail

class Document final {
 public:
  static constexpr const char* kDefaultSectionName = "$DEFAULT";

  using iterator = NamedList<Section>::iterator;
  using const_iterator = NamedList<Section>::const_iterator;

  /// Document with the default prefixes `;#` and `;` for new comments.
  Document()
      : comment_prefix_chars_(INIEDIT_DEFAULT_COMMENT_PREFIX_CHARS),
        default_comment_prefix_(Comment::kDefaultPrefix),
        default_section_(MakeDefaultSection()) {}

  /**
   * @brief Create a document with custom comment prefixes.
   *
   * Fails with kInvalidPrefix when @p prefix_chars is empty, holds
   * whitespace, '[', '=', '"' or a line terminator, or does not contain
   * @p default_prefix.
   */
  static expected<Document, IniError> Create(const std::string& prefix_chars,
                                             char default_prefix) {
    Document doc;
    auto set = doc.SetCommentPrefixes(prefix_chars, default_prefix);
    if (!set) {
      return expected<Document, IniError>::error(set.get_error());
    }
    return expected<Document, IniError>::success(std::move(doc));
  }

  Document(Document&&) = default;
  Document& operator=(Document&&) = default;
  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;
  ~Document() = default;

  // --------------------------------------------------------------------------
  // Comment prefixes
  // --------------------------------------------------------------------------

  const std::string& CommentPrefixChars() const noexcept {
    return comment_prefix_chars_;
  }

  char DefaultCommentPrefix() const noexcept { return default_comment_prefix_; }

  bool IsCommentPrefix(char c) const noexcept {
    return comment_prefix_chars_.find(c) != std::string::npos;
  }

  expected<void, IniError> SetCommentPrefixes(const std::string& prefix_chars,
                                              char default_prefix) {
    if (prefix_chars.empty() ||
        prefix_chars.find(default_prefix) == std::string::npos) {
      return expected<void, IniError>::error(IniError::kInvalidPrefix);
    }
    for (char c : prefix_chars) {
      if (IsWhitespace(c) || c == '\0' || c == '[' || c == '=' || c == '"') {
        return expected<void, IniError>::error(IniError::kInvalidPrefix);
      }
    }
    comment_prefix_chars_ = prefix_chars;
    default_comment_prefix_ = default_prefix;
    return expected<void, IniError>::success();
  }

  expected<void, IniError> SetDefaultCommentPrefix(char prefix) {
    if (!IsCommentPrefix(prefix)) {
      return expected<void, IniError>::error(IniError::kInvalidPrefix);
    }
    default_comment_prefix_ = prefix;
    return expected<void, IniError>::success();
  }

  // --------------------------------------------------------------------------
  // Sections
  // --------------------------------------------------------------------------

  Section& DefaultSection() noexcept { return *default_section_; }
  const Section& DefaultSection() const noexcept { return *default_section_; }

  iterator begin() { return sections_.begin(); }
  iterator end() { return sections_.end(); }
  const_iterator begin() const { return sections_.begin(); }
  const_iterator end() const { return sections_.end(); }

  size_t SectionCount() const noexcept { return sections_.size(); }

  Section* FindSection(const std::string& name) noexcept {
    return sections_.Find(name);
  }
  const Section* FindSection(const std::string& name) const noexcept {
    return sections_.Find(name);
  }

  Section* SectionAt(size_t index) noexcept { return sections_.At(index); }
  const Section* SectionAt(size_t index) const noexcept {
    return sections_.At(index);
  }

  bool HasSection(const std::string& name) const noexcept {
    return sections_.Contains(name);
  }

  size_t IndexOfSection(const std::string& name) const noexcept {
    return sections_.IndexOf(name);
  }

  /// @brief Return the section named @p name, appending an empty one on a miss.
  expected<Section*, IniError> GetOrCreateSection(const std::string& name) {
    Section* existing = sections_.Find(name);
    if (existing != nullptr) {
      return expected<Section*, IniError>::success(existing);
    }
    auto created = Section::Create(name);
    if (!created) {
      return expected<Section*, IniError>::error(created.get_error());
    }
    return AddSection(std::move(created.value()));
  }

  expected<Section*, IniError> AddSection(Section section) {
    return sections_.Append(std::make_unique<Section>(std::move(section)));
  }

  expected<Section*, IniError> InsertSection(size_t index, Section section) {
    return sections_.Insert(index,
                            std::make_unique<Section>(std::move(section)));
  }

  bool RemoveSection(const std::string& name) { return sections_.Erase(name); }
  bool RemoveSectionAt(size_t index) { return sections_.EraseAt(index); }

  bool MoveSection(size_t from, size_t to) { return sections_.Move(from, to); }

  void SortSectionsByName() { sections_.SortByName(); }

  /// @brief Drop every section, empty the default section and forget
  ///        recorded parsing errors. Prefix settings are kept.
  void Clear() {
    sections_.Clear();
    default_section_ = MakeDefaultSection();
    parsing_errors_.clear();
  }

  // --------------------------------------------------------------------------
  // Typed access by section and key
  // --------------------------------------------------------------------------

  template <typename T>
  expected<T, IniError> GetValue(const std::string& section,
                                 const std::string& key) const {
    const Section* sec = FindSection(section);
    if (sec == nullptr) {
      return expected<T, IniError>::error(IniError::kNotFound);
    }
    return sec->GetPropertyValue<T>(key);
  }

  template <typename T>
  bool TryGetValue(const std::string& section, const std::string& key,
                   T& out) const {
    const Section* sec = FindSection(section);
    return (sec != nullptr) && sec->TryGetPropertyValue(key, out);
  }

  template <typename T>
  T GetValueOrDefault(const std::string& section, const std::string& key,
                      const T& default_val = T{}) const {
    const Section* sec = FindSection(section);
    return (sec != nullptr) ? sec->GetPropertyValueOrDefault(key, default_val)
                            : default_val;
  }

  // --------------------------------------------------------------------------
  // Parsing errors (filled only by a load with error collection enabled)
  // --------------------------------------------------------------------------

  const std::vector<ParsingError>& ParsingErrors() const noexcept {
    return parsing_errors_;
  }

  void ClearParsingErrors() noexcept { parsing_errors_.clear(); }

  /// @brief Deep copy of sections, properties, comments and prefix settings.
  Document Clone() const {
    Document copy;
    copy.comment_prefix_chars_ = comment_prefix_chars_;
    copy.default_comment_prefix_ = default_comment_prefix_;
    copy.default_section_ = std::make_unique<Section>(default_section_->Clone());
    for (const auto& sec : sections_) {
      (void)copy.AddSection(sec.Clone());
    }
    copy.parsing_errors_ = parsing_errors_;
    return copy;
  }

 private:
  friend class detail::ParserRun;

  static std::unique_ptr<Section> MakeDefaultSection() {
    auto sec = Section::Create(kDefaultSectionName);
    INIEDIT_ASSERT(sec.has_value());
    return std::make_unique<Section>(std::move(sec).value());
  }

  std::string comment_prefix_chars_;
  char default_comment_prefix_;
  std::unique_ptr<Section> default_section_;  ///< Never null outside a move.
  NamedList<Section> sections_;
  std::vector<ParsingError> parsing_errors_;
};

}  // namespace iniedit

#endif  // INIEDIT_DOCUMENT_HPP_
