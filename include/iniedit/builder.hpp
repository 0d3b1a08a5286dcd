/**
 * @file builder.hpp
 * @brief Fluent construction of a Document.
 *
 * Chained calls never fail on the spot. The first rejected name, duplicate
 * or comment is latched and reported by Build(); later calls are ignored.
 *
 * Usage:
 * @code
 *   auto doc = iniedit::DocumentBuilder()
 *                  .WithDefaultProperty("version", "2.0")
 *                  .WithSection("database", [](iniedit::SectionBuilder& db) {
 *                    db.WithPreComment(" primary")
 *                        .WithProperty("host", "localhost")
 *                        .WithProperty("port", 5432)
 *                        .WithQuotedProperty("dsn", "host=db;port=5432");
 *                  })
 *                  .Build();
 * @endcode
 */

#ifndef INIEDIT_BUILDER_HPP_
#define INIEDIT_BUILDER_HPP_

#include "iniedit/document.hpp"
#include "iniedit/log.hpp"
#include "iniedit/property.hpp"
#include "iniedit/section.hpp"
#include "iniedit/vocabulary.hpp"

#include <string>
#include <type_traits>
#include <utility>

namespace iniedit {

namespace detail {

template <typename T>
using EnableIfArithmetic =
    typename std::enable_if<std::is_arithmetic<T>::value>::type;

/// @return false once @p error holds a failure.
template <typename V>
bool Latch(optional<IniError>& error, const expected<V, IniError>& result) {
  if (!result && !error.has_value()) error.emplace(result.get_error());
  return !error.has_value();
}

/// Build a property from @p key, or latch why it cannot be built.
inline bool MakeProperty(optional<IniError>& error, std::string key,
                         std::string value, optional<Property>& out) {
  auto created = Property::Create(std::move(key), std::move(value));
  if (!Latch(error, created)) return false;
  out.emplace(std::move(created).value());
  return true;
}

}  // namespace detail

// ============================================================================
// SectionBuilder
// ============================================================================

/// Fills one section. Only handed out by DocumentBuilder::WithSection().
class SectionBuilder final {
 public:
  SectionBuilder(const SectionBuilder&) = delete;
  SectionBuilder& operator=(const SectionBuilder&) = delete;

  SectionBuilder& WithProperty(std::string key, std::string value) {
    optional<Property> prop;
    if (detail::MakeProperty(error_, std::move(key), std::move(value), prop)) {
      Add(std::move(prop.value()));
    }
    return *this;
  }

  /// Encodes @p value with Convert<T>.
  template <typename T, typename = detail::EnableIfArithmetic<T>>
  SectionBuilder& WithProperty(std::string key, const T& value) {
    optional<Property> prop;
    if (detail::MakeProperty(error_, std::move(key), std::string(), prop)) {
      prop->SetValueAs(value);
      Add(std::move(prop.value()));
    }
    return *this;
  }

  /// Adds a copy of @p property, comments included.
  SectionBuilder& WithProperty(const Property& property) {
    Add(property.Clone());
    return *this;
  }

  SectionBuilder& WithQuotedProperty(std::string key, std::string value) {
    optional<Property> prop;
    if (detail::MakeProperty(error_, std::move(key), std::move(value), prop)) {
      prop->SetQuoted(true);
      Add(std::move(prop.value()));
    }
    return *this;
  }

  /// Inline comment with the document's default prefix.
  SectionBuilder& WithComment(std::string text) {
    if (!error_.has_value()) {
      (void)detail::Latch(error_,
                          section_.SetInlineComment(prefix_, std::move(text)));
    }
    return *this;
  }

  SectionBuilder& WithPreComment(std::string text) {
    if (!error_.has_value()) {
      (void)detail::Latch(error_,
                          section_.PreComments().Add(prefix_, std::move(text)));
    }
    return *this;
  }

 private:
  friend class DocumentBuilder;

  SectionBuilder(Section& section, char prefix, optional<IniError>& error)
      : section_(section), prefix_(prefix), error_(error) {}

  void Add(Property property) {
    if (!error_.has_value()) {
      (void)detail::Latch(error_, section_.AddProperty(std::move(property)));
    }
  }

  Section& section_;
  char prefix_;
  optional<IniError>& error_;
};

// ============================================================================
// DocumentBuilder
// ============================================================================

class DocumentBuilder final {
 public:
  /// Builds with the default comment prefixes.
  DocumentBuilder() = default;

  /// Continues building on @p doc.
  explicit DocumentBuilder(Document doc) : doc_(std::move(doc)) {}

  /// Fails with kInvalidPrefix like Document::Create().
  static expected<DocumentBuilder, IniError> Create(
      const std::string& comment_prefix_chars, char default_comment_prefix) {
    auto doc = Document::Create(comment_prefix_chars, default_comment_prefix);
    if (!doc) {
      return expected<DocumentBuilder, IniError>::error(doc.get_error());
    }
    return expected<DocumentBuilder, IniError>::success(
        DocumentBuilder(std::move(doc).value()));
  }

  DocumentBuilder(DocumentBuilder&&) = default;
  DocumentBuilder& operator=(DocumentBuilder&&) = default;
  DocumentBuilder(const DocumentBuilder&) = delete;
  DocumentBuilder& operator=(const DocumentBuilder&) = delete;

  /**
   * @brief Append a section named @p name filled by @p configure.
   *
   * The section joins the document after @p configure returns, so a
   * duplicate name is reported even when @p configure adds nothing.
   */
  DocumentBuilder& WithSection(const std::string& name,
                               function_ref<void(SectionBuilder&)> configure) {
    if (error_.has_value()) return *this;
    auto created = Section::Create(name);
    if (!detail::Latch(error_, created)) return *this;

    Section section = std::move(created).value();
    SectionBuilder builder(section, doc_.DefaultCommentPrefix(), error_);
    configure(builder);
    if (!error_.has_value()) {
      (void)detail::Latch(error_, doc_.AddSection(std::move(section)));
    }
    return *this;
  }

  DocumentBuilder& WithDefaultProperty(std::string key, std::string value) {
    DefaultSectionBuilder().WithProperty(std::move(key), std::move(value));
    return *this;
  }

  template <typename T, typename = detail::EnableIfArithmetic<T>>
  DocumentBuilder& WithDefaultProperty(std::string key, const T& value) {
    DefaultSectionBuilder().WithProperty(std::move(key), value);
    return *this;
  }

  DocumentBuilder& WithDefaultProperty(const Property& property) {
    DefaultSectionBuilder().WithProperty(property);
    return *this;
  }

  /// First failure so far, if any.
  const optional<IniError>& Error() const noexcept { return error_; }

  /**
   * @brief Hand over the document, or the first failure.
   *
   * The builder is left holding an empty document with the same prefixes.
   */
  expected<Document, IniError> Build() {
    if (error_.has_value()) {
      INIEDIT_LOG_WARN("Builder", "build failed: %s",
                       IniErrorToString(error_.value()));
      return expected<Document, IniError>::error(error_.value());
    }
    Document out = std::move(doc_);
    auto fresh = Document::Create(out.CommentPrefixChars(),
                                  out.DefaultCommentPrefix());
    doc_ = fresh ? std::move(fresh).value() : Document();
    return expected<Document, IniError>::success(std::move(out));
  }

 private:
  SectionBuilder DefaultSectionBuilder() {
    return SectionBuilder(doc_.DefaultSection(), doc_.DefaultCommentPrefix(),
                          error_);
  }

  Document doc_;
  optional<IniError> error_;
};

/// @brief Builder seeded with a deep copy of @p document, prefixes included.
inline DocumentBuilder ToBuilder(const Document& document) {
  return DocumentBuilder(document.Clone());
}

}  // namespace iniedit

#endif  // INIEDIT_BUILDER_HPP_
