/**
 * @file diff.hpp
 * @brief Structural comparison of two documents and selective merge of the
 *        resulting diff.
 *
 * Names are matched case-insensitively, values compared exactly. Sections
 * and properties in the diff are deep copies, so a diff stays valid after
 * either source document changes.
 *
 * Usage:
 * @code
 *   iniedit::DocumentDiff diff = iniedit::Compare(base, theirs);
 *   iniedit::MergeOptions opts;
 *   opts.apply_removed_properties = true;
 *   iniedit::MergeResult res = iniedit::Merge(base, diff, opts);
 * @endcode
 */

#ifndef INIEDIT_DIFF_HPP_
#define INIEDIT_DIFF_HPP_

#include "iniedit/document.hpp"
#include "iniedit/log.hpp"
#include "iniedit/property.hpp"
#include "iniedit/section.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace iniedit {

// ============================================================================
// Diff model
// ============================================================================

struct PropertyDiff {
  std::string property_name;
  std::string old_value;
  std::string new_value;
};

/// Property-level changes of a section present on both sides.
struct SectionDiff {
  std::string section_name;
  bool is_default_section = false;  ///< Addresses Document::DefaultSection().
  std::vector<Property> added_properties;
  std::vector<Property> removed_properties;
  std::vector<PropertyDiff> modified_properties;

  bool HasChanges() const noexcept {
    return !added_properties.empty() || !removed_properties.empty() ||
           !modified_properties.empty();
  }
};

struct DocumentDiff {
  std::vector<Section> added_sections;
  std::vector<Section> removed_sections;
  std::vector<SectionDiff> modified_sections;

  bool HasChanges() const noexcept {
    return !added_sections.empty() || !removed_sections.empty() ||
           !modified_sections.empty();
  }
};

namespace detail {

/// Compare two sections that share a name. Result carries no section name.
inline SectionDiff CompareSections(const Section& left, const Section& right) {
  SectionDiff diff;
  for (const auto& prop : right) {
    const Property* old_prop = left.FindProperty(prop.Name());
    if (old_prop == nullptr) {
      diff.added_properties.push_back(prop.Clone());
    } else if (old_prop->Value() != prop.Value()) {
      diff.modified_properties.push_back(
          PropertyDiff{prop.Name(), old_prop->Value(), prop.Value()});
    }
  }
  for (const auto& prop : left) {
    if (!right.HasProperty(prop.Name())) {
      diff.removed_properties.push_back(prop.Clone());
    }
  }
  return diff;
}

}  // namespace detail

/**
 * @brief Describe how @p right differs from @p left.
 *
 * The default section is compared first and, when changed, reported as
 * the first modified section with is_default_section set. Added and
 * modified sections follow @p right's order, removed sections @p left's.
 */
inline DocumentDiff Compare(const Document& left, const Document& right) {
  DocumentDiff diff;

  SectionDiff defaults =
      detail::CompareSections(left.DefaultSection(), right.DefaultSection());
  if (defaults.HasChanges()) {
    defaults.section_name = Document::kDefaultSectionName;
    defaults.is_default_section = true;
    diff.modified_sections.push_back(std::move(defaults));
  }

  for (const auto& sec : right) {
    const Section* old_sec = left.FindSection(sec.Name());
    if (old_sec == nullptr) {
      diff.added_sections.push_back(sec.Clone());
      continue;
    }
    SectionDiff sd = detail::CompareSections(*old_sec, sec);
    if (sd.HasChanges()) {
      sd.section_name = sec.Name();
      diff.modified_sections.push_back(std::move(sd));
    }
  }

  for (const auto& sec : left) {
    if (!right.HasSection(sec.Name())) {
      diff.removed_sections.push_back(sec.Clone());
    }
  }

  INIEDIT_LOG_DEBUG("Diff", "compare: +%zu -%zu ~%zu section(s)",
                    diff.added_sections.size(), diff.removed_sections.size(),
                    diff.modified_sections.size());
  return diff;
}

// ============================================================================
// Merge
// ============================================================================

/// Each switch gates one diff category.
struct MergeOptions {
  bool apply_added_sections = true;
  bool apply_removed_sections = false;
  bool apply_added_properties = true;
  bool apply_removed_properties = false;
  bool apply_modified_properties = true;
};

/// Counts of changes actually applied.
struct MergeResult {
  uint32_t sections_added = 0;
  uint32_t sections_removed = 0;
  uint32_t properties_added = 0;
  uint32_t properties_removed = 0;
  uint32_t properties_modified = 0;

  uint32_t TotalChanges() const noexcept {
    return sections_added + sections_removed + properties_added +
           properties_removed + properties_modified;
  }
};

namespace detail {

inline Section* ResolveTarget(Document& target, const SectionDiff& sd,
                              bool create) {
  if (sd.is_default_section) return &target.DefaultSection();
  Section* sec = target.FindSection(sd.section_name);
  if (sec != nullptr || !create) return sec;
  auto created = target.GetOrCreateSection(sd.section_name);
  return created ? created.value() : nullptr;
}

}  // namespace detail

/**
 * @brief Apply the categories of @p diff selected by @p options to @p target.
 *
 * Accepts partial diffs. Entries that no longer apply (an added section
 * already present, a removed property already gone, a modified property
 * missing from the target) are skipped and not counted.
 */
inline MergeResult Merge(Document& target, const DocumentDiff& diff,
                         const MergeOptions& options = MergeOptions()) {
  MergeResult result;

  if (options.apply_added_sections) {
    for (const auto& sec : diff.added_sections) {
      if (target.HasSection(sec.Name())) continue;
      if (target.AddSection(sec.Clone())) ++result.sections_added;
    }
  }

  if (options.apply_removed_sections) {
    for (const auto& sec : diff.removed_sections) {
      if (target.RemoveSection(sec.Name())) ++result.sections_removed;
    }
  }

  for (const auto& sd : diff.modified_sections) {
    if (options.apply_added_properties && !sd.added_properties.empty()) {
      Section* sec = detail::ResolveTarget(target, sd, true);
      if (sec != nullptr) {
        for (const auto& prop : sd.added_properties) {
          if (sec->HasProperty(prop.Name())) continue;
          if (sec->AddProperty(prop.Clone())) ++result.properties_added;
        }
      }
    }

    if (options.apply_removed_properties) {
      Section* sec = detail::ResolveTarget(target, sd, false);
      if (sec != nullptr) {
        for (const auto& prop : sd.removed_properties) {
          if (sec->RemoveProperty(prop.Name())) ++result.properties_removed;
        }
      }
    }

    if (options.apply_modified_properties) {
      Section* sec = detail::ResolveTarget(target, sd, false);
      if (sec != nullptr) {
        for (const auto& change : sd.modified_properties) {
          Property* prop = sec->FindProperty(change.property_name);
          if (prop == nullptr) continue;
          prop->SetValue(change.new_value);
          ++result.properties_modified;
        }
      }
    }
  }

  INIEDIT_LOG_DEBUG("Diff", "merge applied %u change(s)", result.TotalChanges());
  return result;
}

}  // namespace iniedit

#endif  // INIEDIT_DIFF_HPP_
