/**
 * @file test_diff.cpp
 * @brief Tests for diff.hpp: Compare and Merge.
 */

#include "iniedit/diff.hpp"
#include "iniedit/parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

iniedit::Document Parse(const char* text) {
  return iniedit::LoadString(text).value();
}

std::set<std::string> Folded(const std::vector<iniedit::Section>& sections) {
  std::set<std::string> out;
  for (const auto& s : sections) out.insert(iniedit::ToLowerCopy(s.Name()));
  return out;
}

/// Sections and properties equal by name (case-insensitive) and value.
bool SameContent(const iniedit::Section& a, const iniedit::Section& b) {
  if (a.PropertyCount() != b.PropertyCount()) return false;
  for (const auto& p : a) {
    const auto* other = b.FindProperty(p.Name());
    if (other == nullptr || other->Value() != p.Value()) return false;
  }
  return true;
}

bool SameContent(const iniedit::Document& a, const iniedit::Document& b) {
  if (!SameContent(a.DefaultSection(), b.DefaultSection())) return false;
  if (a.SectionCount() != b.SectionCount()) return false;
  for (const auto& s : a) {
    const auto* other = b.FindSection(s.Name());
    if (other == nullptr || !SameContent(s, *other)) return false;
  }
  return true;
}

const char* kLeft =
    "shared = 1\n"
    "old_top = x\n"
    "[keep]\n"
    "same = 1\n"
    "changed = before\n"
    "gone = 1\n"
    "[removed]\n"
    "a = 1\n";

const char* kRight =
    "shared = 2\n"
    "[KEEP]\n"
    "same = 1\n"
    "CHANGED = after\n"
    "fresh = new\n"
    "[added]\n"
    "b = 2\n";

}  // namespace

// ============================================================================
// Compare
// ============================================================================

TEST_CASE("Compare identical documents", "[diff]") {
  auto a = Parse(kLeft);
  auto b = Parse(kLeft);
  iniedit::DocumentDiff diff = iniedit::Compare(a, b);
  REQUIRE(!diff.HasChanges());
  REQUIRE(diff.modified_sections.empty());
}

TEST_CASE("Compare reports sections and properties", "[diff]") {
  auto left = Parse(kLeft);
  auto right = Parse(kRight);
  iniedit::DocumentDiff diff = iniedit::Compare(left, right);
  REQUIRE(diff.HasChanges());

  REQUIRE(diff.added_sections.size() == 1);
  REQUIRE(diff.added_sections[0].Name() == "added");
  REQUIRE(diff.added_sections[0].FindProperty("b")->Value() == "2");
  REQUIRE(diff.removed_sections.size() == 1);
  REQUIRE(diff.removed_sections[0].Name() == "removed");

  REQUIRE(diff.modified_sections.size() == 2);
  const auto& defaults = diff.modified_sections[0];
  REQUIRE(defaults.is_default_section);
  REQUIRE(defaults.section_name == iniedit::Document::kDefaultSectionName);
  REQUIRE(defaults.modified_properties.size() == 1);
  REQUIRE(defaults.modified_properties[0].old_value == "1");
  REQUIRE(defaults.modified_properties[0].new_value == "2");
  REQUIRE(defaults.removed_properties.size() == 1);

  const auto& keep = diff.modified_sections[1];
  REQUIRE(!keep.is_default_section);
  REQUIRE(iniedit::EqualsIgnoreCase(keep.section_name, "keep"));
  REQUIRE(keep.added_properties.size() == 1);
  REQUIRE(keep.added_properties[0].Name() == "fresh");
  REQUIRE(keep.removed_properties.size() == 1);
  REQUIRE(keep.removed_properties[0].Name() == "gone");
  REQUIRE(keep.modified_properties.size() == 1);
  REQUIRE(keep.modified_properties[0].property_name == "CHANGED");
  REQUIRE(keep.modified_properties[0].old_value == "before");
  REQUIRE(keep.modified_properties[0].new_value == "after");
}

TEST_CASE("Compare evidence survives source changes", "[diff]") {
  auto left = Parse(kLeft);
  auto right = Parse(kRight);
  iniedit::DocumentDiff diff = iniedit::Compare(left, right);
  right.FindSection("added")->FindProperty("b")->SetValue("mutated");
  REQUIRE(diff.added_sections[0].FindProperty("b")->Value() == "2");
}

TEST_CASE("Compare is symmetric", "[diff]") {
  auto a = Parse(kLeft);
  auto b = Parse(kRight);
  iniedit::DocumentDiff ab = iniedit::Compare(a, b);
  iniedit::DocumentDiff ba = iniedit::Compare(b, a);
  REQUIRE(Folded(ab.added_sections) == Folded(ba.removed_sections));
  REQUIRE(Folded(ab.removed_sections) == Folded(ba.added_sections));
  REQUIRE(ab.modified_sections.size() == ba.modified_sections.size());
  const auto& keep_ab = ab.modified_sections[1];
  const auto& keep_ba = ba.modified_sections[1];
  REQUIRE(keep_ab.added_properties.size() == keep_ba.removed_properties.size());
  REQUIRE(keep_ab.added_properties[0].Name() ==
          keep_ba.removed_properties[0].Name());
}

// ============================================================================
// Merge
// ============================================================================

TEST_CASE("Merge default options", "[diff][merge]") {
  auto target = Parse(kLeft);
  auto right = Parse(kRight);
  iniedit::DocumentDiff diff = iniedit::Compare(target, right);

  iniedit::MergeResult res = iniedit::Merge(target, diff);
  REQUIRE(res.sections_added == 1);
  REQUIRE(res.sections_removed == 0);
  REQUIRE(res.properties_added == 1);
  REQUIRE(res.properties_removed == 0);
  REQUIRE(res.properties_modified == 2);
  REQUIRE(res.TotalChanges() == 4);

  REQUIRE(target.HasSection("removed"));
  REQUIRE(target.FindSection("keep")->HasProperty("gone"));
  REQUIRE(target.FindSection("keep")->FindProperty("changed")->Value() ==
          "after");
  REQUIRE(target.DefaultSection().FindProperty("shared")->Value() == "2");
}

TEST_CASE("Merge with every switch reproduces the right side", "[diff][merge]") {
  auto target = Parse(kLeft);
  auto right = Parse(kRight);
  iniedit::DocumentDiff diff = iniedit::Compare(target, right);

  iniedit::MergeOptions all;
  all.apply_removed_sections = true;
  all.apply_removed_properties = true;
  iniedit::MergeResult res = iniedit::Merge(target, diff, all);

  REQUIRE(SameContent(target, right));
  REQUIRE(res.TotalChanges() == res.sections_added + res.sections_removed +
                                    res.properties_added +
                                    res.properties_removed +
                                    res.properties_modified);
  REQUIRE(res.TotalChanges() == 7);
  REQUIRE(!iniedit::Compare(target, right).HasChanges());
}

TEST_CASE("Merge accepts a partial diff", "[diff][merge]") {
  auto target = Parse("[s]\nk = 1\n");

  iniedit::DocumentDiff diff;
  iniedit::SectionDiff sd;
  sd.section_name = "S";
  sd.modified_properties.push_back({"K", "1", "2"});
  diff.modified_sections.push_back(std::move(sd));

  iniedit::MergeResult res = iniedit::Merge(target, diff);
  REQUIRE(res.TotalChanges() == 1);
  REQUIRE(target.FindSection("s")->FindProperty("k")->Value() == "2");
}

TEST_CASE("Merge skips entries that no longer apply", "[diff][merge]") {
  auto target = Parse("[exists]\nk = 1\n");

  iniedit::DocumentDiff diff;
  diff.added_sections.push_back(iniedit::Section::Create("EXISTS").value());
  diff.removed_sections.push_back(iniedit::Section::Create("missing").value());

  iniedit::SectionDiff sd;
  sd.section_name = "exists";
  sd.added_properties.push_back(iniedit::Property::Create("k", "9").value());
  sd.removed_properties.push_back(iniedit::Property::Create("nope").value());
  sd.modified_properties.push_back({"absent", "a", "b"});
  diff.modified_sections.push_back(std::move(sd));

  iniedit::MergeOptions all;
  all.apply_removed_sections = true;
  all.apply_removed_properties = true;
  iniedit::MergeResult res = iniedit::Merge(target, diff, all);
  REQUIRE(res.TotalChanges() == 0);
  REQUIRE(target.FindSection("exists")->FindProperty("k")->Value() == "1");
  REQUIRE(!target.FindSection("exists")->HasProperty("absent"));
}

TEST_CASE("Merge creates the section for added properties", "[diff][merge]") {
  iniedit::Document target;
  iniedit::DocumentDiff diff;
  iniedit::SectionDiff sd;
  sd.section_name = "new";
  sd.added_properties.push_back(iniedit::Property::Create("k", "v").value());
  diff.modified_sections.push_back(std::move(sd));

  iniedit::MergeResult res = iniedit::Merge(target, diff);
  REQUIRE(res.properties_added == 1);
  REQUIRE(target.FindSection("new")->FindProperty("k")->Value() == "v");
}
