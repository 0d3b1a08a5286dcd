/**
 * @file test_document.cpp
 * @brief Tests for document.hpp
 */

#include "iniedit/document.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<std::string> SectionNames(const iniedit::Document& doc) {
  std::vector<std::string> out;
  for (const auto& s : doc) out.push_back(s.Name());
  return out;
}

}  // namespace

TEST_CASE("Document default prefixes", "[document]") {
  iniedit::Document doc;
  REQUIRE(doc.CommentPrefixChars() == ";#");
  REQUIRE(doc.DefaultCommentPrefix() == ';');
  REQUIRE(doc.IsCommentPrefix('#'));
  REQUIRE(!doc.IsCommentPrefix('!'));
  REQUIRE(doc.DefaultSection().Name() == iniedit::Document::kDefaultSectionName);
}

TEST_CASE("Document prefix configuration is validated", "[document]") {
  auto custom = iniedit::Document::Create("!;", '!');
  REQUIRE(custom.has_value());
  REQUIRE(custom.value().IsCommentPrefix('!'));

  REQUIRE(iniedit::Document::Create("", ';').get_error() ==
          iniedit::IniError::kInvalidPrefix);
  REQUIRE(!iniedit::Document::Create(";", '#').has_value());
  REQUIRE(!iniedit::Document::Create("; ", ';').has_value());
  REQUIRE(!iniedit::Document::Create(";[", ';').has_value());

  iniedit::Document doc;
  REQUIRE(doc.SetDefaultCommentPrefix('#').has_value());
  REQUIRE(doc.DefaultCommentPrefix() == '#');
  REQUIRE(!doc.SetDefaultCommentPrefix('!').has_value());
  REQUIRE(doc.DefaultCommentPrefix() == '#');
}

TEST_CASE("Document section management", "[document]") {
  iniedit::Document doc;
  auto a = doc.GetOrCreateSection("Alpha");
  REQUIRE(a.has_value());
  REQUIRE(doc.GetOrCreateSection("ALPHA").value() == a.value());
  REQUIRE(doc.AddSection(iniedit::Section::Create("gamma").value()).has_value());
  REQUIRE(doc.InsertSection(1, iniedit::Section::Create("beta").value())
              .has_value());

  REQUIRE(SectionNames(doc) ==
          std::vector<std::string>{"Alpha", "beta", "gamma"});
  REQUIRE(doc.HasSection("BETA"));
  REQUIRE(doc.IndexOfSection("Gamma") == 2);
  REQUIRE(doc.SectionAt(0)->Name() == "Alpha");

  auto dup = doc.AddSection(iniedit::Section::Create("alpha").value());
  REQUIRE(dup.get_error() == iniedit::IniError::kDuplicateName);

  REQUIRE(doc.MoveSection(2, 0));
  REQUIRE(SectionNames(doc) ==
          std::vector<std::string>{"gamma", "Alpha", "beta"});
  doc.SortSectionsByName();
  REQUIRE(SectionNames(doc) ==
          std::vector<std::string>{"Alpha", "beta", "gamma"});

  REQUIRE(doc.RemoveSection("BETA"));
  REQUIRE(doc.RemoveSectionAt(0));
  REQUIRE(SectionNames(doc) == std::vector<std::string>{"gamma"});
  REQUIRE(!doc.RemoveSection("missing"));
}

TEST_CASE("Document lookup never creates", "[document]") {
  iniedit::Document doc;
  REQUIRE(doc.FindSection("x") == nullptr);
  REQUIRE(doc.GetValueOrDefault<int>("x", "y", 4) == 4);
  REQUIRE(doc.GetValue<int>("x", "y").get_error() ==
          iniedit::IniError::kNotFound);
  REQUIRE(doc.SectionCount() == 0);
}

TEST_CASE("Document typed access", "[document]") {
  iniedit::Document doc;
  (void)doc.GetOrCreateSection("db").value()->SetProperty("port", "5432");
  REQUIRE(doc.GetValue<int>("DB", "PORT").value() == 5432);
  unsigned short port = 0;
  REQUIRE(doc.TryGetValue("db", "port", port));
  REQUIRE(port == 5432);
}

TEST_CASE("Document Clear empties everything but prefixes", "[document]") {
  auto doc = iniedit::Document::Create("#", '#').value();
  (void)doc.DefaultSection().SetProperty("top", "1");
  (void)doc.GetOrCreateSection("s");
  doc.Clear();
  REQUIRE(doc.SectionCount() == 0);
  REQUIRE(doc.DefaultSection().Empty());
  REQUIRE(doc.CommentPrefixChars() == "#");
}

TEST_CASE("Document Clone is deep", "[document]") {
  auto doc = iniedit::Document::Create(";!", '!').value();
  (void)doc.DefaultSection().SetProperty("top", "1");
  (void)doc.GetOrCreateSection("s").value()->SetProperty("k", "v");

  iniedit::Document copy = doc.Clone();
  REQUIRE(copy.DefaultCommentPrefix() == '!');
  copy.FindSection("s")->FindProperty("k")->SetValue("changed");
  (void)copy.DefaultSection().SetProperty("top", "2");
  (void)copy.RemoveSection("s");

  REQUIRE(doc.FindSection("s")->FindProperty("k")->Value() == "v");
  REQUIRE(doc.DefaultSection().FindProperty("top")->Value() == "1");
}

TEST_CASE("Document Clear and Clone rebuild the default section", "[document]") {
  auto doc = iniedit::Document::Create("#", '#').value();
  iniedit::Section* before = &doc.DefaultSection();
  (void)before->SetProperty("top", "1");
  (void)doc.GetOrCreateSection("s");

  doc.Clear();
  REQUIRE(doc.DefaultSection().Name() == iniedit::Document::kDefaultSectionName);
  REQUIRE(doc.DefaultSection().FindProperty("top") == nullptr);
  REQUIRE(doc.DefaultSection().SetProperty("top", "2").has_value());
  REQUIRE(doc.DefaultSection().FindProperty("TOP") ==
          doc.DefaultSection().PropertyAt(0));

  iniedit::Document copy = doc.Clone();
  REQUIRE(&copy.DefaultSection() != &doc.DefaultSection());
  REQUIRE(copy.DefaultSection().Name() == iniedit::Document::kDefaultSectionName);
  REQUIRE(copy.DefaultSection().FindProperty("top")->Value() == "2");

  iniedit::Document moved;
  moved = std::move(copy);
  REQUIRE(moved.DefaultSection().FindProperty("top")->Value() == "2");
  REQUIRE(moved.CommentPrefixChars() == "#");
}
