/**
 * @file test_comment.cpp
 * @brief Tests for comment.hpp and the comment handling of element.hpp.
 */

#include "iniedit/comment.hpp"
#include "iniedit/property.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

// ============================================================================
// Comment
// ============================================================================

TEST_CASE("Comment defaults to the semicolon prefix", "[comment]") {
  auto c = iniedit::Comment::Create("note");
  REQUIRE(c.has_value());
  REQUIRE(c.value().Prefix() == ';');
  REQUIRE(c.value().Value() == "note");
}

TEST_CASE("Comment rejects line terminators", "[comment]") {
  auto bad = iniedit::Comment::Create('#', "two\nlines");
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == iniedit::IniError::kInvalidComment);

  REQUIRE(!iniedit::Comment::Create('\n', "x").has_value());

  auto c = iniedit::Comment::Create('#', "ok").value();
  REQUIRE(!c.SetValue("a\rb").has_value());
  REQUIRE(c.Value() == "ok");
  REQUIRE(c.SetValue("fine").has_value());
  REQUIRE(c.Value() == "fine");
}

// ============================================================================
// CommentCollection
// ============================================================================

TEST_CASE("CommentCollection multi-line round trip", "[comment][collection]") {
  iniedit::CommentCollection cc;
  REQUIRE(cc.SetMultiLineText("first\r\nsecond\rthird\nfourth", '#')
              .has_value());
  REQUIRE(cc.size() == 4);
  REQUIRE(cc[0].Prefix() == '#');
  REQUIRE(cc[2].Value() == "third");
  REQUIRE(cc.ToMultiLineText() == "first\nsecond\nthird\nfourth");
}

TEST_CASE("CommentCollection keeps empty lines", "[comment][collection]") {
  iniedit::CommentCollection cc;
  REQUIRE(cc.SetMultiLineText("a\n\nb").has_value());
  REQUIRE(cc.size() == 3);
  REQUIRE(cc[1].Value().empty());
}

TEST_CASE("CommentCollection empty text clears", "[comment][collection]") {
  iniedit::CommentCollection cc;
  REQUIRE(cc.Add(';', "x").has_value());
  REQUIRE(cc.SetMultiLineText("").has_value());
  REQUIRE(cc.empty());
}

TEST_CASE("CommentCollection add, remove and equality",
          "[comment][collection]") {
  iniedit::CommentCollection a;
  iniedit::CommentCollection b;
  REQUIRE(a.Add(';', "one").has_value());
  REQUIRE(!a.Add(';', "bad\n").has_value());
  REQUIRE(a.size() == 1);

  b.AddRange(a);
  REQUIRE(a == b);
  REQUIRE(b.RemoveAt(0));
  REQUIRE(!b.RemoveAt(0));
  REQUIRE(a != b);
}

// ============================================================================
// Element comments
// ============================================================================

TEST_CASE("Inline comment set, append and clear", "[comment][element]") {
  auto prop = iniedit::Property::Create("key", "value").value();
  REQUIRE(!prop.HasInlineComment());

  REQUIRE(prop.SetInlineComment('#', "first").has_value());
  prop.AppendInlineComment(iniedit::Comment::Create(';', " second").value());
  REQUIRE(prop.InlineComment()->Prefix() == '#');
  REQUIRE(prop.InlineComment()->Value() == "first second");

  REQUIRE(!prop.SetInlineComment(';', "x\ny").has_value());
  REQUIRE(prop.InlineComment()->Value() == "first second");

  prop.ClearInlineComment();
  REQUIRE(!prop.HasInlineComment());
}

TEST_CASE("Copied elements do not share comments", "[comment][element]") {
  auto original = iniedit::Property::Create("key", "v").value();
  REQUIRE(original.PreComments().Add(';', "pre").has_value());
  REQUIRE(original.SetInlineComment(';', "inline").has_value());

  iniedit::Property copy = original.Clone();
  REQUIRE(copy.PreComments()[0].SetValue("changed").has_value());
  REQUIRE(copy.SetInlineComment(';', "other").has_value());

  REQUIRE(original.PreComments()[0].Value() == "pre");
  REQUIRE(original.InlineComment()->Value() == "inline");
}
