/**
 * @file test_parser.cpp
 * @brief Tests for parser.hpp
 */

#include "iniedit/parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

iniedit::LoadOptions Collecting() {
  iniedit::LoadOptions opts;
  opts.collect_parsing_errors = true;
  return opts;
}

std::vector<std::string> Keys(const iniedit::Section& sec) {
  std::vector<std::string> out;
  for (const auto& p : sec) out.push_back(p.Name());
  return out;
}

}  // namespace

// ============================================================================
// Basic structure
// ============================================================================

TEST_CASE("Parser basic sections and properties", "[parser]") {
  auto r = iniedit::LoadString(
      "top = level\n"
      "[server]\n"
      "host = localhost\n"
      "port=8080\n"
      "\n"
      "[Client]\n"
      "name = app\n");
  REQUIRE(r.has_value());
  const auto& doc = r.value();

  REQUIRE(doc.DefaultSection().FindProperty("top")->Value() == "level");
  REQUIRE(doc.SectionCount() == 2);
  REQUIRE(doc.SectionAt(0)->Name() == "server");
  REQUIRE(doc.GetValue<int>("SERVER", "Port").value() == 8080);
  REQUIRE(doc.FindSection("client")->FindProperty("name")->Value() == "app");
  REQUIRE(doc.ParsingErrors().empty());
}

TEST_CASE("Parser handles every line terminator", "[parser]") {
  auto r = iniedit::LoadString("[a]\r\nx=1\ry=2\nz=3");
  REQUIRE(r.has_value());
  REQUIRE(Keys(*r.value().FindSection("a")) ==
          std::vector<std::string>{"x", "y", "z"});
}

TEST_CASE("Parser trims names and unquoted values", "[parser]") {
  auto r = iniedit::LoadString("[  spaced name  ]\n   key with space   =   v a l   \n");
  REQUIRE(r.has_value());
  const auto* sec = r.value().FindSection("spaced name");
  REQUIRE(sec != nullptr);
  REQUIRE(sec->FindProperty("key with space")->Value() == "v a l");
  REQUIRE(!sec->FindProperty("key with space")->IsQuoted());
}

TEST_CASE("Parser empty value", "[parser]") {
  auto r = iniedit::LoadString("[s]\nempty=\nblank =   \n");
  REQUIRE(r.has_value());
  REQUIRE(r.value().FindSection("s")->FindProperty("empty")->IsEmpty());
  REQUIRE(r.value().FindSection("s")->FindProperty("blank")->IsEmpty());
}

TEST_CASE("Parser splits on the first equals sign", "[parser]") {
  auto r = iniedit::LoadString("[s]\nurl = a=b=c\n");
  REQUIRE(r.has_value());
  REQUIRE(r.value().FindSection("s")->FindProperty("url")->Value() == "a=b=c");
}

// ============================================================================
// Comments
// ============================================================================

TEST_CASE("Parser attaches pre-comments to the next element",
          "[parser][comment]") {
  auto r = iniedit::LoadString(
      "; about the section\n"
      "# second line\n"
      "[s]\n"
      ";about key\n"
      "key = v\n"
      "; trailing comment is dropped\n");
  REQUIRE(r.has_value());
  const auto* sec = r.value().FindSection("s");
  REQUIRE(sec->PreComments().size() == 2);
  REQUIRE(sec->PreComments()[0].Prefix() == ';');
  REQUIRE(sec->PreComments()[0].Value() == " about the section");
  REQUIRE(sec->PreComments()[1].Prefix() == '#');
  REQUIRE(sec->FindProperty("key")->PreComments()[0].Value() == "about key");
}

TEST_CASE("Parser inline comments", "[parser][comment]") {
  auto r = iniedit::LoadString(
      "[s] # section note\n"
      "a = 1 ; one\n"
      "b = \"two\" # quoted note\n"
      "c = 3 ;\n");
  REQUIRE(r.has_value());
  const auto* sec = r.value().FindSection("s");
  REQUIRE(sec->InlineComment()->Prefix() == '#');
  REQUIRE(sec->InlineComment()->Value() == " section note");

  const auto* a = sec->FindProperty("a");
  REQUIRE(a->Value() == "1");
  REQUIRE(a->InlineComment()->Value() == " one");

  const auto* b = sec->FindProperty("b");
  REQUIRE(b->Value() == "two");
  REQUIRE(b->IsQuoted());
  REQUIRE(b->InlineComment()->Prefix() == '#');

  REQUIRE(sec->FindProperty("c")->Value() == "3");
  REQUIRE(sec->FindProperty("c")->HasInlineComment());
  REQUIRE(sec->FindProperty("c")->InlineComment()->Value().empty());
}

TEST_CASE("Parser keeps comment text verbatim", "[parser][comment]") {
  auto r = iniedit::LoadString(
      "  ; pre  \n"
      "[s] ;\n"
      "a = 1 ; one  \n"
      "b = \"2\" ;\t\n"
      "[t] # t \n");
  REQUIRE(r.has_value());
  const auto* s = r.value().FindSection("s");
  REQUIRE(s->PreComments()[0].Value() == " pre  ");
  REQUIRE(s->HasInlineComment());
  REQUIRE(s->InlineComment()->Value().empty());
  REQUIRE(s->FindProperty("a")->Value() == "1");
  REQUIRE(s->FindProperty("a")->InlineComment()->Value() == " one  ");
  REQUIRE(s->FindProperty("b")->InlineComment()->Value() == "\t");
  REQUIRE(r.value().FindSection("t")->InlineComment()->Value() == " t ");
}

TEST_CASE("Parser tolerates trailing whitespace after values", "[parser]") {
  auto r = iniedit::LoadString("[s]   \nq = \"v\"   \nu = w \t\n");
  REQUIRE(r.has_value());
  const auto* s = r.value().FindSection("s");
  REQUIRE(s->FindProperty("q")->Value() == "v");
  REQUIRE(!s->FindProperty("q")->HasInlineComment());
  REQUIRE(s->FindProperty("u")->Value() == "w");
}

TEST_CASE("Parser escaped prefix in unquoted value", "[parser][comment]") {
  auto r = iniedit::LoadString("[s]\ncolor = \\#ff0000 ; red\n");
  REQUIRE(r.has_value());
  const auto* p = r.value().FindSection("s")->FindProperty("color");
  REQUIRE(p->Value() == "#ff0000");
  REQUIRE(p->InlineComment()->Value() == " red");
}

TEST_CASE("Parser honours custom comment prefixes", "[parser][comment]") {
  iniedit::LoadOptions opts;
  opts.comment_prefix_chars = "!";
  opts.default_comment_prefix = '!';
  auto r = iniedit::LoadString("! note\n[s]\nkey = a;b#c ! tail\n", opts);
  REQUIRE(r.has_value());
  const auto* p = r.value().FindSection("s")->FindProperty("key");
  REQUIRE(p->Value() == "a;b#c");
  REQUIRE(p->InlineComment()->Prefix() == '!');
  REQUIRE(r.value().FindSection("s")->PreComments()[0].Value() == " note");
}

TEST_CASE("Parser rejects invalid prefix options", "[parser]") {
  iniedit::LoadOptions opts;
  opts.comment_prefix_chars = ";";
  opts.default_comment_prefix = '#';
  auto r = iniedit::LoadString("[s]\n", opts);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == iniedit::IniError::kInvalidPrefix);
}

TEST_CASE("Parser max_pending_comments keeps the newest", "[parser][comment]") {
  iniedit::LoadOptions opts;
  opts.max_pending_comments = 2;
  auto r = iniedit::LoadString(";1\n;2\n;3\n[s]\n", opts);
  REQUIRE(r.has_value());
  const auto& pre = r.value().FindSection("s")->PreComments();
  REQUIRE(pre.size() == 2);
  REQUIRE(pre[0].Value() == "2");
  REQUIRE(pre[1].Value() == "3");
}

// ============================================================================
// Quoted values
// ============================================================================

TEST_CASE("Parser quoted value escapes", "[parser][quote]") {
  auto r = iniedit::LoadString(
      "[s]\n"
      "path = \"C:\\\\dir\\\\file\"\n"
      "text = \"tab\\there\\nnew \\\"q\\\" \\; \\#\"\n"
      "pad = \"  kept  \"\n");
  REQUIRE(r.has_value());
  const auto* sec = r.value().FindSection("s");
  REQUIRE(sec->FindProperty("path")->Value() == "C:\\dir\\file");
  REQUIRE(sec->FindProperty("text")->Value() == "tab\there\nnew \"q\" ; #");
  REQUIRE(sec->FindProperty("pad")->Value() == "  kept  ");
}

TEST_CASE("Parser quoted value errors", "[parser][quote]") {
  struct Case {
    const char* line;
    const char* reason;
  };
  const Case cases[] = {
      {"k = \"open", "Unterminated quote: missing closing quotation mark"},
      {"k = \"ends with \\", "Invalid escape sequence: incomplete escape marker"},
      {"k = \"v\" junk", "Invalid quote format"},
      {"k = \"v\" junk ; c", "Invalid content after closing quote"},
  };
  for (const auto& c : cases) {
    auto r = iniedit::LoadString(std::string("[s]\n") + c.line + "\n",
                                 Collecting());
    REQUIRE(r.has_value());
    REQUIRE(r.value().ParsingErrors().size() == 1);
    REQUIRE(r.value().ParsingErrors()[0].line_number == 2);
    REQUIRE(r.value().ParsingErrors()[0].reason == c.reason);
    REQUIRE(r.value().FindSection("s")->Empty());
  }
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Parser missing bracket fails without collection", "[parser][error]") {
  auto r = iniedit::LoadString("[Section\nkey=value");
  REQUIRE(!r.has_value());
  const auto& err = r.get_error();
  REQUIRE(err.code == iniedit::IniError::kParseFailed);
  REQUIRE(err.errors.size() == 1);
  REQUIRE(err.errors[0].line_number == 1);
  REQUIRE(err.errors[0].line == "[Section");
  REQUIRE(err.errors[0].reason ==
          "Missing closing bracket in section declaration");
}

TEST_CASE("Parser collects every malformed line", "[parser][error]") {
  auto r = iniedit::LoadString(
      "[ok]\n"
      "a = 1\n"
      "no separator here\n"
      "b = 2\n"
      " = value\n"
      "[]\n"
      "c = 3\n",
      Collecting());
  REQUIRE(r.has_value());
  const auto& errors = r.value().ParsingErrors();
  REQUIRE(errors.size() == 3);
  REQUIRE(errors[0].line_number == 3);
  REQUIRE(errors[0].reason == "Missing equals sign in key-value pair");
  REQUIRE(errors[1].line_number == 5);
  REQUIRE(errors[1].reason == "Key is empty");
  REQUIRE(errors[1].line == " = value");
  REQUIRE(errors[2].line_number == 6);
  REQUIRE(errors[2].reason == "Section name cannot be empty");

  // A bad header leaves the current section in place.
  REQUIRE(Keys(*r.value().FindSection("ok")) ==
          std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Parser on_error fires for every error", "[parser][error]") {
  std::vector<uint32_t> lines;
  iniedit::LoadOptions opts = Collecting();
  opts.max_parsing_errors = 1;
  opts.on_error = [&lines](const iniedit::ParsingError& e) {
    lines.push_back(e.line_number);
  };
  auto r = iniedit::LoadString("bad\n\nworse\n", opts);
  REQUIRE(r.has_value());
  REQUIRE(lines == std::vector<uint32_t>{1, 3});
  REQUIRE(r.value().ParsingErrors().size() == 1);
}

// ============================================================================
// Duplicate policies
// ============================================================================

TEST_CASE("Parser duplicate keys", "[parser][duplicate]") {
  const char* text = "[s]\n;first\nk = 1\n;second\nk = \"2\"\nother = x\n";

  iniedit::LoadOptions opts;
  opts.duplicate_key_policy = iniedit::DuplicateKeyPolicy::kFirstWin;
  auto first = iniedit::LoadString(text, opts);
  REQUIRE(first.has_value());
  REQUIRE(first.value().FindSection("s")->FindProperty("k")->Value() == "1");

  opts.duplicate_key_policy = iniedit::DuplicateKeyPolicy::kLastWin;
  auto last = iniedit::LoadString(text, opts);
  REQUIRE(last.has_value());
  const auto* sec = last.value().FindSection("s");
  REQUIRE(Keys(*sec) == std::vector<std::string>{"k", "other"});
  REQUIRE(sec->FindProperty("k")->Value() == "2");
  REQUIRE(sec->FindProperty("k")->IsQuoted());
  REQUIRE(sec->FindProperty("k")->PreComments()[0].Value() == "second");

  opts.duplicate_key_policy = iniedit::DuplicateKeyPolicy::kThrowError;
  auto thrown = iniedit::LoadString(text, opts);
  REQUIRE(!thrown.has_value());
  REQUIRE(thrown.get_error().code == iniedit::IniError::kDuplicateKey);
  REQUIRE(thrown.get_error().message ==
          "Duplicate property name 'k' found in section 's'");
}

TEST_CASE("Parser duplicate sections", "[parser][duplicate]") {
  const char* text =
      "[a]\nx = 1\ny = 1\n"
      "[b]\nz = 0\n"
      "[A]\ny = 2\nw = 2\n";

  iniedit::LoadOptions opts;
  opts.duplicate_section_policy = iniedit::DuplicateSectionPolicy::kFirstWin;
  auto first = iniedit::LoadString(text, opts);
  REQUIRE(first.has_value());
  REQUIRE(first.value().SectionCount() == 2);
  REQUIRE(Keys(*first.value().FindSection("a")) ==
          std::vector<std::string>{"x", "y"});

  opts.duplicate_section_policy = iniedit::DuplicateSectionPolicy::kLastWin;
  auto last = iniedit::LoadString(text, opts);
  REQUIRE(last.has_value());
  REQUIRE(last.value().SectionAt(0)->Name() == "b");
  REQUIRE(last.value().SectionAt(1)->Name() == "A");
  REQUIRE(Keys(*last.value().FindSection("a")) ==
          std::vector<std::string>{"y", "w"});

  opts.duplicate_section_policy = iniedit::DuplicateSectionPolicy::kMerge;
  opts.duplicate_key_policy = iniedit::DuplicateKeyPolicy::kLastWin;
  auto merged = iniedit::LoadString(text, opts);
  REQUIRE(merged.has_value());
  const auto* a = merged.value().FindSection("a");
  REQUIRE(merged.value().SectionCount() == 2);
  REQUIRE(Keys(*a) == std::vector<std::string>{"x", "y", "w"});
  REQUIRE(a->FindProperty("y")->Value() == "2");

  opts.duplicate_key_policy = iniedit::DuplicateKeyPolicy::kThrowError;
  auto merge_clash = iniedit::LoadString(text, opts);
  REQUIRE(!merge_clash.has_value());
  REQUIRE(merge_clash.get_error().code == iniedit::IniError::kDuplicateKey);

  opts.duplicate_section_policy = iniedit::DuplicateSectionPolicy::kThrowError;
  auto thrown = iniedit::LoadString(text, opts);
  REQUIRE(!thrown.has_value());
  REQUIRE(thrown.get_error().code == iniedit::IniError::kDuplicateSection);
  REQUIRE(thrown.get_error().message == "Duplicate section name 'A' found");
}

// ============================================================================
// Limits and filters
// ============================================================================

TEST_CASE("Parser resource limits", "[parser][limits]") {
  iniedit::LoadOptions opts = Collecting();
  opts.max_sections = 1;
  opts.max_properties_per_section = 1;
  opts.max_value_length = 3;
  opts.max_line_length = 20;

  auto r = iniedit::LoadString(
      "[one]\n"
      "a = 1\n"
      "b = 2\n"
      "c = toolong\n"
      "this line is definitely too long = x\n"
      "[two]\n"
      "d = 4\n",
      opts);
  REQUIRE(r.has_value());
  const auto& doc = r.value();
  REQUIRE(doc.SectionCount() == 1);
  REQUIRE(Keys(*doc.FindSection("one")) == std::vector<std::string>{"a"});

  const auto& errors = doc.ParsingErrors();
  REQUIRE(errors.size() == 4);
  REQUIRE(errors[0].reason == "Maximum properties per section (1) exceeded");
  REQUIRE(errors[1].reason == "Value length (7) exceeds maximum (3)");
  REQUIRE(errors[2].reason == "Line exceeds maximum length of 20 characters");
  REQUIRE(errors[3].reason == "Maximum section limit (1) exceeded");
  REQUIRE(errors[3].line_number == 6);
}

TEST_CASE("Parser section_filter drops sections after load",
          "[parser][limits]") {
  iniedit::LoadOptions opts;
  opts.section_filter = [](const std::string& name) {
    return name.compare(0, 4, "keep") == 0;
  };
  auto r = iniedit::LoadString(
      "top=1\n[keep.a]\nx=1\n[drop]\ny=2\n[keep.b]\n", opts);
  REQUIRE(r.has_value());
  REQUIRE(r.value().SectionCount() == 2);
  REQUIRE(!r.value().HasSection("drop"));
  REQUIRE(r.value().DefaultSection().HasProperty("top"));
}

// ============================================================================
// Streams, files and encodings
// ============================================================================

TEST_CASE("Parser strips a UTF-8 BOM", "[parser][encoding]") {
  std::istringstream in("\xEF\xBB\xBF[s]\nk=v\n");
  auto r = iniedit::Load(in, iniedit::TextEncoding::kUtf8);
  REQUIRE(r.has_value());
  REQUIRE(r.value().HasSection("s"));
}

TEST_CASE("Parser decodes Latin-1", "[parser][encoding]") {
  std::istringstream in("[s]\nname=Jos\xE9\n");
  auto r = iniedit::Load(in, iniedit::TextEncoding::kLatin1);
  REQUIRE(r.has_value());
  REQUIRE(r.value().FindSection("s")->FindProperty("name")->Value() ==
          "Jos\xC3\xA9");
}

TEST_CASE("Parser LoadFile and LoadFileAsync", "[parser][file]") {
  const std::string path = "iniedit_test_parser_load.ini";
  {
    std::ofstream out(path, std::ios::binary);
    out << "[net]\nport = 80\n";
  }

  auto r = iniedit::LoadFile(path);
  REQUIRE(r.has_value());
  REQUIRE(r.value().GetValue<int>("net", "port").value() == 80);

  auto fut = iniedit::LoadFileAsync(path);
  auto async_r = fut.get();
  REQUIRE(async_r.has_value());
  REQUIRE(async_r.value().HasSection("net"));

  std::remove(path.c_str());

  auto missing = iniedit::LoadFile("iniedit_no_such_file.ini");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error().code == iniedit::IniError::kFileNotFound);
}
