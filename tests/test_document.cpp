#include "document.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path scratch_dir() {
  fs::path d = fs::temp_directory_path() / ("xed_test_document_" + std::to_string(::getpid()));
  fs::create_directories(d);
  return d;
}

static void write_file(const fs::path& p, const std::string& bytes) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << bytes;
}

static std::string read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static Document open_ok(const fs::path& p) {
  std::string msg;
  bool ok = false;
  Document d = Document::open(p, msg, ok);
  assert(ok);
  assert(msg == "opened file: " + p.string());
  return d;
}

static void test_open(const fs::path& dir) {
  std::string msg;
  bool ok = true;
  Document missing = Document::open(dir / "nope.rs", msg, ok);
  assert(!ok);
  assert(msg.rfind("can not open file: ", 0) == 0);
  assert(missing.is_empty());
  assert(!missing.is_dirty());

  ok = true;
  Document::open(dir, msg, ok);
  assert(!ok);

  write_file(dir / "main.rs", "fn main() {\n    let x = 1;\n}\n");
  Document d = open_ok(dir / "main.rs");
  assert(d.len() == 3);
  assert(!d.is_dirty());
  assert(d.file_type_name() == "rust");
  assert(d.file_name() && *d.file_name() == dir / "main.rs");
  assert(d.row(0)->text() == "fn main() {");
  assert(d.row(0)->highlighting()[0] == Highlight::PrimaryKeyword);
  assert(d.row(1)->highlighting()[12] == Highlight::Number);
  assert(d.row(3) == nullptr);

  write_file(dir / "crlf.txt", "a\r\nb\r\n\r\nc");
  Document c = open_ok(dir / "crlf.txt");
  assert(c.len() == 4);
  assert(c.row(0)->text() == "a");
  assert(c.row(2)->text().empty());
  assert(c.row(3)->text() == "c");
  assert(c.file_type_name() == "No filetype");

  write_file(dir / "empty.txt", "");
  Document e = open_ok(dir / "empty.txt");
  assert(e.len() == 0);
  assert(e.is_empty());

  Document fresh;
  assert(fresh.is_empty() && !fresh.is_dirty());
  assert(!fresh.file_name());
  assert(fresh.file_type_name() == "No filetype");
}

static void test_insert(const fs::path& dir) {
  write_file(dir / "hello.txt", "hello world\n");
  Document d = open_ok(dir / "hello.txt");

  d.insert_newline(Position{11, 0});
  assert(d.len() == 2);
  assert(d.row(0)->text() == "hello world");
  assert(d.row(1)->text().empty());
  assert(d.is_dirty());

  d.insert(Position{5, 0}, "\n");
  assert(d.len() == 3);
  assert(d.row(0)->text() == "hello");
  assert(d.row(1)->text() == " world");

  d.insert(Position{0, 2}, "!");
  assert(d.row(2)->text() == "!");
  d.insert(Position{0, 3}, "z");
  assert(d.len() == 4);
  assert(d.row(3)->text() == "z");
  d.insert_newline(Position{0, 4});
  assert(d.len() == 5);
  assert(d.row(4)->text().empty());

  write_file(dir / "brace.rs", "fn main() {\n}\n");
  Document b = open_ok(dir / "brace.rs");
  b.insert_newline(Position{11, 0});
  assert(b.len() == 3);
  assert(b.row(0)->text() == "fn main() {");
  assert(b.row(1)->text().empty());
  assert(b.row(2)->text() == "}");
  assert(b.row(0)->highlighting()[0] == Highlight::PrimaryKeyword);

  Document out_of_range;
  out_of_range.insert(Position{0, 1}, "x");
  out_of_range.insert_newline(Position{0, 3});
  assert(out_of_range.is_empty());
  assert(!out_of_range.is_dirty());

  Document blank;
  blank.insert(Position{0, 0}, "\xE4\xB8\xAD");
  assert(blank.len() == 1);
  assert(blank.row(0)->len() == 1);
  assert(blank.is_dirty());
}

static void test_insert_terminators(const fs::path& dir) {
  fs::path p = dir / "term.txt";
  write_file(p, "ab\n");
  Document d = open_ok(p);

  d.insert(Position{1, 0}, "");
  d.insert(Position{1, 0}, "x\ry");
  d.insert(Position{1, 0}, "x\ny");
  d.insert(Position{0, 1}, "\r\n\r\n");
  assert(!d.is_dirty());
  assert(d.len() == 1);
  assert(d.row(0)->text() == "ab");

  d.insert(Position{1, 0}, "\r");
  assert(d.is_dirty());
  assert(d.len() == 2);
  assert(d.row(0)->text() == "a");
  assert(d.row(1)->text() == "b");
  d.insert(Position{0, 1}, "\r\n");
  assert(d.len() == 3);
  assert(d.row(1)->text().empty());
  assert(d.row(2)->text() == "b");

  std::string msg;
  assert(d.save(msg));
  Document again = open_ok(p);
  assert(again.len() == d.len());
  for (std::size_t i = 0; i < d.len(); ++i) {
    assert(again.row(i)->text() == d.row(i)->text());
    assert(again.row(i)->len() == d.row(i)->len());
  }
}

static void test_rows_highlight_independently(const fs::path& dir) {
  auto check_let_x = [](const Row* r) {
    const auto& h = r->highlighting();
    assert(r->text() == "let x = 1;");
    for (std::size_t i = 0; i < 3; ++i) assert(h[i] == Highlight::PrimaryKeyword);
    assert(h[3] == Highlight::None && h[4] == Highlight::None);
    assert(h[8] == Highlight::Number);
    assert(h[9] == Highlight::None);
  };

  write_file(dir / "open_string.rs", "let s = \"abc\nlet x = 1;\n");
  Document d = open_ok(dir / "open_string.rs");
  assert(d.row(0)->highlighting()[11] == Highlight::String);
  check_let_x(d.row(1));

  // split inside the unterminated string
  d.insert_newline(Position{10, 0});
  assert(d.len() == 3);
  assert(d.row(0)->text() == "let s = \"a");
  assert(d.row(0)->highlighting()[9] == Highlight::String);
  assert(d.row(1)->text() == "bc");
  for (auto h : d.row(1)->highlighting()) assert(h == Highlight::None);
  check_let_x(d.row(2));

  write_file(dir / "comment.rs", "// let 1\nlet x = 1;\n");
  Document c = open_ok(dir / "comment.rs");
  for (auto h : c.row(0)->highlighting()) assert(h == Highlight::Comment);
  check_let_x(c.row(1));
  c.insert_newline(Position{3, 0});
  assert(c.row(1)->text() == "let 1");
  assert(c.row(1)->highlighting()[0] == Highlight::PrimaryKeyword);
  assert(c.row(1)->highlighting()[4] == Highlight::Number);
  check_let_x(c.row(2));
}

static void test_remove(const fs::path& dir) {
  write_file(dir / "merge.txt", "ab\ncde\nf\n");
  Document d = open_ok(dir / "merge.txt");

  d.remove(Position{2, 2});
  d.remove(Position{1, 2});
  d.remove(Position{9, 1});
  d.remove(Position{0, 7});
  assert(!d.is_dirty());
  assert(d.len() == 3);

  std::size_t total = d.row(0)->len() + d.row(1)->len();
  d.remove(Position{2, 0});
  assert(d.len() == 2);
  assert(d.row(0)->text() == "abcde");
  assert(d.row(0)->len() == total);
  assert(d.is_dirty());

  d.remove(Position{0, 0});
  assert(d.row(0)->text() == "bcde");
  d.remove(Position{0, 1});
  assert(d.row(1)->text().empty());
  assert(d.len() == 2);
}

static bool before_or_at(const Position& a, const Position& b) {
  return a.y < b.y || (a.y == b.y && a.x <= b.x);
}

static void test_find(const fs::path& dir) {
  write_file(dir / "find.txt", "foo bar\nbaz foo\n\nfoo\n");
  Document d = open_ok(dir / "find.txt");

  assert(d.find("foo", Position{0, 0}, SearchDirection::Forward) == std::optional<Position>(Position{0, 0}));
  assert(d.find("foo", Position{1, 0}, SearchDirection::Forward) == std::optional<Position>(Position{4, 1}));
  assert(d.find("foo", Position{5, 1}, SearchDirection::Forward) == std::optional<Position>(Position{0, 3}));
  assert(!d.find("foo", Position{1, 3}, SearchDirection::Forward));

  // first byte hit lies inside a Hangul L+V cluster
  const std::string v = "\xE1\x85\xA1";
  Document h;
  h.insert(Position{0, 0}, "\xE1\x84\x80" + v + " a" + v);
  assert(h.row(0)->len() == 4);
  assert(h.find(v, Position{0, 0}, SearchDirection::Forward) == std::optional<Position>(Position{3, 0}));
  assert(h.find(v, Position{3, 0}, SearchDirection::Backward) == std::optional<Position>(Position{3, 0}));
  assert(!h.find(v, Position{2, 0}, SearchDirection::Backward));

  assert(!d.find("qux", Position{0, 0}, SearchDirection::Forward));
  assert(!d.find("", Position{0, 0}, SearchDirection::Forward));

  assert(d.find("foo", Position{3, 1}, SearchDirection::Backward) == std::optional<Position>(Position{0, 0}));
  assert(d.find("foo", Position{4, 1}, SearchDirection::Backward) == std::optional<Position>(Position{4, 1}));
  assert(d.find("foo", Position{0, 2}, SearchDirection::Backward) == std::optional<Position>(Position{4, 1}));
  assert(d.find("bar", Position{3, 0}, SearchDirection::Backward) == std::nullopt);
  assert(d.find("foo", Position{0, 99}, SearchDirection::Backward) == std::optional<Position>(Position{0, 3}));

  for (std::size_t y = 0; y < d.len(); ++y) {
    for (std::size_t x = 0; x <= d.row(y)->len(); ++x) {
      Position at{x, y};
      if (auto f = d.find("o", at, SearchDirection::Forward)) assert(before_or_at(at, *f));
      if (auto b = d.find("o", at, SearchDirection::Backward)) assert(before_or_at(*b, at));
    }
  }

  Document empty;
  assert(!empty.find("a", Position{0, 0}, SearchDirection::Forward));
  assert(!empty.find("a", Position{0, 0}, SearchDirection::Backward));
}

static void test_save(const fs::path& dir) {
  fs::path p = dir / "save.rs";
  write_file(p, "let a = 1;\r\n# done");
  Document d = open_ok(p);
  d.insert(Position{0, 1}, "x");
  assert(d.is_dirty());

  std::string msg;
  assert(d.save(msg));
  assert(msg == "saved file: " + p.string());
  assert(!d.is_dirty());
  assert(read_file(p) == "let a = 1;\nx# done\n");
  assert(!fs::exists(dir / "save.rs.tmp"));

  Document again = open_ok(p);
  assert(again.len() == d.len());
  for (std::size_t i = 0; i < d.len(); ++i) assert(again.row(i)->text() == d.row(i)->text());

  // renaming to .py switches the rules on the next successful save
  d.set_file_name(dir / "save.py");
  d.insert(Position{0, 1}, "#");
  assert(d.file_type_name() == "rust");
  assert(d.save(msg));
  assert(d.file_type_name() == "python3");
  for (auto h : d.row(1)->highlighting()) assert(h == Highlight::Comment);
  assert(d.row(0)->highlighting()[0] == Highlight::None);

  d.insert(Position{0, 0}, " ");
  assert(d.is_dirty());
  d.set_file_name(dir / "no" / "such" / "dir.rs");
  assert(!d.save(msg));
  assert(msg.rfind("write file failed: ", 0) == 0);
  assert(d.is_dirty());
  assert(d.file_type_name() == "python3");
  assert(d.len() == 2);

  Document unnamed;
  unnamed.insert(Position{0, 0}, "a");
  assert(unnamed.save(msg));
  assert(msg == "no file name");
  assert(unnamed.is_dirty());

  Document blank(dir / "blank.txt");
  assert(blank.save(msg));
  assert(fs::exists(dir / "blank.txt"));
  assert(read_file(dir / "blank.txt").empty());
}

static void test_highlight_word(const fs::path& dir) {
  write_file(dir / "word.txt", "one two\ntwo\n");
  Document d = open_ok(dir / "word.txt");
  d.highlight(std::string_view("two"));
  assert(d.row(0)->highlighting()[4] == Highlight::Match);
  assert(d.row(0)->highlighting()[0] == Highlight::None);
  assert(d.row(1)->highlighting()[0] == Highlight::Match);
  assert(!d.is_dirty());
  d.highlight(std::nullopt);
  for (std::size_t y = 0; y < d.len(); ++y)
    for (auto h : d.row(y)->highlighting()) assert(h == Highlight::None);
}

int main() {
  fs::path dir = scratch_dir();
  test_open(dir);
  test_insert(dir);
  test_insert_terminators(dir);
  test_rows_highlight_independently(dir);
  test_remove(dir);
  test_find(dir);
  test_save(dir);
  test_highlight_word(dir);
  fs::remove_all(dir);
  return 0;
}
