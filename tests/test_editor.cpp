#include "editor.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static constexpr int kEsc = 27;
static constexpr int kBackspace = 127;
static constexpr int kCtrlF = 'f' & 0x1f;
static constexpr int kCtrlN = 'n' & 0x1f;
static constexpr int kCtrlS = 's' & 0x1f;
static constexpr int kCtrlT = 't' & 0x1f;

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

static void test_type_and_save(const fs::path& dir) {
  fs::path p = dir / "new.txt";
  HeadlessTerminal term(12, 80);
  term.push_keys("ihi\nthere");
  term.push_key(kEsc);
  term.push_key(kCtrlS);
  Editor ed(term, p);
  ed.run();
  assert(read_file(p) == "hi\nthere\n");
  // rc file turned line numbers on
  assert(term.trimmed(0) == "1 hi");
  assert(term.trimmed(1) == "2 there");
  assert(term.trimmed(11).rfind("saved file: ", 0) == 0);
}

static void test_join_and_search(const fs::path& dir) {
  fs::path p = dir / "join.txt";
  write_file(p, "abc\ndef\n");
  HeadlessTerminal term(12, 80);
  term.push_keys("ji");
  term.push_key(kBackspace);
  term.push_key(kEsc);
  term.push_keys("hhh");
  term.push_key(kCtrlF);
  term.push_keys("de\n");
  term.push_keys("iX");
  term.push_key(kEsc);
  term.push_key(kCtrlS);
  Editor ed(term, p);
  ed.run();
  assert(read_file(p) == "abcXdef\n");
}

static void test_quit_discards(const fs::path& dir) {
  fs::path p = dir / "keep.txt";
  write_file(p, "keep\n");
  HeadlessTerminal term(12, 80);
  term.push_keys("iedit");
  term.push_key(kEsc);
  Editor ed(term, p);
  ed.run();
  assert(read_file(p) == "keep\n");
}

static void test_multiple_documents(const fs::path& dir) {
  fs::path first = dir / "first.txt";
  fs::path second = dir / "second.txt";
  write_file(first, "one\n");
  write_file(second, "two\n");
  HeadlessTerminal term(12, 120);
  term.push_key(kCtrlN);
  term.push_keys(second.string() + "\n");
  term.push_keys("iZ");
  term.push_key(kEsc);
  term.push_key(kCtrlS);
  term.push_key(kCtrlT);
  term.push_keys("iY");
  term.push_key(kEsc);
  term.push_key(kCtrlS);
  Editor ed(term, first);
  ed.run();
  assert(read_file(second) == "Ztwo\n");
  assert(read_file(first) == "Yone\n");
  int status = term.inverse_row();
  assert(status == 10);
  assert(term.line(status).find("open: first.txt second.txt") != std::string::npos);
}

int main() {
  fs::path dir = fs::temp_directory_path() / ("xed_test_editor_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  write_file(dir / ".xedrc", "set number on\n");
  ::setenv("HOME", dir.c_str(), 1);
  test_type_and_save(dir);
  test_join_and_search(dir);
  test_quit_discards(dir);
  test_multiple_documents(dir);
  fs::remove_all(dir);
  return 0;
}
