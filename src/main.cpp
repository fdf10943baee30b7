#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include <iostream>
#include <optional>
#include <filesystem>

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: xed [file]\n";
    return 2;
  }
  std::optional<std::filesystem::path> path;
  if (argc == 2) path = std::filesystem::path(argv[1]);
  NcursesTerminal backend;
  Editor ed(backend, path);
  ed.run();
  return 0;
}
