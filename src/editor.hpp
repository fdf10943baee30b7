#pragma once
/*
 * Editor
 *
 * Purpose: interactive loop over one or more Documents (view/insert modes).
 * Keys: Ctrl-Q quit, Ctrl-S save, Ctrl-F search, Ctrl-N open, Ctrl-T next document.
 * Note: every buffer change goes through Document; Editor only moves the cursor.
 */
#include <optional>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <chrono>
#include "types.hpp"
#include "document.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"
#include "cmd_registry.hpp"
#include "editor_options.hpp"

class Editor {
public:
  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file);
  void run();

private:
  struct OpenDocument {
    Document doc;
    Position cur;
    Viewport vp;
  };

  Document& doc() { return docs[active].doc; }
  Position& cur() { return docs[active].cur; }

  ITerminal& term;
  Renderer renderer;
  CommandRegistry registry;
  EditorOptions opts;
  std::vector<OpenDocument> docs;
  std::size_t active = 0;
  Mode mode = Mode::View;
  bool should_quit = false;
  std::string message;
  std::chrono::steady_clock::time_point message_time;

  void set_message(std::string m);
  void render();
  void handle_key(int ch);
  void handle_view_input(int ch);
  void handle_insert_input(int ch);
  void move_cursor(int key);
  std::string read_utf8(int first);
  std::optional<std::string> prompt(const std::string& label,
                                    const std::function<void(int, const std::string&)>& on_key = {});
  void save();
  void search();
  void quit();
  void open_new_file();
  void next_document();
  int text_rows() const;
};
