#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple Renderer/Editor from ncurses so they can be driven headless.
 */
#include <string>

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  // text carries Row::render SGR markers; returns the next free column
  virtual int draw_marked(int row, int col, const std::string& text) = 0;
  virtual void draw_inverse(int row, int col, const std::string& text) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void set_color(bool enabled) = 0;
  virtual int read_key() = 0;
};
