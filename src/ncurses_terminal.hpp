#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and key input.
 * Colors: one color pair per Highlight kind; render markers select the pair.
 * Lifetime: owns the curses session; construction enters raw/noecho/keypad mode and
 *           destruction restores the tty with endwin().
 */
#include "iterminal.hpp"
#include "highlight.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  NcursesTerminal(const NcursesTerminal&) = delete;
  NcursesTerminal& operator=(const NcursesTerminal&) = delete;
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  int draw_marked(int row, int col, const std::string& text) override;
  void draw_inverse(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  void set_color(bool enabled) override { color_enabled_ = enabled && has_colors(); }
  int read_key() override;

  static short pair_for(Highlight h) { return static_cast<short>(static_cast<int>(h) + 1); }
private:
  short pair_for_sgr(int color) const;
  bool color_enabled_ = false;
};
