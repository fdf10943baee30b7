#include "ncurses_terminal.hpp"
#include <algorithm>
#include <locale.h>

// Fallback for 8-color terminals.
static short basic_color(Highlight h) {
  switch (h) {
    case Highlight::Number: return COLOR_RED;
    case Highlight::Match: return COLOR_BLUE;
    case Highlight::String: return COLOR_GREEN;
    case Highlight::Character: return COLOR_MAGENTA;
    case Highlight::Comment: return COLOR_WHITE;
    case Highlight::PrimaryKeyword: return COLOR_YELLOW;
    case Highlight::SecondaryKeyword: return COLOR_CYAN;
    case Highlight::None: break;
  }
  return -1;
}

NcursesTerminal::NcursesTerminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  if (has_colors()) {
    start_color();
    short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
    for (int k = 0; k < kHighlightKinds; ++k) {
      Highlight h = static_cast<Highlight>(k);
      short fg = COLORS >= 256 ? static_cast<short>(highlight_color(h)) : basic_color(h);
      if (h == Highlight::None) fg = bg == -1 ? -1 : COLOR_WHITE;
      init_pair(pair_for(h), fg, bg);
    }
    color_enabled_ = true;
  }
}

NcursesTerminal::~NcursesTerminal() { endwin(); }

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

short NcursesTerminal::pair_for_sgr(int color) const {
  for (int k = 0; k < kHighlightKinds; ++k) {
    Highlight h = static_cast<Highlight>(k);
    if (highlight_color(h) == color) return pair_for(h);
  }
  return pair_for(Highlight::None);
}

int NcursesTerminal::draw_marked(int row, int col, const std::string& text) {
  move(row, col);
  short pair = 0;
  size_t i = 0;
  size_t run = 0;
  auto flush = [&](size_t upto) {
    if (upto <= run) return;
    if (color_enabled_ && pair) attron(COLOR_PAIR(pair));
    addnstr(text.c_str() + run, (int)(upto - run));
    if (color_enabled_ && pair) attroff(COLOR_PAIR(pair));
  };
  while (i < text.size()) {
    if (text[i] != '\x1b' || i + 1 >= text.size() || text[i + 1] != '[') { ++i; continue; }
    size_t m = text.find('m', i);
    if (m == std::string::npos) break;
    flush(i);
    std::string params = text.substr(i + 2, m - i - 2);
    if (params == "39") {
      pair = 0;
    } else if (params.rfind("38;5;", 0) == 0) {
      int color = 0;
      for (char c : params.substr(5)) if (c >= '0' && c <= '9') color = color * 10 + (c - '0');
      pair = pair_for_sgr(color);
    }
    i = m + 1;
    run = i;
  }
  flush(text.size());
  return getcurx(stdscr);
}

void NcursesTerminal::draw_inverse(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  int cols = get_size().cols;
  int x = getcurx(stdscr);
  if (x > col || text.empty()) {
    std::string pad(static_cast<size_t>(std::max(0, cols - std::max(x, col))), ' ');
    addnstr(pad.c_str(), (int)pad.size());
  }
  attroff(A_REVERSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() { return getch(); }
