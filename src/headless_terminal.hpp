#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; records the screen as plain text rows.
 * Input: keys are replayed from a script; once drained it types Ctrl-Q, "yes", Enter forever
 *        so a driven Editor always terminates.
 * Note: color markers are stripped; colors() keeps the SGR color seen at each cell.
 */
#include <algorithm>
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : size_{rows, cols} { clear(); }

  void push_keys(const std::string& keys) { for (unsigned char c : keys) keys_.push_back(c); }
  void push_key(int key) { keys_.push_back(key); }

  const std::string& line(int row) const { return screen_[static_cast<size_t>(row)]; }
  // Screen row without trailing blanks.
  std::string trimmed(int row) const {
    std::string s = line(row);
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return s;
  }
  const std::vector<int>& colors(int row) const { return colors_[static_cast<size_t>(row)]; }
  int inverse_row() const { return inverse_row_; }
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  bool color_enabled() const { return color_; }
  int refreshes() const { return refreshes_; }

  TermSize get_size() const override { return size_; }

  void clear() override {
    screen_.assign(static_cast<size_t>(size_.rows), std::string(static_cast<size_t>(size_.cols), ' '));
    colors_.assign(static_cast<size_t>(size_.rows), std::vector<int>(static_cast<size_t>(size_.cols), -1));
    inverse_row_ = -1;
  }

  void draw_text(int row, int col, const std::string& text) override { put(row, col, text, -1); }

  int draw_marked(int row, int col, const std::string& text) override {
    int color = -1;
    size_t i = 0;
    while (i < text.size()) {
      if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
        size_t m = text.find('m', i);
        if (m == std::string::npos) break;
        std::string params = text.substr(i + 2, m - i - 2);
        if (params == "39") color = -1;
        else if (params.rfind("38;5;", 0) == 0) color = std::stoi(params.substr(5));
        i = m + 1;
        continue;
      }
      put(row, col++, std::string(1, text[i]), color);
      ++i;
    }
    return col;
  }

  void draw_inverse(int row, int col, const std::string& text) override {
    put(row, col, text, -1);
    inverse_row_ = row;
  }

  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void refresh() override { ++refreshes_; }

  void clear_to_eol(int row, int col) override {
    if (!in_range(row)) return;
    std::string& s = screen_[static_cast<size_t>(row)];
    for (size_t c = static_cast<size_t>(std::max(0, col)); c < s.size(); ++c) s[c] = ' ';
  }

  void set_color(bool enabled) override { color_ = enabled; }

  int read_key() override {
    if (!keys_.empty()) {
      int k = keys_.front();
      keys_.pop_front();
      return k;
    }
    static const int kQuit[] = {'q' & 0x1f, 'y', 'e', 's', '\n'};
    return kQuit[drained_++ % 5];
  }

private:
  bool in_range(int row) const { return row >= 0 && row < size_.rows; }

  // Byte-wise placement; multi-byte text occupies one cell per byte.
  void put(int row, int col, const std::string& text, int color) {
    if (!in_range(row)) return;
    std::string& s = screen_[static_cast<size_t>(row)];
    std::vector<int>& c = colors_[static_cast<size_t>(row)];
    for (size_t i = 0; i < text.size(); ++i) {
      int x = col + static_cast<int>(i);
      if (x < 0 || x >= size_.cols) continue;
      s[static_cast<size_t>(x)] = text[i];
      c[static_cast<size_t>(x)] = color;
    }
  }

  TermSize size_;
  std::vector<std::string> screen_;
  std::vector<std::vector<int>> colors_;
  std::deque<int> keys_;
  size_t drained_ = 0;
  int inverse_row_ = -1;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
  bool color_ = true;
};
