#include "renderer.hpp"
#include <algorithm>
#include <sstream>
#include "config.hpp"

int Renderer::gutter_width(const Document& doc, bool show_line_numbers) {
  if (!show_line_numbers) return 0;
  int digits = 1;
  std::size_t total = std::max<std::size_t>(1, doc.len());
  while (total >= 10) { total /= 10; digits++; }
  return digits + 1; // one space after numbers
}

void Renderer::scroll(Viewport& vp, const Position& cur, int text_rows, int text_cols) {
  std::size_t h = static_cast<std::size_t>(std::max(1, text_rows));
  std::size_t w = static_cast<std::size_t>(std::max(1, text_cols));
  if (cur.y < vp.top_line) vp.top_line = cur.y;
  else if (cur.y >= vp.top_line + h) vp.top_line = cur.y - h + 1;
  if (cur.x < vp.left_col) vp.left_col = cur.x;
  else if (cur.x >= vp.left_col + w) vp.left_col = cur.x - w + 1;
}

static void draw_welcome(ITerminal& term, int row, int cols) {
  std::string msg = std::string("xed -- version ") + XED_VERSION;
  int pad = std::max(0, (cols - static_cast<int>(msg.size())) / 2);
  std::string line = "~" + std::string(static_cast<size_t>(std::max(0, pad - 1)), ' ') + msg;
  if (static_cast<int>(line.size()) > cols) line.resize(static_cast<size_t>(std::max(0, cols)));
  term.draw_text(row, 0, line);
}

void Renderer::draw_rows(ITerminal& term, const ViewInfo& info, int text_rows, int indent) {
  const Document& doc = *info.doc;
  int cols = term.get_size().cols;
  std::size_t text_cols = static_cast<std::size_t>(std::max(0, cols - indent));
  for (int i = 0; i < text_rows; ++i) {
    std::size_t line_idx = info.vp->top_line + static_cast<std::size_t>(i);
    const Row* r = doc.row(line_idx);
    if (!r) {
      if (doc.is_empty() && i == text_rows / 3) draw_welcome(term, i, cols);
      else term.draw_text(i, 0, "~");
      continue;
    }
    if (indent > 0) {
      std::string num = std::to_string(line_idx + 1);
      std::string pad(static_cast<size_t>(std::max(0, indent - 1 - static_cast<int>(num.size()))), ' ');
      term.draw_text(i, 0, pad + num + " ");
    }
    std::size_t start = info.vp->left_col;
    term.draw_marked(i, indent, r->render(start, start + text_cols));
  }
}

void Renderer::draw_status_bar(ITerminal& term, const ViewInfo& info, int row, int cols) {
  const Document& doc = *info.doc;
  std::string name = doc.file_name() ? doc.file_name()->string() : "[no name]";
  if (name.size() > 20) name.resize(20);
  std::ostringstream left;
  left << (info.mode == Mode::View ? "view" : "insert") << " | " << name
       << (doc.is_dirty() ? " (edited)" : "");
  if (!info.open_names.empty()) {
    left << " | open:";
    for (const auto& n : info.open_names) left << " " << n;
  }
  std::ostringstream right;
  right << "[" << (info.cur.y + 1) << "/" << doc.len() << "] [" << doc.file_type_name() << "]";
  std::string status = left.str();
  std::string ind = right.str();
  if (cols > static_cast<int>(status.size() + ind.size())) {
    status.append(static_cast<size_t>(cols) - status.size() - ind.size(), ' ');
  }
  status += ind;
  if (static_cast<int>(status.size()) > cols) status.resize(static_cast<size_t>(std::max(0, cols)));
  term.draw_inverse(row, 0, status);
}

void Renderer::render(ITerminal& term, const ViewInfo& info) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  int text_rows = std::max(0, rows - kBars);
  int indent = gutter_width(*info.doc, info.show_line_numbers);
  scroll(*info.vp, info.cur, text_rows, cols - indent);
  term.clear();
  draw_rows(term, info, text_rows, indent);
  if (rows >= kBars) {
    draw_status_bar(term, info, rows - 2, cols);
    std::string msg = info.message;
    if (static_cast<int>(msg.size()) > cols) msg.resize(static_cast<size_t>(std::max(0, cols)));
    term.draw_text(rows - 1, 0, msg);
    term.clear_to_eol(rows - 1, static_cast<int>(msg.size()));
  }
  int screen_row = static_cast<int>(info.cur.y - info.vp->top_line);
  int screen_col = indent + static_cast<int>(info.cur.x - info.vp->left_col);
  term.move_cursor(std::min(screen_row, std::max(0, rows - 1)), std::min(screen_col, std::max(0, cols - 1)));
  term.refresh();
}
