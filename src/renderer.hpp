#pragma once
/*
 * Renderer
 *
 * Purpose: draw document rows, status bar and message bar; keep the viewport on the cursor.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Editor to render.
 */
#include <string>
#include <vector>
#include "document.hpp"
#include "iterminal.hpp"
#include "types.hpp"

struct ViewInfo {
  const Document* doc = nullptr;
  Position cur{};
  Viewport* vp = nullptr;
  Mode mode = Mode::View;
  std::string message;
  std::vector<std::string> open_names;
  bool show_line_numbers = false;
};

class Renderer {
public:
  // rows reserved below the text area (status bar + message bar)
  static constexpr int kBars = 2;

  void render(ITerminal& term, const ViewInfo& info);
  static void scroll(Viewport& vp, const Position& cur, int text_rows, int text_cols);
  static int gutter_width(const Document& doc, bool show_line_numbers);

private:
  void draw_rows(ITerminal& term, const ViewInfo& info, int text_rows, int indent);
  void draw_status_bar(ITerminal& term, const ViewInfo& info, int row, int cols);
};
