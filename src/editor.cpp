#include <ncurses.h>
#include "editor.hpp"
#include <algorithm>
#include <cstdlib>
#include "config.hpp"

static constexpr int CTRL_f = 'f' & 0x1f;
static constexpr int CTRL_n = 'n' & 0x1f;
static constexpr int CTRL_q = 'q' & 0x1f;
static constexpr int CTRL_s = 's' & 0x1f;
static constexpr int CTRL_t = 't' & 0x1f;
static constexpr int ESC = 27;

static inline bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static inline bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }
static inline bool is_text_byte(int ch) { return (ch >= 32 && ch < 127) || (ch >= 0xC2 && ch <= 0xF4); }

static Document open_or_new(const std::filesystem::path& p, std::string& msg) {
  bool ok = true;
  Document d = Document::open(p, msg, ok);
  if (!ok) {
    msg = "error: could not open file '" + p.string() + "'";
    return Document(p);
  }
  return d;
}

Editor::Editor(ITerminal& t, const std::optional<std::filesystem::path>& file) : term(t) {
  register_option_commands(registry, opts, message);
  std::string rc_message;
  if (const char* home = std::getenv("HOME")) {
    load_rc(std::filesystem::path(home) / XED_RC_FILE, registry, rc_message);
  }
  term.set_color(opts.color);
  std::string initial = "ctrl-q quit | ctrl-s save | ctrl-f search | ctrl-n open";
  OpenDocument od;
  if (file) {
    std::string m;
    od.doc = open_or_new(*file, m);
    if (m.rfind("error", 0) == 0) initial = m;
  }
  docs.push_back(std::move(od));
  set_message(rc_message.empty() ? initial : rc_message);
}

void Editor::set_message(std::string m) {
  message = std::move(m);
  message_time = std::chrono::steady_clock::now();
}

int Editor::text_rows() const {
  return std::max(1, term.get_size().rows - Renderer::kBars);
}

void Editor::run() {
  while (!should_quit) {
    render();
    handle_key(term.read_key());
  }
}

void Editor::render() {
  ViewInfo info;
  info.doc = &docs[active].doc;
  info.cur = docs[active].cur;
  info.vp = &docs[active].vp;
  info.mode = mode;
  auto age = std::chrono::steady_clock::now() - message_time;
  if (age < std::chrono::seconds(opts.status_timeout)) info.message = message;
  if (docs.size() > 1) {
    for (const auto& d : docs) info.open_names.push_back(d.doc.file_name() ? d.doc.file_name()->filename().string() : "[no name]");
  }
  info.show_line_numbers = opts.line_numbers;
  renderer.render(term, info);
}

void Editor::handle_key(int ch) {
  switch (ch) {
    case CTRL_q: quit(); return;
    case CTRL_s: save(); return;
    case CTRL_f: search(); return;
    case CTRL_n: open_new_file(); return;
    case CTRL_t: next_document(); return;
    default: break;
  }
  if (mode == Mode::Insert) handle_insert_input(ch);
  else handle_view_input(ch);
}

void Editor::handle_view_input(int ch) {
  switch (ch) {
    case 'i': mode = Mode::Insert; break;
    case 'h': move_cursor(KEY_LEFT); break;
    case 'j': move_cursor(KEY_DOWN); break;
    case 'k': move_cursor(KEY_UP); break;
    case 'l': move_cursor(KEY_RIGHT); break;
    case KEY_UP: case KEY_DOWN: case KEY_LEFT: case KEY_RIGHT:
    case KEY_PPAGE: case KEY_NPAGE: case KEY_HOME: case KEY_END:
      move_cursor(ch); break;
    default: break;
  }
}

void Editor::handle_insert_input(int ch) {
  if (ch == ESC) { mode = Mode::View; return; }
  if (is_enter(ch)) {
    doc().insert(cur(), "\n");
    cur().y++;
    cur().x = 0;
    return;
  }
  if (is_backspace(ch)) {
    if (cur().x > 0 || cur().y > 0) {
      move_cursor(KEY_LEFT);
      doc().remove(cur());
    }
    return;
  }
  if (ch == KEY_DC) { doc().remove(cur()); return; }
  switch (ch) {
    case KEY_UP: case KEY_DOWN: case KEY_LEFT: case KEY_RIGHT:
    case KEY_PPAGE: case KEY_NPAGE: case KEY_HOME: case KEY_END:
      move_cursor(ch); return;
    default: break;
  }
  if (ch != '\t' && !is_text_byte(ch)) return;
  std::string s = read_utf8(ch);
  const Row* before_row = doc().row(cur().y);
  std::size_t before = before_row ? before_row->len() : 0;
  doc().insert(cur(), s);
  const Row* after_row = doc().row(cur().y);
  std::size_t after = after_row ? after_row->len() : 0;
  // a combining mark joins the previous cluster and does not advance
  if (after > before) cur().x = std::min(cur().x + (after - before), after);
}

std::string Editor::read_utf8(int first) {
  std::string s(1, static_cast<char>(first));
  int extra = 0;
  if ((first & 0xE0) == 0xC0) extra = 1;
  else if ((first & 0xF0) == 0xE0) extra = 2;
  else if ((first & 0xF8) == 0xF0) extra = 3;
  for (int i = 0; i < extra; ++i) {
    int c = term.read_key();
    if ((c & 0xC0) != 0x80) break;
    s.push_back(static_cast<char>(c));
  }
  return s;
}

void Editor::move_cursor(int key) {
  Position p = cur();
  std::size_t height = doc().len();
  auto width_of = [this](std::size_t y) -> std::size_t {
    const Row* r = doc().row(y);
    return r ? r->len() : 0;
  };
  std::size_t width = width_of(p.y);
  std::size_t page = static_cast<std::size_t>(text_rows());
  switch (key) {
    case KEY_UP: if (p.y > 0) p.y--; break;
    case KEY_DOWN: if (p.y < height) p.y++; break;
    case KEY_LEFT:
      if (p.x > 0) p.x--;
      else if (p.y > 0) { p.y--; p.x = width_of(p.y); }
      break;
    case KEY_RIGHT:
      if (p.x < width) p.x++;
      else if (p.y < height) { p.y++; p.x = 0; }
      break;
    case KEY_PPAGE: p.y = p.y > page ? p.y - page : 0; break;
    case KEY_NPAGE: p.y = p.y + page < height ? p.y + page : height; break;
    case KEY_HOME: p.x = 0; break;
    case KEY_END: p.x = width; break;
    default: break;
  }
  p.x = std::min(p.x, width_of(p.y));
  cur() = p;
}

std::optional<std::string> Editor::prompt(const std::string& label,
                                          const std::function<void(int, const std::string&)>& on_key) {
  std::string result;
  for (;;) {
    set_message(label + result);
    render();
    int key = term.read_key();
    if (is_enter(key)) break;
    if (key == ESC) { result.clear(); break; }
    if (is_backspace(key)) {
      while (!result.empty() && (static_cast<unsigned char>(result.back()) & 0xC0) == 0x80) result.pop_back();
      if (!result.empty()) result.pop_back();
    } else if (is_text_byte(key)) {
      result += read_utf8(key);
    }
    if (on_key) on_key(key, result);
  }
  set_message("");
  if (result.empty()) return std::nullopt;
  return result;
}

void Editor::save() {
  if (!doc().file_name()) {
    auto name = prompt("save as: ");
    if (!name) { set_message("save stopped"); return; }
    doc().set_file_name(*name);
  }
  std::string msg;
  if (doc().save(msg)) set_message(msg);
  else set_message("error: " + msg);
}

void Editor::search() {
  Position old = cur();
  SearchDirection direction = SearchDirection::Forward;
  auto query = prompt("search: ", [this, &direction](int key, const std::string& q) {
    bool moved = false;
    switch (key) {
      case KEY_RIGHT: case KEY_DOWN:
        direction = SearchDirection::Forward;
        move_cursor(KEY_RIGHT);
        moved = true;
        break;
      case KEY_LEFT: case KEY_UP:
        direction = SearchDirection::Backward;
        move_cursor(KEY_LEFT);
        moved = true;
        break;
      default:
        direction = SearchDirection::Forward;
        break;
    }
    if (auto p = doc().find(q, cur(), direction)) {
      cur() = *p;
    } else if (moved) {
      move_cursor(direction == SearchDirection::Forward ? KEY_LEFT : KEY_RIGHT);
    }
    doc().highlight(q);
  });
  if (!query) cur() = old;
  doc().highlight(std::nullopt);
}

void Editor::quit() {
  bool dirty = std::any_of(docs.begin(), docs.end(), [](const OpenDocument& d){ return d.doc.is_dirty(); });
  if (!dirty) { should_quit = true; return; }
  auto answer = prompt("exit without saving? (yes/no) ");
  if (answer && (*answer == "yes" || *answer == "y")) should_quit = true;
}

void Editor::open_new_file() {
  auto name = prompt("new filepath: ");
  OpenDocument od;
  std::string m;
  if (name) od.doc = open_or_new(*name, m);
  docs.push_back(std::move(od));
  active = docs.size() - 1;
  mode = Mode::View;
  set_message(m);
}

void Editor::next_document() {
  if (docs.size() <= 1) return;
  active = (active + 1) % docs.size();
}
