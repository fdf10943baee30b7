#include "document.hpp"
#include "file_io.hpp"

Document::Document(const std::filesystem::path& file_name) : file_name_(file_name) {}

Document Document::open(const std::filesystem::path& path, std::string& msg, bool& ok) {
  Document d;
  std::vector<std::string> lines;
  ok = read_lines(path, lines, msg);
  if (!ok) return d;
  d.file_type_ = FileType::from_name(path.string());
  d.rows_.reserve(lines.size());
  for (const auto& s : lines) {
    Row r(s);
    d.highlight_row(r);
    d.rows_.push_back(std::move(r));
  }
  d.file_name_ = path;
  return d;
}

bool Document::save(std::string& msg) {
  if (!file_name_) { msg = "no file name"; return true; }
  bool ok = write_lines(*file_name_, rows_.size(),
                        [this](std::size_t i) { return rows_[i].as_bytes(); }, msg);
  if (!ok) return false;
  file_type_ = FileType::from_name(file_name_->string());
  for (auto& r : rows_) highlight_row(r);
  dirty_ = false;
  return true;
}

const Row* Document::row(std::size_t index) const {
  if (index >= rows_.size()) return nullptr;
  return &rows_[index];
}

void Document::insert(const Position& at, std::string_view ch) {
  if (at.y > rows_.size() || ch.empty()) return;
  if (ch == "\n" || ch == "\r" || ch == "\r\n") {
    insert_newline(at);
    return;
  }
  // rows never hold terminators
  if (ch.find_first_of("\r\n") != std::string_view::npos) return;
  if (at.y == rows_.size()) {
    Row r;
    r.insert(0, ch);
    highlight_row(r);
    rows_.push_back(std::move(r));
  } else {
    Row& r = rows_[at.y];
    r.insert(at.x, ch);
    highlight_row(r);
  }
  dirty_ = true;
}

void Document::insert_newline(const Position& at) {
  if (at.y > rows_.size()) return;
  if (at.y == rows_.size()) {
    Row r;
    highlight_row(r);
    rows_.push_back(std::move(r));
    dirty_ = true;
    return;
  }
  Row tail = rows_[at.y].split(at.x);
  highlight_row(rows_[at.y]);
  highlight_row(tail);
  rows_.insert(rows_.begin() + static_cast<std::ptrdiff_t>(at.y + 1), std::move(tail));
  dirty_ = true;
}

void Document::remove(const Position& at) {
  if (at.y >= rows_.size()) return;
  Row& r = rows_[at.y];
  if (at.x == r.len() && at.y + 1 < rows_.size()) {
    r.append(rows_[at.y + 1]);
    rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(at.y + 1));
    highlight_row(rows_[at.y]);
    dirty_ = true;
    return;
  }
  if (at.x >= r.len()) return;
  r.remove(at.x);
  highlight_row(r);
  dirty_ = true;
}

// Last match starting at or before column limit, scanning from the row start.
static std::optional<std::size_t> last_match_upto(const Row& r, std::string_view query, std::size_t limit) {
  std::optional<std::size_t> last;
  auto m = r.find(query, 0, SearchDirection::Backward);
  while (m && *m <= limit) {
    last = m;
    m = r.find(query, *m + 1, SearchDirection::Forward);
  }
  return last;
}

std::optional<Position> Document::find(std::string_view query, const Position& at, SearchDirection direction) const {
  if (query.empty() || rows_.empty()) return std::nullopt;
  if (direction == SearchDirection::Forward) {
    for (std::size_t y = at.y; y < rows_.size(); ++y) {
      std::size_t from = (y == at.y) ? at.x : 0;
      if (auto x = rows_[y].find(query, from, SearchDirection::Forward)) return Position{*x, y};
    }
    return std::nullopt;
  }
  std::size_t y = at.y;
  std::size_t limit = at.x;
  if (y >= rows_.size()) {
    y = rows_.size() - 1;
    limit = rows_[y].len();
  }
  for (;;) {
    if (auto x = last_match_upto(rows_[y], query, limit)) return Position{*x, y};
    if (y == 0) break;
    --y;
    limit = rows_[y].len();
  }
  return std::nullopt;
}

void Document::highlight(std::optional<std::string_view> word) {
  for (auto& r : rows_) r.highlight(file_type_.highlight_options(), word);
}
