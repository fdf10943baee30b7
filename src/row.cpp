#include "row.hpp"
#include <algorithm>
#include <cctype>
#include "config.hpp"
#include "grapheme.hpp"

static inline bool is_ascii(std::string_view g) { return g.size() == 1 && static_cast<unsigned char>(g[0]) < 128; }
static inline bool is_digit(std::string_view g) { return is_ascii(g) && std::isdigit(static_cast<unsigned char>(g[0])) != 0; }
static inline bool is_separator(std::string_view g) {
  if (!is_ascii(g)) return false;
  unsigned char c = static_cast<unsigned char>(g[0]);
  if (c == '_') return false;
  return std::isspace(c) != 0 || std::ispunct(c) != 0;
}

Row::Row(std::string_view s) : string_(s), len_(grapheme_count(s)) {}

std::string Row::render(std::size_t start, std::size_t end) const {
  end = std::min(end, len_);
  start = std::min(start, end);
  std::string result;
  auto g = split_graphemes(string_);
  Highlight current = Highlight::None;
  for (std::size_t i = start; i < end && i < g.size(); ++i) {
    Highlight h = i < highlighting_.size() ? highlighting_[i] : Highlight::None;
    if (h != current) {
      current = h;
      result += highlight_marker(h);
    }
    if (g[i] == "\t") result.push_back(XED_TAB_RENDER);
    else result.append(g[i]);
  }
  result += highlight_reset_marker();
  return result;
}

void Row::insert(std::size_t at, std::string_view ch) {
  if (at >= len_) {
    string_.append(ch);
  } else {
    // rebuild around the cluster start; the new code point may merge with a neighbour
    auto b = grapheme_bounds(string_);
    string_.insert(b[at], ch);
  }
  len_ = grapheme_count(string_);
}

void Row::remove(std::size_t at) {
  if (at >= len_) return;
  auto b = grapheme_bounds(string_);
  if (at + 1 >= b.size()) return;
  string_.erase(b[at], b[at + 1] - b[at]);
  len_ = grapheme_count(string_);
}

void Row::append(const Row& other) {
  string_ += other.string_;
  len_ = grapheme_count(string_);
}

Row Row::split(std::size_t at) {
  at = std::min(at, len_);
  auto b = grapheme_bounds(string_);
  Row tail(std::string_view(string_).substr(b[at]));
  string_.resize(b[at]);
  len_ = grapheme_count(string_);
  highlighting_.clear();
  return tail;
}

std::optional<std::size_t> Row::find(std::string_view query, std::size_t at, SearchDirection direction) const {
  if (query.empty()) return std::nullopt;
  auto b = grapheme_bounds(string_);
  std::size_t from = direction == SearchDirection::Forward ? b[std::min(at, len_)] : 0;
  // occurrences starting inside a cluster are skipped
  for (std::size_t byte = string_.find(query, from); byte != std::string::npos;
       byte = string_.find(query, byte + 1)) {
    auto it = std::lower_bound(b.begin(), b.end(), byte);
    if (it == b.end() || *it != byte) continue;
    std::size_t idx = static_cast<std::size_t>(it - b.begin());
    if (idx >= len_) return std::nullopt;
    return idx;
  }
  return std::nullopt;
}

void Row::highlight(const HighlightOptions& opts, std::optional<std::string_view> word) {
  auto b = grapheme_bounds(string_);
  std::size_t n = b.size() - 1;
  auto g = [&](std::size_t i) { return std::string_view(string_).substr(b[i], b[i + 1] - b[i]); };
  auto starts_with_at = [&](std::size_t i, std::string_view s) {
    return string_.compare(b[i], s.size(), s) == 0 && b[i] + s.size() <= string_.size();
  };
  // first cluster index whose start is at or past byte offset e
  auto cluster_at_byte = [&](std::size_t e) {
    return static_cast<std::size_t>(std::lower_bound(b.begin(), b.end(), e) - b.begin());
  };
  auto mark = [&](std::size_t count, Highlight h) { highlighting_.insert(highlighting_.end(), count, h); };

  highlighting_.clear();
  highlighting_.reserve(n);
  std::size_t i = 0;
  while (i < n) {
    std::string_view cur = g(i);
    bool prev_sep = i == 0 || is_separator(g(i - 1));
    Highlight prev = i > 0 ? highlighting_[i - 1] : Highlight::None;

    if (opts.numbers && ((is_digit(cur) && (prev_sep || prev == Highlight::Number)) ||
                         (cur == "." && prev == Highlight::Number))) {
      mark(1, Highlight::Number);
      ++i;
      continue;
    }

    if (opts.strings && cur == "\"") {
      bool in_string = true;
      mark(1, Highlight::String);
      ++i;
      while (in_string && i < n) {
        std::string_view c = g(i);
        if (c == "\\" && i + 1 < n) {
          mark(2, Highlight::String);
          i += 2;
          continue;
        }
        mark(1, Highlight::String);
        ++i;
        if (c == "\"") in_string = false;
      }
      continue;
    }

    if (opts.characters && cur == "'") {
      std::size_t lit = 0;
      if (i + 2 < n && g(i + 1) != "\\" && g(i + 2) == "'") lit = 3;
      else if (i + 3 < n && g(i + 1) == "\\" && g(i + 3) == "'") lit = 4;
      if (lit > 0) {
        mark(lit, Highlight::Character);
        i += lit;
        continue;
      }
    }

    if (opts.comments && !opts.comment_start.empty() && starts_with_at(i, opts.comment_start)) {
      // inside a comment until end of row
      mark(n - i, Highlight::Comment);
      break;
    }

    if (prev_sep) {
      auto keyword_end = [&](const std::vector<std::string>& words) -> std::size_t {
        for (const auto& w : words) {
          if (w.empty() || !starts_with_at(i, w)) continue;
          std::size_t j = cluster_at_byte(b[i] + w.size());
          if (j > n || b[j] != b[i] + w.size()) continue;
          if (j == n || is_separator(g(j))) return j;
        }
        return 0;
      };
      if (std::size_t j = keyword_end(opts.primary_keywords); j > i) {
        mark(j - i, Highlight::PrimaryKeyword);
        i = j;
        continue;
      }
      if (std::size_t j = keyword_end(opts.secondary_keywords); j > i) {
        mark(j - i, Highlight::SecondaryKeyword);
        i = j;
        continue;
      }
    }

    if (word && !word->empty() && starts_with_at(i, *word)) {
      std::size_t j = std::min(cluster_at_byte(b[i] + word->size()), n);
      mark(j - i, Highlight::Match);
      i = j;
      continue;
    }

    mark(1, Highlight::None);
    ++i;
  }
}
