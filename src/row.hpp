#pragma once
/*
 * Row
 *
 * Purpose: one line of UTF-8 text plus a parallel per-grapheme highlight array.
 * Columns: every index is a grapheme-cluster index, never a byte offset.
 * Note: mutators leave highlighting stale; the owner calls highlight() after each edit.
 */
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>
#include "file_type.hpp"
#include "highlight.hpp"
#include "types.hpp"

class Row {
public:
  Row() = default;
  explicit Row(std::string_view s);

  std::string render(std::size_t start, std::size_t end) const;

  std::size_t len() const { return len_; }
  bool is_empty() const { return len_ == 0; }
  const std::string& text() const { return string_; }
  std::string_view as_bytes() const { return string_; }
  const std::vector<Highlight>& highlighting() const { return highlighting_; }

  void insert(std::size_t at, std::string_view ch);
  void remove(std::size_t at);
  void append(const Row& other);
  Row split(std::size_t at);

  std::optional<std::size_t> find(std::string_view query, std::size_t at, SearchDirection direction) const;

  void highlight(const HighlightOptions& opts, std::optional<std::string_view> word);

private:
  std::string string_;
  std::vector<Highlight> highlighting_;
  std::size_t len_ = 0;
};
