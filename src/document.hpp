#pragma once
/*
 * Document
 *
 * Purpose: ordered rows of one file plus name, file type and dirty flag.
 * Owns: all structural edits (insert/newline/remove), search and re-highlighting.
 * Rule: every edit re-highlights the touched rows before returning.
 * Errors: open/save report through (ok, msg); out-of-range positions are no-ops.
 * insert: "\n", "\r" and "\r\n" split the row; empty text or text embedding a
 *         terminator is ignored and leaves the dirty flag alone.
 */
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include "file_type.hpp"
#include "row.hpp"
#include "types.hpp"

class Document {
public:
  Document() = default;
  explicit Document(const std::filesystem::path& file_name);

  static Document open(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool save(std::string& msg);

  const Row* row(std::size_t index) const;
  std::size_t len() const { return rows_.size(); }
  bool is_empty() const { return rows_.empty(); }
  bool is_dirty() const { return dirty_; }
  const std::string& file_type_name() const { return file_type_.name(); }
  const std::optional<std::filesystem::path>& file_name() const { return file_name_; }
  void set_file_name(const std::filesystem::path& name) { file_name_ = name; }

  void insert(const Position& at, std::string_view ch);
  void insert_newline(const Position& at);
  void remove(const Position& at);

  std::optional<Position> find(std::string_view query, const Position& at, SearchDirection direction) const;
  void highlight(std::optional<std::string_view> word);

private:
  void highlight_row(Row& r) { r.highlight(file_type_.highlight_options(), std::nullopt); }

  std::vector<Row> rows_;
  std::optional<std::filesystem::path> file_name_;
  FileType file_type_;
  bool dirty_ = false;
};
