#pragma once
/*
 * FileType
 *
 * Purpose: immutable highlighting rules selected by file name suffix.
 * Match: case-sensitive suffix of the whole name, so ".rs" alone is rust and "X.RS" is not.
 * Usage: FileType::from_name(path) is pure; replace the value, never mutate it.
 */
#include <string>
#include <string_view>
#include <vector>

struct HighlightOptions {
  bool numbers = false;
  bool strings = false;
  bool characters = false;
  bool comments = false;
  std::string comment_start = "//";
  std::vector<std::string> primary_keywords;
  std::vector<std::string> secondary_keywords;
};

class FileType {
public:
  FileType();
  FileType(std::string name, HighlightOptions opts);

  static FileType from_name(std::string_view file_name);

  const std::string& name() const { return name_; }
  const HighlightOptions& highlight_options() const { return opts_; }

private:
  std::string name_;
  HighlightOptions opts_;
};
