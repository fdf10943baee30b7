#include "file_type.hpp"
#include <initializer_list>
#include <utility>

static HighlightOptions code_options(std::vector<std::string> primary,
                                     std::vector<std::string> secondary,
                                     std::string comment_start = "//") {
  HighlightOptions o;
  o.numbers = true;
  o.strings = true;
  o.characters = true;
  o.comments = true;
  o.comment_start = std::move(comment_start);
  o.primary_keywords = std::move(primary);
  o.secondary_keywords = std::move(secondary);
  return o;
}

static FileType rust_type() {
  return FileType("rust", code_options(
    {"as", "break", "const", "continue", "crate", "else", "enum", "extern", "false", "fn", "for",
     "if", "impl", "in", "let", "loop", "match", "mod", "move", "mut", "pub", "ref", "return",
     "self", "Self", "static", "struct", "super", "trait", "true", "type", "unsafe", "use",
     "where", "while", "dyn", "abstract", "become", "box", "do", "final", "macro", "override",
     "priv", "typeof", "unsized", "virtual", "yield", "async", "await", "try"},
    {"bool", "char", "i8", "i16", "i32", "i64", "isize", "u8", "u16", "u32", "u64", "usize",
     "f32", "f64"}));
}

static FileType python_type() {
  return FileType("python3", code_options(
    {"class", "def", "else", "for", "if", "global", "while", "return", "pass", "import", "try",
     "except", "finally", "async", "await", "elif", "raise", "with"},
    {"True", "False", "None", "and", "as", "assert", "break", "continue", "del", "from", "in",
     "is", "lambda", "nonlocal", "not", "or", "yield"},
    "#"));
}

static FileType go_type() {
  return FileType("golang", code_options(
    {"break", "default", "func", "interface", "select", "case", "defer", "go", "map", "struct",
     "chan", "else", "goto", "package", "switch", "const", "fallthrough", "if", "range", "type",
     "continue", "for", "import", "return", "var"},
    {"bool", "string", "int", "int8", "int16", "int32", "int64", "uint", "uint8", "uint16",
     "uint32", "uint64", "uintptr", "byte", "rune", "float32", "float64", "complex64",
     "complex128"}));
}

static FileType cxx_type() {
  return FileType("c++", code_options(
    {"if", "else", "for", "while", "do", "return", "switch", "case", "default", "break",
     "continue", "struct", "class", "public", "private", "protected", "const", "constexpr",
     "static", "enum", "sizeof", "typedef", "namespace", "using", "new", "delete", "true",
     "false", "nullptr", "template", "typename", "virtual", "override", "inline", "include"},
    {"void", "int", "char", "float", "double", "long", "short", "signed", "unsigned", "bool",
     "auto", "size_t"}));
}

static FileType bash_type() {
  return FileType("bash", code_options(
    {"if", "then", "else", "elif", "fi", "for", "in", "do", "done", "case", "esac", "while",
     "until", "function", "return"},
    {"local", "export", "readonly", "echo", "exit", "set", "shift", "source"},
    "#"));
}

FileType::FileType() : name_("No filetype") {}

FileType::FileType(std::string name, HighlightOptions opts)
  : name_(std::move(name)), opts_(std::move(opts)) {}

FileType FileType::from_name(std::string_view file_name) {
  auto ends_with_any = [file_name](std::initializer_list<std::string_view> suffixes) {
    for (auto sfx : suffixes) if (file_name.ends_with(sfx)) return true;
    return false;
  };
  if (ends_with_any({".rs"})) return rust_type();
  if (ends_with_any({".py"})) return python_type();
  if (ends_with_any({".go"})) return go_type();
  if (ends_with_any({".c", ".h", ".cc", ".cpp", ".cxx", ".hpp", ".hxx"})) return cxx_type();
  if (ends_with_any({".sh", ".bash"})) return bash_type();
  return FileType();
}
