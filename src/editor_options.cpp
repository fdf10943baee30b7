#include "editor_options.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include "file_io.hpp"

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

void register_option_commands(CommandRegistry& registry, EditorOptions& opts, std::string& message) {
  registry.register_command("set color", [&opts, &message](const std::vector<std::string>& args){
    if (!parse_switch(args, opts.color, opts.color)) { message = "set color: use :set color on|off"; return; }
    message = opts.color ? "color on" : "color off";
  });
  registry.register_command("set number", [&opts, &message](const std::vector<std::string>& args){
    if (!parse_switch(args, opts.line_numbers, opts.line_numbers)) { message = "set number: use :set number on|off"; return; }
    message = opts.line_numbers ? "number on" : "number off";
  });
  registry.register_command("set statustimeout", [&opts, &message](const std::vector<std::string>& args){
    if (args.empty()) { message = "set statustimeout: use :set statustimeout <seconds>"; return; }
    const std::string& s = args[0];
    bool ok = !s.empty() && s.size() < 6 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { message = "set statustimeout: seconds must be a number"; return; }
    opts.status_timeout = std::stoi(s);
    message = "statustimeout=" + s;
  });
}

bool load_rc(const std::filesystem::path& path, const CommandRegistry& registry, std::string& message) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return false;
  std::vector<std::string> lines; std::string msg;
  if (!read_lines(path, lines, msg)) { message = msg; return false; }
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  for (std::string s : lines) {
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string unknown;
    if (!registry.execute_line(s, unknown)) message = "unknown command: " + unknown;
  }
  return true;
}
