#pragma once
/*
 * EditorOptions
 *
 * Purpose: run-time options and the "set" commands that change them.
 * Source: ~/.xedrc, one command per line (leading ':' optional; #, " and // comment lines).
 */
#include <string>
#include <filesystem>
#include "cmd_registry.hpp"
#include "config.hpp"

struct EditorOptions {
  bool color = true;
  bool line_numbers = false;
  int status_timeout = XED_STATUS_TIMEOUT_SEC;
};

void register_option_commands(CommandRegistry& registry, EditorOptions& opts, std::string& message);

// Runs every command line of the rc file; message keeps the last diagnostic.
bool load_rc(const std::filesystem::path& path, const CommandRegistry& registry, std::string& message);
