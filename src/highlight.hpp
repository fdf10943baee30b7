#pragma once
/*
 * Highlight
 *
 * Purpose: per-grapheme classification tags and their render markers.
 * Marker: ANSI SGR foreground (ESC[38;5;<n>m), reset is ESC[39m.
 */
#include <string>

enum class Highlight {
  None,
  Number,
  Match,
  String,
  Character,
  Comment,
  PrimaryKeyword,
  SecondaryKeyword,
};

inline constexpr int kHighlightKinds = 8;

// xterm-256 palette index used for each tag.
inline int highlight_color(Highlight h) {
  switch (h) {
    case Highlight::Number: return 203;
    case Highlight::Match: return 39;
    case Highlight::String: return 149;
    case Highlight::Character: return 215;
    case Highlight::Comment: return 245;
    case Highlight::PrimaryKeyword: return 220;
    case Highlight::SecondaryKeyword: return 80;
    case Highlight::None: break;
  }
  return 252;
}

inline std::string highlight_marker(Highlight h) {
  return "\x1b[38;5;" + std::to_string(highlight_color(h)) + "m";
}

inline const char* highlight_reset_marker() { return "\x1b[39m"; }
