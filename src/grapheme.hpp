#pragma once
/*
 * Grapheme
 *
 * Purpose: split UTF-8 text into extended grapheme clusters (UAX #29) via ICU.
 * Usage: grapheme_bounds(s) gives byte offsets of every cluster start plus s.size().
 * Note: invalid input never fails. If ICU cannot build an iterator the bounds fall back to
 *       code points, which is not grapheme-correct (a base plus combining mark counts as two).
 */
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

// Byte offsets of cluster starts, terminated by s.size(); {0} for empty text.
std::vector<std::size_t> grapheme_bounds(std::string_view s);

std::size_t grapheme_count(std::string_view s);

// UTF-8 code point starts plus s.size(); stray continuation bytes join the previous point.
std::vector<std::size_t> codepoint_bounds(std::string_view s);

std::vector<std::string_view> split_graphemes(std::string_view s);
