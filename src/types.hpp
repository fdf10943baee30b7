#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Position/SearchDirection/Mode).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

enum class Mode { View, Insert };

enum class SearchDirection { Forward, Backward };

// x is a grapheme column, y a row index.
struct Position {
  std::size_t x = 0;
  std::size_t y = 0;
  bool operator==(const Position&) const = default;
};

struct Viewport { std::size_t top_line = 0; std::size_t left_col = 0; };
