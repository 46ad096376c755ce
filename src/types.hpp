#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/CellPos/Viewport/SortMarker).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string>
#include <vector>

enum class Mode { Normal, Edit, Command, Search };

struct CellPos {
  int row = 0;
  int col = 0;
  bool operator==(const CellPos& o) const { return row == o.row && col == o.col; }
  bool operator!=(const CellPos& o) const { return !(*this == o); }
};

struct Viewport { int top_row = 0; int left_col = 0; };

// advisory only, never derived from the data
struct SortMarker { int col = 0; bool ascending = true; };

using Rows = std::vector<std::vector<std::string>>;
