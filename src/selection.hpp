#pragma once
/*
 * Selection
 *
 * Purpose: closed sum type over {none, cell range, whole column, whole row}
 *          plus geometry (bounds/containment) and clearing against a Grid.
 * Note: a single selected cell is CellRange{start == end}; corners may come in any order.
 */
#include <optional>
#include <variant>
#include "types.hpp"
#include "grid.hpp"

struct NoSelection {
  bool operator==(const NoSelection&) const { return true; }
};
struct CellRange {
  CellPos start;
  CellPos end;
  bool operator==(const CellRange& o) const { return start == o.start && end == o.end; }
};
struct ColumnSelection {
  int col = 0;
  bool operator==(const ColumnSelection& o) const { return col == o.col; }
};
struct RowSelection {
  int row = 0;
  bool operator==(const RowSelection& o) const { return row == o.row; }
};

using Selection = std::variant<NoSelection, CellRange, ColumnSelection, RowSelection>;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// inclusive on both ends
struct Bounds {
  int min_row = 0;
  int max_row = 0;
  int min_col = 0;
  int max_col = 0;
  bool operator==(const Bounds& o) const {
    return min_row == o.min_row && max_row == o.max_row && min_col == o.min_col && max_col == o.max_col;
  }
};

inline Selection single_cell(int row, int col) { return CellRange{{row, col}, {row, col}}; }
bool is_single_cell(const Selection& sel);

// Row/Column span the grid's extent on the other axis; nullopt when nothing is addressable
std::optional<Bounds> normalized_bounds(const Selection& sel, const Grid& grid);
bool contains(const Selection& sel, const Grid& grid, int row, int col);

// top-left anchor used by paste; (0,0) for no selection
CellPos paste_anchor(const Selection& sel);

void clear_cells(const Selection& sel, Grid& grid);

// nullopt on an empty grid or a grid with zero columns
std::optional<Selection> select_all(const Grid& grid);
