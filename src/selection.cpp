#include "selection.hpp"
#include <algorithm>

bool is_single_cell(const Selection& sel) {
  const auto* r = std::get_if<CellRange>(&sel);
  return r && r->start == r->end;
}

std::optional<Bounds> normalized_bounds(const Selection& sel, const Grid& grid) {
  return std::visit(overloaded{
    [](const NoSelection&) -> std::optional<Bounds> { return std::nullopt; },
    [](const CellRange& r) -> std::optional<Bounds> {
      return Bounds{std::min(r.start.row, r.end.row), std::max(r.start.row, r.end.row),
                    std::min(r.start.col, r.end.col), std::max(r.start.col, r.end.col)};
    },
    [&grid](const ColumnSelection& c) -> std::optional<Bounds> {
      if (grid.empty() || c.col < 0) return std::nullopt;
      return Bounds{0, grid.row_count() - 1, c.col, c.col};
    },
    [&grid](const RowSelection& r) -> std::optional<Bounds> {
      int len = grid.row_length(r.row);
      if (len == 0) return std::nullopt;
      return Bounds{r.row, r.row, 0, len - 1};
    },
  }, sel);
}

bool contains(const Selection& sel, const Grid& grid, int row, int col) {
  auto b = normalized_bounds(sel, grid);
  if (!b) return false;
  return row >= b->min_row && row <= b->max_row && col >= b->min_col && col <= b->max_col;
}

CellPos paste_anchor(const Selection& sel) {
  return std::visit(overloaded{
    [](const NoSelection&) { return CellPos{0, 0}; },
    [](const CellRange& r) { return r.start; },
    [](const ColumnSelection& c) { return CellPos{0, c.col}; },
    [](const RowSelection& r) { return CellPos{r.row, 0}; },
  }, sel);
}

void clear_cells(const Selection& sel, Grid& grid) {
  auto b = normalized_bounds(sel, grid);
  if (!b) return;
  int last_row = std::min(b->max_row, grid.row_count() - 1);
  for (int r = std::max(0, b->min_row); r <= last_row; ++r) {
    int last_col = std::min(b->max_col, grid.row_length(r) - 1);
    for (int c = std::max(0, b->min_col); c <= last_col; ++c) {
      if (contains(sel, grid, r, c)) grid.set_cell(r, c, std::string());
    }
  }
}

std::optional<Selection> select_all(const Grid& grid) {
  if (grid.empty()) return std::nullopt;
  int cols = grid.col_count();
  if (cols == 0) return std::nullopt;
  return Selection{CellRange{{0, 0}, {grid.row_count() - 1, cols - 1}}};
}
