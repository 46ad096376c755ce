#include "selection.hpp"
#include "grid.hpp"
#include <cassert>

static void test_reversed_corners() {
  Grid g = Grid::blank(3, 3);
  Selection s = CellRange{{2, 2}, {0, 0}};
  assert(contains(s, g, 1, 1));
  assert(contains(s, g, 0, 0));
  assert(contains(s, g, 2, 2));
  auto b = normalized_bounds(s, g);
  assert(b && *b == (Bounds{0, 2, 0, 2}));
  assert(paste_anchor(Selection{CellRange{{1, 1}, {0, 0}}}) == (CellPos{1, 1}));
}

static void test_row_and_column() {
  Grid g(Rows{{"a"}, {"b"}, {"c"}, {"d", "e", "f"}});
  Selection row = RowSelection{3};
  assert(contains(row, g, 3, 0));
  assert(contains(row, g, 3, 2));
  assert(!contains(row, g, 3, 3));
  assert(!contains(row, g, 2, 0));

  Selection col = ColumnSelection{0};
  for (int r = 0; r < 4; ++r) assert(contains(col, g, r, 0));
  assert(!contains(col, g, 0, 1));
  assert(!normalized_bounds(col, Grid()));
  assert(!normalized_bounds(Selection{RowSelection{9}}, g));

  assert(!contains(Selection{NoSelection{}}, g, 0, 0));
  assert(paste_anchor(row) == (CellPos{3, 0}));
  assert(paste_anchor(col) == (CellPos{0, 0}));
  assert(paste_anchor(Selection{NoSelection{}}) == (CellPos{0, 0}));
}

static void test_clear_and_select_all() {
  Grid g(Rows{{"a", "b"}, {"c", "d"}});
  clear_cells(Selection{ColumnSelection{1}}, g);
  assert(g.cell(0, 1).empty() && g.cell(1, 1).empty());
  assert(g.cell(0, 0) == "a");
  clear_cells(Selection{CellRange{{0, 0}, {5, 5}}}, g);
  assert(g.cell(1, 0).empty());
  assert(g.row_count() == 2);

  auto all = select_all(Grid::blank(4, 3));
  assert(all && *all == (Selection{CellRange{{0, 0}, {3, 2}}}));
  assert(!select_all(Grid()));
  assert(is_single_cell(single_cell(1, 1)));
  assert(!is_single_cell(Selection{RowSelection{0}}));
}

int main() {
  test_reversed_corners();
  test_row_and_column();
  test_clear_and_select_all();
  return 0;
}
