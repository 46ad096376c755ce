#include "grid.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_blank_and_normalize() {
  Grid g = Grid::blank(20, 10);
  assert(g.row_count() == 20);
  assert(g.col_count() == 10);
  assert(g.is_rectangular());

  Grid r(Rows{{"a"}, {"b", "c", "d"}, {}});
  assert(!r.is_rectangular());
  r.normalize();
  assert(r.is_rectangular());
  assert(r.row_length(0) == 3);
  assert(r.row_length(2) == 3);
  assert(r.cell(1, 2) == "d");
  Grid once = r;
  r.normalize();
  assert(r == once);
}

static void test_out_of_range_access() {
  Grid g(Rows{{"a", "b"}});
  assert(g.cell(5, 5).empty());
  assert(g.cell(-1, 0).empty());
  g.set_cell(3, 0, "x");
  assert(g.row_count() == 1);
  assert(!g.has_cell(0, 2));
}

static void test_structural_ops() {
  Grid g(Rows{{"a", "b"}, {"c", "d"}});
  g.add_row();
  assert(g.row_count() == 3);
  assert(g.row_length(2) == 2);
  g.add_column();
  assert(g.col_count() == 3);
  assert(g.is_rectangular());

  assert(g.insert_row_at(0));
  assert(g.cell(1, 0) == "a");
  assert(g.insert_row_at(g.row_count()));
  assert(!g.insert_row_at(g.row_count() + 1));
  assert(!g.insert_row_at(-1));

  assert(g.insert_column_at(1));
  assert(g.cell(1, 0) == "a");
  assert(g.cell(1, 1).empty());
  assert(g.cell(1, 2) == "b");
  assert(!g.insert_column_at(g.col_count() + 1));

  int rows = g.row_count();
  assert(g.delete_row(0));
  assert(g.row_count() == rows - 1);
  assert(!g.delete_row(g.row_count()));
  assert(g.delete_column(1));
  assert(g.cell(0, 1) == "b");
  assert(!g.delete_column(g.col_count()));
}

static void test_empty_grid_growth() {
  Grid g;
  assert(g.empty());
  assert(g.col_count() == 0);
  g.add_column();
  assert(g.row_count() == 1 && g.col_count() == 1);

  Grid h;
  h.add_row();
  assert(h.row_length(0) == 10);

  Grid e;
  e.ensure_cell(1, 2);
  assert(e.row_count() == 2);
  assert(e.row_length(1) == 3);
}

static void test_column_names() {
  assert(column_name(0) == "A");
  assert(column_name(25) == "Z");
  assert(column_name(26) == "AA");
  assert(column_name(27) == "AB");
  assert(column_name(-1).empty());
  assert(parse_column_name("A") == 0);
  assert(parse_column_name("aa") == 26);
  assert(parse_column_name("3") == 2);
  assert(!parse_column_name("0"));
  assert(!parse_column_name(""));
  assert(!parse_column_name("A1"));
}

int main() {
  test_blank_and_normalize();
  test_out_of_range_access();
  test_structural_ops();
  test_empty_grid_growth();
  test_column_names();
  return 0;
}
