#include "sorter.hpp"
#include "grid.hpp"
#include <cassert>

static void test_numeric() {
  Grid g(Rows{{"3"}, {"1"}, {"2"}});
  sort_rows_by_column(g, 0, true, false);
  assert(g == Grid(Rows{{"1"}, {"2"}, {"3"}}));
  sort_rows_by_column(g, 0, false, false);
  assert(g == Grid(Rows{{"3"}, {"2"}, {"1"}}));

  Grid n(Rows{{"10"}, {"9"}, {"-1.5"}, {"+2"}});
  sort_rows_by_column(n, 0, true, false);
  assert(n == Grid(Rows{{"-1.5"}, {"+2"}, {"9"}, {"10"}}));
}

static void test_mixed() {
  Grid g(Rows{{"b"}, {"a"}, {"10"}, {"2"}});
  sort_rows_by_column(g, 0, true, false);
  assert(g == Grid(Rows{{"2"}, {"10"}, {"a"}, {"b"}}));
  Grid again = g;
  sort_rows_by_column(again, 0, true, false);
  assert(again == g);
}

static void test_frozen_header_and_stability() {
  Grid g(Rows{{"name", "n"}, {"x", "2"}, {"y", "1"}, {"z", "2"}});
  sort_rows_by_column(g, 1, true, true);
  assert(g.cell(0, 0) == "name");
  assert(g.cell(1, 0) == "y");
  assert(g.cell(2, 0) == "x");
  assert(g.cell(3, 0) == "z");
  sort_rows_by_column(g, 1, false, true);
  assert(g.cell(0, 0) == "name");
  assert(g.cell(1, 0) == "x");
  assert(g.cell(2, 0) == "z");
  assert(g.cell(3, 0) == "y");

  Grid empty;
  sort_rows_by_column(empty, 0, true, true);
  assert(empty.empty());
}

static void test_parse_number() {
  assert(parse_number("42") == 42.0);
  assert(parse_number("+3") == 3.0);
  assert(parse_number("-0.5") == -0.5);
  assert(!parse_number(""));
  assert(!parse_number("+"));
  assert(!parse_number("+-1"));
  assert(!parse_number("12abc"));
  assert(!parse_number(" 1"));
  assert(compare_cells("2", "10") < 0);
  assert(compare_cells("2", "a") < 0);
  assert(compare_cells("b", "a") > 0);
  assert(compare_cells("1.0", "1") == 0);
}

int main() {
  test_numeric();
  test_mixed();
  test_frozen_header_and_stability();
  test_parse_number();
  return 0;
}
