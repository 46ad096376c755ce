#include "column_widths.hpp"
#include "grid.hpp"
#include "config.hpp"
#include <cassert>

int main() {
  ColumnWidths w(12);
  assert(w.get(4) == 12);
  w.set(1, 20);
  assert(w.has(1));
  assert(w.get(1) == 20);
  w.set(2, 1);
  assert(w.get(2) == MG_MIN_COLUMN_WIDTH);

  // insert a column at 1: the entry for column 1 moves to 2
  Grid g(Rows{{"a", "b"}, {"c", "d"}});
  ColumnWidths ws(12);
  ws.set(1, 30);
  ws.set(0, 5);
  assert(g.insert_column_at(1));
  ws.on_column_inserted(1);
  assert(g.cell(0, 1).empty() && g.cell(1, 1).empty());
  assert(g.cell(0, 2) == "b");
  assert(!ws.has(1));
  assert(ws.get(2) == 30);
  assert(ws.get(0) == 5);

  ws.on_column_removed(0);
  assert(ws.get(1) == 30);
  assert(!ws.has(2));
  assert(ws.size() == 1);
  ws.clear();
  assert(ws.size() == 0);
  return 0;
}
