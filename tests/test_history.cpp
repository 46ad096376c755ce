#include "history.hpp"
#include "grid.hpp"
#include <cassert>
#include <string>

static Grid grid_with(const std::string& v) { return Grid(Rows{{v}}); }

int main() {
  {
    History h(50);
    Grid g = grid_with("0");
    for (int i = 1; i <= 51; ++i) {
      h.save(g);
      g.set_cell(0, 0, std::to_string(i));
    }
    assert(h.undo_size() == 50);
    // the oldest snapshot ("0") was evicted
    while (h.undo(g)) {}
    assert(g.cell(0, 0) == "1");
    assert(h.redo_size() == 50);
  }
  {
    History h(50);
    Grid g = grid_with("a");
    h.save(g);
    g.set_cell(0, 0, "b");
    h.save(g);
    g.set_cell(0, 0, "c");
    assert(h.undo(g));
    assert(g.cell(0, 0) == "b");
    assert(h.undo(g));
    assert(g.cell(0, 0) == "a");
    assert(!h.undo(g));
    assert(h.redo(g));
    assert(g.cell(0, 0) == "b");
    assert(h.redo(g));
    assert(g.cell(0, 0) == "c");
    assert(!h.redo(g));
    assert(h.undo_size() + h.redo_size() == 2);

    assert(h.undo(g));
    assert(h.can_redo());
    h.save(g);
    g.set_cell(0, 0, "z");
    assert(!h.can_redo());
    assert(h.last_entry() && h.last_entry()->cell(0, 0) == "b");
  }
  {
    History h(0);
    assert(h.limit() == 1);
    Grid g;
    h.save(g);
    h.save(g);
    assert(h.undo_size() == 1);
    h.clear();
    assert(!h.can_undo() && !h.can_redo());
  }
  return 0;
}
