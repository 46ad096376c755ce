#include "search_index.hpp"
#include "grid.hpp"
#include <cassert>

int main() {
  assert(contains_substring("abcabd", "abd"));
  assert(!contains_substring("abc", ""));
  assert(!contains_substring("ab", "abc"));
  assert(fold_case("MiXeD") == "mixed");

  Grid g(Rows{{"Apple", "pear"}, {"banana", "APPLE pie"}, {"", "apple"}});
  SearchIndex si;
  assert(!si.current());
  assert(!si.next());

  si.perform(g, "apple", false);
  assert(si.results().size() == 3);
  assert(si.results()[0] == (CellPos{0, 0}));
  assert(si.results()[1] == (CellPos{1, 1}));
  assert(si.results()[2] == (CellPos{2, 1}));
  assert(si.current() == (CellPos{0, 0}));
  assert(si.next() == (CellPos{1, 1}));
  assert(si.next() == (CellPos{2, 1}));
  assert(si.next() == (CellPos{0, 0}));
  assert(si.prev() == (CellPos{2, 1}));

  si.perform(g, "apple", true);
  assert(si.results().size() == 1);
  assert(si.current_index() == 0);
  assert(si.case_sensitive());

  si.perform(g, "", false);
  assert(si.results().empty());
  si.perform(g, "kiwi", false);
  assert(si.results().empty());
  assert(!si.prev());
  si.clear();
  assert(si.query().empty());
  return 0;
}
