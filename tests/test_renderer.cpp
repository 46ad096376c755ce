#include "renderer.hpp"
#include "headless_terminal.hpp"
#include "session.hpp"
#include <cassert>
#include <string>

static void test_basic_frame() {
  Session s;
  s.load_rows(Rows{{"hello", "abcdefghijklmnop"}, {"a", "b"}}, std::nullopt);
  HeadlessTerminal term(24, 80);
  Renderer r;
  Viewport vp;
  s.select_cell(1, 0);
  r.render(term, s, vp, Mode::Normal, "saved", "");
  assert(term.line(0).substr(3, 12) == "     A     |");
  assert(term.attr_at(0, 3) == '1');
  assert(term.line(1).substr(0, 3) == " 1 ");
  assert(term.line(1).substr(3, 12) == "hello      |");
  assert(term.line(1).substr(15, 12) == "abcdefghijk|");
  assert(term.attr_at(2, 3) == 'R');
  assert(term.attr_at(1, 3) == ' ');
  const std::string& status = term.line(23);
  assert(status.rfind("NORMAL", 0) == 0);
  assert(status.find("[no file]") != std::string::npos);
  assert(status.find("A2") != std::string::npos);
  assert(status.find("2x2") != std::string::npos);
  assert(status.find("| saved") != std::string::npos);
  assert(!term.cursor_visible());
  assert(term.refresh_count() == 1);

  s.set_column_width(0, 5);
  r.render(term, s, vp, Mode::Normal, "", "");
  assert(term.line(1).substr(3, 5) == "hell|");
  assert(r.last_layout().columns[1].x == 8);
}

static void test_markers_and_edit() {
  Session s;
  s.load_rows(Rows{{"2"}, {"1"}}, std::nullopt);
  s.sort_by_column(0, true);
  HeadlessTerminal term(10, 40);
  Renderer r;
  Viewport vp;
  r.render(term, s, vp, Mode::Normal, "", "");
  assert(term.line(0).find("A^") != std::string::npos);

  s.select_column(0);
  r.render(term, s, vp, Mode::Normal, "", "");
  assert(term.attr_at(0, 3) == 'R');
  assert(term.attr_at(1, 3) == 'R');
  assert(term.attr_at(2, 3) == 'R');

  s.select_row(1);
  r.render(term, s, vp, Mode::Normal, "", "");
  assert(term.attr_at(2, 0) == 'R');
  assert(term.attr_at(1, 0) == ' ');

  s.begin_edit(0, 0);
  s.type_text("5");
  r.render(term, s, vp, Mode::Edit, "", "");
  assert(term.line(1).substr(3, 2) == "15");
  assert(term.cursor_visible());
  assert(term.cursor_row() == 1);
  assert(term.cursor_col() == 5);
  assert(term.line(9).rfind("EDIT", 0) == 0);

  r.render(term, s, vp, Mode::Command, "", "wq");
  assert(term.line(9).rfind(":wq", 0) == 0);
  assert(term.cursor_row() == 9 && term.cursor_col() == 3);
}

static void test_frozen_header() {
  Session s;
  s.load_rows(Rows{{"name"}, {"x"}, {"y"}}, std::nullopt);
  s.set_frozen_header(true);
  HeadlessTerminal term(10, 40);
  Renderer r;
  Viewport vp;
  r.render(term, s, vp, Mode::Normal, "", "");
  assert(term.line(1).substr(3, 4) == "name");
  assert(term.attr_at(1, 3) == '3');
  assert(term.line(2).substr(3, 1) == "x");
  assert(Renderer::screen_row_of(r.last_layout(), 0) == 1);
  assert(Renderer::screen_row_of(r.last_layout(), 1) == 2);
  assert(term.line(9).find("[header]") != std::string::npos);
}

static void test_scroll_and_hit_test() {
  Session s;
  HeadlessTerminal term(10, 80);
  Renderer r;
  Viewport vp;
  s.select_cell(15, 0);
  r.render(term, s, vp, Mode::Normal, "", "");
  assert(vp.top_row == 8);
  assert(term.line(1).substr(0, 3) == " 9 ");
  assert(term.line(8).substr(0, 3) == "16 ");
  const GridLayout& l = r.last_layout();

  HitTarget h = Renderer::hit_test(l, s, 8, 4);
  assert(h.kind == HitTarget::Kind::Cell && h.row == 15 && h.col == 0);
  h = Renderer::hit_test(l, s, 0, 0);
  assert(h.kind == HitTarget::Kind::Corner);
  h = Renderer::hit_test(l, s, 0, 16);
  assert(h.kind == HitTarget::Kind::ColumnHeader && h.col == 1);
  h = Renderer::hit_test(l, s, 3, 1);
  assert(h.kind == HitTarget::Kind::RowGutter && h.row == 10);
  h = Renderer::hit_test(l, s, 9, 4);
  assert(h.kind == HitTarget::Kind::None);

  s.select_cell(0, 9);
  r.render(term, s, vp, Mode::Normal, "", "");
  assert(vp.top_row == 0);
  bool visible = false;
  for (const auto& span : r.last_layout().columns) if (span.col == 9 && span.x + span.width <= 80) visible = true;
  assert(visible);
}

int main() {
  test_basic_frame();
  test_markers_and_edit();
  test_frozen_header();
  test_scroll_and_hit_test();
  return 0;
}
