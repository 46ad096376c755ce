#include "ncurses_terminal.hpp"
#include <cstdio>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() != OK) bg_color_ = COLOR_BLACK;
    init_pair(kPairHeader, header_color_, bg_color_);
    init_pair(kPairDefault, -1, bg_color_);
    init_pair(kPairFrozen, COLOR_YELLOW, bg_color_);
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(kPairDefault));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(kPairDefault));
}

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  if (move(row, col) == ERR) return;
  clrtoeol();
}

void NcursesTerminal::set_mouse_tracking(bool on) {
  if (on) {
    mouseinterval(0);
    mousemask(BUTTON1_PRESSED | BUTTON1_RELEASED | REPORT_MOUSE_POSITION, nullptr);
    // button-event tracking so drags report motion
    std::printf("\033[?1002h");
  } else {
    mousemask(0, nullptr);
    std::printf("\033[?1002l");
  }
  std::fflush(stdout);
}
