#include "terminal.hpp"
#include <locale.h>
#include <cstdio>
#include "config.hpp"

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  timeout(MG_INPUT_POLL_MS);
  ESCDELAY = 25;
  // the grid draws its own cursor cell; the hardware cursor shows only while editing
  curs_set(0);
}

Terminal::~Terminal() {
  // drop button-event tracking in case the editor enabled it
  mousemask(0, nullptr);
  std::printf("\033[?1002l");
  std::fflush(stdout);
  curs_set(1);
  endwin();
}
