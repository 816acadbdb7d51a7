#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal(int tick_ms) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  // getch() returns ERR after tick_ms; the session turns that into a blink tick
  timeout(tick_ms);
}

Terminal::~Terminal() {
  curs_set(1);
  endwin();
}
