#include "ncurses_terminal.hpp"

NcursesTerminal::NcursesTerminal(int tick_ms) : tick_ms_(tick_ms) {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kPairBorder, COLOR_BLUE, -1); // input border: default background
      init_pair(kPairText, -1, -1);
    } else {
      init_pair(kPairBorder, COLOR_BLUE, COLOR_BLACK); // fallback
      init_pair(kPairText, COLOR_WHITE, COLOR_BLACK);
    }
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(kPairText));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(kPairText));
}

void NcursesTerminal::draw_reverse(int row, int col, const std::string& text) {
  attron(A_REVERSE | A_BOLD);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE | A_BOLD);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

Event NcursesTerminal::poll_event() {
  // ncurses only reports later size changes; the first one is synthesized
  if (!initial_resize_sent_) {
    initial_resize_sent_ = true;
    TermSize sz = getSize();
    return Event::resize(sz.rows, sz.cols);
  }
  int ch = getch();
  if (ch == ERR) return Event::tick();
  if (ch == KEY_RESIZE) {
    TermSize sz = getSize();
    return Event::resize(sz.rows, sz.cols);
  }
  if (ch == 27) {
    // a bare ESC is quit; ESC with a byte already queued behind it is an Alt chord
    nodelay(stdscr, TRUE);
    int next = getch();
    timeout(tick_ms_);
    if (next != ERR) return Event::key_press(kAltModifier | next);
  }
  return Event::key_press(ch);
}
