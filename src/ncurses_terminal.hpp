#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and key/resize/tick events.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(int tick_ms);
  ~NcursesTerminal() override = default;
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reverse(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  Event poll_event() override;
private:
  int tick_ms_;
  bool initial_resize_sent_ = false;
};
