#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, events).
 * Goal: decouple Session/Renderer from ncurses; HeadlessTerminal drives the tests.
 */
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_reverse(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
  virtual Event poll_event() = 0;
};

// color pairs understood by every backend
constexpr int kPairText = 2;
constexpr int kPairBorder = 1;
