#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records: a character grid per frame, cursor position/visibility, frame count.
 * Events: queued with push(); an empty queue yields Tick events.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reverse(int row, int col, const std::string& text) override { draw_text(row, col, text); }
  void draw_colored(int row, int col, const std::string& text, int) override { draw_text(row, col, text); }
  void move_cursor(int row, int col) override { cursor_ = Cursor{row, col}; }
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { frames_++; }
  Event poll_event() override;

  void push(const Event& e) { events_.push_back(e); }
  void set_size(int rows, int cols);

  const std::string& row_text(int r) const { return grid_.at(static_cast<size_t>(r)); }
  bool screen_contains(const std::string& needle) const;
  int frames() const { return frames_; }
  Cursor cursor() const { return cursor_; }
  bool cursor_visible() const { return cursor_visible_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::deque<Event> events_;
  Cursor cursor_{};
  bool cursor_visible_ = true;
  int frames_ = 0;
};
