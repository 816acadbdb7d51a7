#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::clear() {
  grid_.assign(static_cast<size_t>(rows_ > 0 ? rows_ : 0), std::string(static_cast<size_t>(cols_ > 0 ? cols_ : 0), ' '));
}

void HeadlessTerminal::set_size(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_ || col < 0) return;
  std::string& line = grid_[static_cast<size_t>(row)];
  for (size_t i = 0; i < text.size(); ++i) {
    size_t c = static_cast<size_t>(col) + i;
    if (c >= line.size()) break;
    line[c] = text[i];
  }
}

Event HeadlessTerminal::poll_event() {
  if (events_.empty()) return Event::tick();
  Event e = events_.front();
  events_.pop_front();
  return e;
}

bool HeadlessTerminal::screen_contains(const std::string& needle) const {
  for (const auto& line : grid_) {
    if (line.find(needle) != std::string::npos) return true;
  }
  return false;
}
