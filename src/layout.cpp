#include "layout.hpp"
#include <algorithm>

static constexpr int MARGIN = 1;

Rect inner(const Rect& box) {
  return Rect{box.row + 1, box.col + 1, std::max(0, box.height - 2), std::max(0, box.width - 2)};
}

ScreenLayout compute_layout(int rows, int cols, int input_rows, int help_rows) {
  ScreenLayout l;
  int box_w = std::max(3, cols - 2 * MARGIN);
  int input_h = std::max(1, input_rows) + 2;
  help_rows = std::max(0, help_rows);
  // title + blank line + status line are fixed
  int fixed = 3 + input_h + help_rows;
  int transcript_h = std::max(3, rows - fixed);

  int r = 0;
  l.title = Rect{r, 0, 1, std::max(0, cols)};
  r += 2;
  l.transcript = Rect{r, MARGIN, transcript_h, box_w};
  r += transcript_h;
  l.input = Rect{r, MARGIN, input_h, box_w};
  r += input_h;
  l.status = Rect{r, MARGIN, 1, box_w};
  r += 1;
  l.help = Rect{r, MARGIN, help_rows, box_w};
  return l;
}
