#pragma once
/*
 * Layout
 *
 * Purpose: split the terminal into title / transcript box / input box / status / help rows.
 * Note: boxes include their one-cell border; inner() gives the drawable area.
 */

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct ScreenLayout {
  Rect title;
  Rect transcript; // bordered
  Rect input;      // bordered
  Rect status;
  Rect help;
};

Rect inner(const Rect& box);
ScreenLayout compute_layout(int rows, int cols, int input_rows, int help_rows);
