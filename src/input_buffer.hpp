#pragma once
/*
 * InputBuffer
 *
 * Purpose: bounded multi-line editable text region (cursor, char limit, placeholder, blink).
 * Policy: the char limit is a soft cap; inserts past it are silently dropped.
 * Layout: width/height only affect wrapping and the visible window, never the data.
 */
#include <string>
#include <vector>
#include "types.hpp"
#include "config.hpp"

class InputBuffer {
public:
  explicit InputBuffer(int char_limit = IEA_DEFAULT_CHAR_LIMIT);

  bool insert(char c);
  bool insert_newline();
  void backspace();
  void delete_forward();
  void move_left();
  void move_right();
  void move_up();
  void move_down();
  void move_home();
  void move_end();
  bool handle_key(int ch);

  void clear();
  void set_value(const std::string& s);
  std::string value() const;
  int length() const;
  bool empty() const { return length() == 0; }

  void set_char_limit(int n);
  int char_limit() const { return char_limit_; }
  void set_width(int n);
  void set_height(int n);
  int width() const { return width_; }
  int height() const { return height_; }

  void set_placeholder(std::string p) { placeholder_ = std::move(p); }
  const std::string& placeholder() const { return placeholder_; }

  void blink() { cursor_visible_ = !cursor_visible_; }
  bool cursor_visible() const { return cursor_visible_; }
  Cursor cursor() const { return cur_; }

  std::vector<std::string> display_lines() const;
  Cursor cursor_position() const;

private:
  struct VisualRow { int line; int start; int len; };
  std::vector<VisualRow> visual_rows() const;
  int cursor_visual_row(const std::vector<VisualRow>& rows) const;
  void touch();
  void scroll_to_cursor();

  std::vector<std::string> lines_;
  Cursor cur_{};
  int char_limit_;
  int width_ = 80;
  int height_ = IEA_INPUT_ROWS;
  int top_ = 0;
  bool cursor_visible_ = true;
  std::string placeholder_ = "Ask me about Kubernetes deployment tasks...";
};
