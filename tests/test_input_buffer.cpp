#include "input_buffer.hpp"
#include <ncurses.h>
#include <cassert>
#include <string>

static void test_limit_is_soft_cap() {
  InputBuffer b;
  assert(b.char_limit() == 500);
  for (int i = 0; i < 700; ++i) b.insert('a');
  assert(b.length() == 500);
  assert(b.value() == std::string(500, 'a'));
  assert(!b.insert('b'));
  assert(!b.insert_newline());
  assert(b.handle_key('c')); // consumed, silently dropped
  assert(b.length() == 500);
}

static void test_small_limit_counts_newlines() {
  InputBuffer b(3);
  b.insert('a');
  b.insert_newline();
  b.insert('b');
  assert(b.value() == "a\nb");
  assert(b.length() == 3);
  b.insert('c');
  assert(b.value() == "a\nb");
}

static void test_editing() {
  InputBuffer b;
  for (char c : std::string("hello")) b.handle_key(c);
  b.handle_key(KEY_LEFT);
  b.handle_key(KEY_LEFT);
  b.handle_key('X');
  assert(b.value() == "helXlo");
  b.handle_key(KEY_BACKSPACE);
  assert(b.value() == "hello");
  b.handle_key(KEY_HOME);
  b.handle_key(KEY_DC);
  assert(b.value() == "ello");
  b.handle_key(KEY_END);
  b.handle_key('\n');
  b.handle_key('w');
  assert(b.value() == "ello\nw");
  assert(b.cursor().row == 1 && b.cursor().col == 1);
  b.handle_key(KEY_HOME);
  b.handle_key(127);
  assert(b.value() == "ellow");
  assert(b.cursor().row == 0 && b.cursor().col == 4);
  assert(!b.handle_key(KEY_F(12)));
  assert(b.value() == "ellow");
}

static void test_clear_and_set_value() {
  InputBuffer b(10);
  b.set_value("0123456789abc");
  assert(b.value() == "0123456789");
  b.clear();
  assert(b.empty());
  assert(b.value().empty());
  assert(b.cursor().row == 0 && b.cursor().col == 0);
}

static void test_wrapping_window() {
  InputBuffer b;
  b.set_width(4);
  b.set_height(2);
  b.set_value("abcdefghij");
  auto lines = b.display_lines();
  assert(lines.size() == 2);
  assert(lines[0] == "efgh");
  assert(lines[1] == "ij");
  Cursor c = b.cursor_position();
  assert(c.row == 1 && c.col == 2);

  b.set_width(20);
  lines = b.display_lines();
  assert(lines.size() == 1);
  assert(lines[0] == "abcdefghij");
  assert(b.value() == "abcdefghij");
}

static void test_blink() {
  InputBuffer b;
  assert(b.cursor_visible());
  b.blink();
  assert(!b.cursor_visible());
  b.insert('x');
  assert(b.cursor_visible());
}

static void test_utf8_bytes() {
  InputBuffer b;
  // getch() hands over "é" as two bytes
  assert(b.handle_key(0xC3));
  assert(b.handle_key(0xA9));
  assert(b.handle_key('x'));
  assert(b.value() == "\xC3\xA9x");
  assert(b.cursor_position().col == 2);
  b.move_left();
  b.move_left();
  assert(b.cursor().col == 0);
  b.move_right();
  assert(b.cursor().col == 2);
  b.backspace();
  assert(b.value() == "x");
  b.move_end();
  b.backspace();
  assert(b.empty());

  // a sequence that does not fit is dropped whole, stray continuation bytes too
  InputBuffer small(2);
  small.handle_key('a');
  small.handle_key(0xC3);
  small.handle_key(0xA9);
  assert(small.value() == "a");
  small.set_value("\xC3\xA9!");
  assert(small.value() == "\xC3\xA9");

  // wrapping never splits a sequence
  InputBuffer w;
  w.set_width(3);
  w.set_value("ab\xC3\xA9");
  auto lines = w.display_lines();
  assert(lines.size() == 2);
  assert(lines[0] == "ab");
  assert(lines[1] == "\xC3\xA9");
  assert(w.cursor_position().row == 1 && w.cursor_position().col == 1);
}

int main() {
  test_limit_is_soft_cap();
  test_small_limit_counts_newlines();
  test_editing();
  test_clear_and_set_value();
  test_wrapping_window();
  test_blink();
  test_utf8_bytes();
  return 0;
}
