#include "input_buffer.hpp"
#include <ncurses.h>
#include <algorithm>

static constexpr int TAB_WIDTH = 2;

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// bytes a UTF-8 sequence starting with c occupies
static int sequence_length(unsigned char c) {
  if (c >= 0xF0) return 4;
  if (c >= 0xE0) return 3;
  if (c >= 0xC0) return 2;
  return 1;
}

static int prev_boundary(const std::string& s, int col) {
  --col;
  while (col > 0 && is_continuation(static_cast<unsigned char>(s[col]))) --col;
  return col;
}

static int next_boundary(const std::string& s, int col) {
  ++col;
  while (col < static_cast<int>(s.size()) && is_continuation(static_cast<unsigned char>(s[col]))) ++col;
  return col;
}

InputBuffer::InputBuffer(int char_limit) : lines_{std::string()}, char_limit_(std::max(1, char_limit)) {}

int InputBuffer::length() const {
  int n = 0;
  for (const auto& l : lines_) n += static_cast<int>(l.size());
  return n + static_cast<int>(lines_.size()) - 1;
}

std::string InputBuffer::value() const {
  std::string out;
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += lines_[i];
  }
  return out;
}

void InputBuffer::touch() {
  cursor_visible_ = true;
  scroll_to_cursor();
}

bool InputBuffer::insert(char c) {
  if (c == '\n') return insert_newline();
  auto& s = lines_[cur_.row];
  unsigned char u = static_cast<unsigned char>(c);
  if (is_continuation(u)) {
    // only continues a sequence whose lead byte made it in
    if (cur_.col == 0 || static_cast<unsigned char>(s[cur_.col - 1]) < 0x80 || length() >= char_limit_) return false;
  } else if (length() + sequence_length(u) > char_limit_) {
    return false;
  }
  s.insert(s.begin() + cur_.col, c);
  cur_.col++;
  touch();
  return true;
}

bool InputBuffer::insert_newline() {
  if (length() >= char_limit_) return false;
  auto& s = lines_[cur_.row];
  std::string tail = s.substr(cur_.col);
  s.erase(cur_.col);
  lines_.insert(lines_.begin() + cur_.row + 1, tail);
  cur_.row++;
  cur_.col = 0;
  touch();
  return true;
}

void InputBuffer::backspace() {
  if (cur_.col > 0) {
    int from = prev_boundary(lines_[cur_.row], cur_.col);
    lines_[cur_.row].erase(from, cur_.col - from);
    cur_.col = from;
  } else if (cur_.row > 0) {
    // join with previous line
    int prev_len = static_cast<int>(lines_[cur_.row - 1].size());
    lines_[cur_.row - 1] += lines_[cur_.row];
    lines_.erase(lines_.begin() + cur_.row);
    cur_.row--;
    cur_.col = prev_len;
  }
  touch();
}

void InputBuffer::delete_forward() {
  auto& s = lines_[cur_.row];
  if (cur_.col < static_cast<int>(s.size())) {
    s.erase(cur_.col, next_boundary(s, cur_.col) - cur_.col);
  } else if (cur_.row + 1 < static_cast<int>(lines_.size())) {
    s += lines_[cur_.row + 1];
    lines_.erase(lines_.begin() + cur_.row + 1);
  }
  touch();
}

void InputBuffer::move_left() {
  if (cur_.col > 0) cur_.col = prev_boundary(lines_[cur_.row], cur_.col);
  else if (cur_.row > 0) { cur_.row--; cur_.col = static_cast<int>(lines_[cur_.row].size()); }
  touch();
}

void InputBuffer::move_right() {
  if (cur_.col < static_cast<int>(lines_[cur_.row].size())) cur_.col = next_boundary(lines_[cur_.row], cur_.col);
  else if (cur_.row + 1 < static_cast<int>(lines_.size())) { cur_.row++; cur_.col = 0; }
  touch();
}

void InputBuffer::move_up() {
  if (cur_.row > 0) { cur_.row--; cur_.col = std::min(cur_.col, static_cast<int>(lines_[cur_.row].size())); }
  touch();
}

void InputBuffer::move_down() {
  if (cur_.row + 1 < static_cast<int>(lines_.size())) { cur_.row++; cur_.col = std::min(cur_.col, static_cast<int>(lines_[cur_.row].size())); }
  touch();
}

void InputBuffer::move_home() { cur_.col = 0; touch(); }
void InputBuffer::move_end() { cur_.col = static_cast<int>(lines_[cur_.row].size()); touch(); }

bool InputBuffer::handle_key(int ch) {
  switch (ch) {
    case '\n': case '\r': case KEY_ENTER: insert_newline(); return true;
    case KEY_BACKSPACE: case 127: case 8: backspace(); return true;
    case KEY_DC: delete_forward(); return true;
    case KEY_LEFT: move_left(); return true;
    case KEY_RIGHT: move_right(); return true;
    case KEY_UP: move_up(); return true;
    case KEY_DOWN: move_down(); return true;
    case KEY_HOME: move_home(); return true;
    case KEY_END: move_end(); return true;
    case '\t':
      for (int i = 0; i < TAB_WIDTH; ++i) insert(' ');
      return true;
    default: break;
  }
  // printable ASCII, plus raw UTF-8 bytes as getch() delivers them
  if ((ch >= 32 && ch <= 126) || (ch >= 0x80 && ch <= 0xFF)) {
    insert(static_cast<char>(ch));
    return true;
  }
  return false;
}

void InputBuffer::clear() {
  lines_.assign(1, std::string());
  cur_ = Cursor{};
  top_ = 0;
  cursor_visible_ = true;
}

void InputBuffer::set_value(const std::string& s) {
  clear();
  for (size_t i = 0; i < s.size();) {
    size_t n = s[i] == '\n' ? 1 : std::min(s.size() - i, static_cast<size_t>(sequence_length(static_cast<unsigned char>(s[i]))));
    if (length() + static_cast<int>(n) > char_limit_) break;
    for (size_t k = 0; k < n; ++k) insert(s[i + k]);
    i += n;
  }
}

void InputBuffer::set_char_limit(int n) {
  char_limit_ = std::max(1, n);
}

void InputBuffer::set_width(int n) {
  width_ = std::max(1, n);
  scroll_to_cursor();
}

void InputBuffer::set_height(int n) {
  height_ = std::max(1, n);
  scroll_to_cursor();
}

std::vector<InputBuffer::VisualRow> InputBuffer::visual_rows() const {
  std::vector<VisualRow> rows;
  for (int i = 0; i < static_cast<int>(lines_.size()); ++i) {
    int len = static_cast<int>(lines_[i].size());
    int start = 0;
    do {
      int end = std::min(len, start + width_);
      // never split a UTF-8 sequence across rows
      while (end < len && end > start + 1 && is_continuation(static_cast<unsigned char>(lines_[i][end]))) --end;
      rows.push_back({i, start, end - start});
      start = end;
    } while (start < len);
    // cursor parked after a full-width line needs a row of its own
    if (i == cur_.row && len > 0 && rows.back().len == width_ && cur_.col == len) rows.push_back({i, len, 0});
  }
  return rows;
}

int InputBuffer::cursor_visual_row(const std::vector<VisualRow>& rows) const {
  for (int r = 0; r < static_cast<int>(rows.size()); ++r) {
    const auto& v = rows[r];
    if (v.line != cur_.row) continue;
    bool last_of_line = (r + 1 == static_cast<int>(rows.size())) || rows[r + 1].line != cur_.row;
    if (cur_.col < v.start + v.len || last_of_line) return r;
  }
  return 0;
}

void InputBuffer::scroll_to_cursor() {
  auto rows = visual_rows();
  int r = cursor_visual_row(rows);
  if (r < top_) top_ = r;
  if (r >= top_ + height_) top_ = r - height_ + 1;
  int max_top = std::max(0, static_cast<int>(rows.size()) - height_);
  top_ = std::clamp(top_, 0, max_top);
}

std::vector<std::string> InputBuffer::display_lines() const {
  std::vector<std::string> out;
  auto rows = visual_rows();
  for (int r = top_; r < static_cast<int>(rows.size()) && r < top_ + height_; ++r) {
    const auto& v = rows[r];
    out.push_back(lines_[v.line].substr(v.start, v.len));
  }
  return out;
}

Cursor InputBuffer::cursor_position() const {
  auto rows = visual_rows();
  int r = cursor_visual_row(rows);
  int col = 0;
  const auto& line = lines_[cur_.row];
  for (int k = rows[r].start; k < cur_.col && k < static_cast<int>(line.size()); ++k) {
    if (!is_continuation(static_cast<unsigned char>(line[k]))) ++col;
  }
  return Cursor{r - top_, std::min(col, width_ - 1)};
}
