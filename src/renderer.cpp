#include "renderer.hpp"
#include <algorithm>

static std::string clip(const std::string& s, int width) {
  if (width <= 0) return std::string();
  return static_cast<int>(s.size()) > width ? s.substr(0, static_cast<size_t>(width)) : s;
}

static void draw_box(ITerminal& term, const Rect& r, int pair) {
  if (r.height < 2 || r.width < 2) return;
  std::string edge = "+" + std::string(static_cast<size_t>(r.width - 2), '-') + "+";
  term.draw_colored(r.row, r.col, edge, pair);
  for (int i = 1; i < r.height - 1; ++i) {
    term.draw_colored(r.row + i, r.col, "|", pair);
    term.draw_colored(r.row + i, r.col + r.width - 1, "|", pair);
  }
  term.draw_colored(r.row + r.height - 1, r.col, edge, pair);
}

static void render_title(ITerminal& term, const Rect& r, const std::string& title, const std::string& env) {
  std::string text = env.empty() ? title : title + "  [" + env + "]";
  text = clip(text, r.width);
  int pad = std::max(0, (r.width - static_cast<int>(text.size())) / 2);
  std::string bar(static_cast<size_t>(std::max(0, r.width)), ' ');
  bar.replace(static_cast<size_t>(pad), text.size(), text);
  term.draw_reverse(r.row, r.col, bar);
}

void Renderer::render(ITerminal& term, const FrameInfo& frame) {
  term.clear();
  if (!frame.ready || !frame.view || !frame.input) {
    term.draw_text(0, 0, "Loading...");
    term.show_cursor(false);
    term.refresh();
    return;
  }
  const ScreenLayout& l = frame.layout;
  render_title(term, l.title, frame.title, frame.environment);

  draw_box(term, l.transcript, kPairText);
  Rect tv = inner(l.transcript);
  auto lines = frame.view->visible_lines();
  for (int i = 0; i < static_cast<int>(lines.size()) && i < tv.height; ++i) {
    term.draw_text(tv.row + i, tv.col, clip(lines[i], tv.width));
  }

  draw_box(term, l.input, kPairBorder);
  Rect iv = inner(l.input);
  const InputBuffer& in = *frame.input;
  if (in.empty()) {
    term.draw_colored(iv.row, iv.col, clip(in.placeholder(), iv.width), kPairBorder);
  } else {
    auto rows = in.display_lines();
    for (int i = 0; i < static_cast<int>(rows.size()) && i < iv.height; ++i) {
      term.draw_text(iv.row + i, iv.col, clip(rows[i], iv.width));
    }
  }

  if (!frame.message.empty()) term.draw_text(l.status.row, l.status.col, clip(frame.message, l.status.width));
  for (int i = 0; i < static_cast<int>(frame.help.size()) && i < l.help.height; ++i) {
    term.draw_text(l.help.row + i, l.help.col, clip(frame.help[i], l.help.width));
  }

  Cursor c = in.cursor_position();
  term.move_cursor(iv.row + std::clamp(c.row, 0, std::max(0, iv.height - 1)),
                   iv.col + std::clamp(c.col, 0, std::max(0, iv.width - 1)));
  term.show_cursor(in.cursor_visible());
  term.refresh();
}
