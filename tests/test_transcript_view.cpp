#include "transcript.hpp"
#include "transcript_view.hpp"
#include <cassert>
#include <string>

static void test_transcript_join() {
  Transcript t;
  assert(t.size() == 1);
  assert(t.at(0).notice);
  assert(t.last_assistant_document() == nullptr);
  t.append(Speaker::User, "hi");
  t.append(Speaker::Assistant, "# Doc");
  assert(t.size() == 3);
  std::string joined = t.join();
  assert(joined.rfind(kWelcomeText, 0) == 0);
  assert(joined.find("\n\nYou: hi\n\nAssistant: # Doc") != std::string::npos);
  assert(t.last_assistant_document()->text == "# Doc");

  t.reset(kClearedText);
  assert(t.size() == 1);
  assert(t.join() == kClearedText);
  assert(t.last_assistant_document() == nullptr);
}

static std::string numbered_lines(int n) {
  std::string s;
  for (int i = 0; i < n; ++i) {
    if (i > 0) s += "\n";
    s += "line" + std::to_string(i);
  }
  return s;
}

static void test_scroll_and_bottom() {
  TranscriptView v(10, 4);
  v.set_content(numbered_lines(10));
  assert(v.line_count() == 10);
  assert(v.offset() == 0);
  v.scroll_to_bottom();
  assert(v.at_bottom());
  auto vis = v.visible_lines();
  assert(vis.size() == 4);
  assert(vis.back() == "line9");
  v.scroll_down(100);
  assert(v.offset() == 6);
  v.scroll_up(100);
  assert(v.offset() == 0);
  v.page_down();
  assert(v.offset() == 3);
}

static void test_wrap_and_resize() {
  TranscriptView v(5, 3);
  v.set_content("abcdefghijkl\n\nxy");
  assert(v.line_count() == 5); // abcde fghij kl "" xy
  v.scroll_to_bottom();
  v.resize(20, 3);
  assert(v.line_count() == 3);
  assert(v.at_bottom());
  assert(v.content() == "abcdefghijkl\n\nxy");

  TranscriptView w(10, 2);
  w.set_content(numbered_lines(20));
  w.scroll_down(10);
  assert(w.offset() == 10);
  w.resize(5, 2); // each "lineNN" wraps to two rows
  assert(w.line_count() == 30);
  assert(w.offset() == 15);
}

static void test_set_content_is_full_replace() {
  TranscriptView v(10, 3);
  v.set_content(numbered_lines(10));
  v.scroll_to_bottom();
  v.set_content("short");
  assert(v.content() == "short");
  assert(v.line_count() == 1);
  assert(v.offset() == 0);
  assert(v.visible_lines().size() == 1);
}

int main() {
  test_transcript_join();
  test_scroll_and_bottom();
  test_wrap_and_resize();
  test_set_content_is_full_replace();
  return 0;
}
