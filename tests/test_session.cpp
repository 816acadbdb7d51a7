#include "session.hpp"
#include "headless_terminal.hpp"
#include <ncurses.h>
#include <cassert>
#include <filesystem>
#include <string>
#include <unistd.h>

static constexpr int CTRL_S = 'S'-64;
static constexpr int CTRL_L = 'L'-64;
static constexpr int CTRL_C = 'C'-64;
static constexpr int CTRL_O = 'O'-64;

struct Fixture {
  HeadlessTerminal term{30, 100};
  RuleBasedGenerator gen{ResponseCatalog::defaults()};
  Settings settings;
  Session session{term, Keymap::defaults(), gen, settings};

  void key(int ch) { session.handle_event(Event::key_press(ch)); }
  void type(const std::string& s) { for (char c : s) key(c); }
  void start() { session.handle_event(Event::resize(30, 100)); }
};

static void test_lifecycle() {
  Fixture f;
  assert(f.session.state() == SessionState::Uninitialized);
  assert(!f.session.ready());
  assert(f.session.environment() == "local");
  assert(f.session.transcript().size() == 1);

  f.session.handle_event(Event::tick());
  assert(f.term.screen_contains("Loading..."));
  f.type("ignored");
  assert(f.session.input().empty());

  f.start();
  assert(f.session.state() == SessionState::Ready);
  assert(f.session.width() == 100 && f.session.height() == 30);
  assert(f.term.screen_contains("Innovation Engine Assistant"));
  assert(f.term.screen_contains("Welcome to the Innovation Engine Assistant!"));
  assert(f.term.screen_contains("Ask me about Kubernetes deployment tasks..."));
  assert(f.term.screen_contains("ctrl+s send query"));

  f.session.handle_event(Event::resize(40, 120));
  assert(f.session.state() == SessionState::Ready);
  assert(f.session.input().width() == 120 - 4);

  int frames = f.term.frames();
  f.key(CTRL_C);
  assert(f.session.state() == SessionState::Closed);
  assert(f.term.frames() == frames);
}

static void test_send() {
  Fixture f;
  f.start();
  f.key(CTRL_S);
  assert(f.session.transcript().size() == 1);
  std::string before = f.session.view().content();

  f.type("Create a deployment for my app");
  assert(f.session.input().value() == "Create a deployment for my app");
  f.key(CTRL_S);
  assert(f.session.transcript().size() == 3);
  assert(f.session.input().empty());
  const Turn& user = f.session.transcript().at(1);
  const Turn& bot = f.session.transcript().at(2);
  assert(user.speaker == Speaker::User && user.text == "Create a deployment for my app");
  assert(bot.speaker == Speaker::Assistant);
  assert(bot.text.find("kubectl create deployment") != std::string::npos);
  assert(bot.text.find("nginx:latest") != std::string::npos);
  assert(f.session.view().content() != before);
  assert(f.session.view().at_bottom());

  for (int i = 0; i < 4; ++i) {
    f.type("tell me about pods");
    f.key(CTRL_S);
  }
  assert(f.session.transcript().size() == 1 + 2 * 5);
  assert(f.session.view().content() == f.session.transcript().join());

  f.key(CTRL_S);
  assert(f.session.transcript().size() == 11);
}

static void test_multiline_query() {
  Fixture f;
  f.start();
  f.type("first line");
  f.key('\n');
  f.type("service please");
  f.key(CTRL_S);
  assert(f.session.transcript().at(1).text == "first line\nservice please");
  assert(f.session.transcript().at(2).text.find("kind: Service") != std::string::npos);
}

static void test_clear() {
  Fixture f;
  f.start();
  f.type("ingress");
  f.key(CTRL_S);
  f.type("half typed");
  f.key(CTRL_L);
  assert(f.session.transcript().size() == 1);
  assert(f.session.transcript().at(0).text == kClearedText);
  assert(f.session.view().content() == kClearedText);
  assert(f.session.input().value() == "half typed");
  assert(f.session.state() == SessionState::Ready);
}

static void test_quick_action() {
  Fixture f;
  f.start();
  f.key(KEY_F(1));
  assert(f.session.transcript().size() == 3);
  assert(f.session.transcript().at(1).text == "Create a deployment for my application");
  assert(f.session.transcript().at(2).text.find("kubectl create deployment") != std::string::npos);
  assert(f.session.input().empty());

  f.type("draft");
  f.key(KEY_F(2));
  assert(f.session.transcript().size() == 5);
  assert(f.session.transcript().at(4).text.find("kind: Service") != std::string::npos);
  assert(f.session.input().value() == "draft");
}

static void test_help_toggle_and_scroll() {
  Fixture f;
  f.start();
  int view_h = f.session.view().height();
  f.key(KEY_F(10));
  assert(f.session.show_full_help());
  assert(f.session.view().height() < view_h);
  assert(f.term.screen_contains("f1 deploy app"));
  f.key(KEY_F(10));
  assert(!f.session.show_full_help());
  assert(f.session.view().height() == view_h);

  f.key(KEY_F(3));
  assert(f.session.view().at_bottom());
  f.key(KEY_PPAGE);
  assert(!f.session.view().at_bottom());
  f.key(KEY_NPAGE);
  f.key(KEY_NPAGE);
  f.key(KEY_NPAGE);
  assert(f.session.view().at_bottom());
}

static void test_blink_tick() {
  Fixture f;
  f.start();
  assert(f.term.cursor_visible());
  f.session.handle_event(Event::tick());
  assert(!f.term.cursor_visible());
  f.session.handle_event(Event::tick());
  assert(f.term.cursor_visible());
}

static void test_export() {
  auto dir = std::filesystem::temp_directory_path() / ("ieassist_session_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  HeadlessTerminal term(30, 100);
  RuleBasedGenerator gen(ResponseCatalog::defaults());
  Settings settings;
  settings.working_directory = dir.string();
  settings.environment = "test-env";
  Session s(term, Keymap::defaults(), gen, settings);
  s.handle_event(Event::resize(30, 100));

  s.handle_event(Event::key_press(CTRL_O));
  assert(s.message() == "no document to save");

  s.handle_event(Event::key_press(KEY_F(3)));
  assert(s.message().empty());
  s.handle_event(Event::key_press(CTRL_O));
  assert(s.message().find("saved document") != std::string::npos);
  assert(std::filesystem::exists(dir / "setup-ingress-controller.md"));
  assert(term.screen_contains("saved document"));
  assert(term.screen_contains("[test-env]"));
  std::filesystem::remove_all(dir);
}

static void test_alt_chord_does_not_quit() {
  Fixture f;
  f.start();
  f.key(kAltModifier | 'x');
  assert(f.session.state() == SessionState::Ready);
  assert(f.session.input().empty());
  f.key(27);
  assert(f.session.state() == SessionState::Closed);
}

static void test_run_loop() {
  Fixture f;
  f.term.push(Event::resize(30, 100));
  f.term.push(Event::key_press('h'));
  f.term.push(Event::key_press('i'));
  f.term.push(Event::key_press(CTRL_S));
  f.term.push(Event::key_press(27));
  f.session.run();
  assert(f.session.state() == SessionState::Closed);
  assert(f.session.transcript().size() == 3);
  assert(f.session.transcript().at(1).text == "hi");
}

int main() {
  test_lifecycle();
  test_send();
  test_multiline_query();
  test_clear();
  test_quick_action();
  test_help_toggle_and_scroll();
  test_blink_tick();
  test_export();
  test_alt_chord_does_not_quit();
  test_run_loop();
  return 0;
}
