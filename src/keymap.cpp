#include "keymap.hpp"
#include <ncurses.h>
#include <algorithm>
#include <stdexcept>

static constexpr int CTRL_C = 'C'-64;
static constexpr int CTRL_L = 'L'-64;
static constexpr int CTRL_O = 'O'-64;
static constexpr int CTRL_S = 'S'-64;
static constexpr int ESC = 27;

bool KeyBinding::matches(int ch) const {
  return std::find(keys.begin(), keys.end(), ch) != keys.end();
}

Keymap Keymap::defaults() {
  Keymap k;
  k.send = {{CTRL_S}, "ctrl+s", "send query"};
  k.quit = {{CTRL_C, ESC}, "ctrl+c/esc", "quit"};
  k.clear = {{CTRL_L}, "ctrl+l", "clear"};
  k.quick = {
    {{{KEY_F(1)}, "f1", "deploy app"}, "Create a deployment for my application"},
    {{{KEY_F(2)}, "f2", "create service"}, "Create a Kubernetes service"},
    {{{KEY_F(3)}, "f3", "setup ingress"}, "Set up ingress controller"},
    {{{KEY_F(4)}, "f4", "add storage"}, "I need persistent storage for my application"},
  };
  k.toggle_help = {{KEY_F(10)}, "f10", "more help"};
  k.export_doc = {{CTRL_O}, "ctrl+o", "save document"};
  k.scroll_up = {{KEY_PPAGE}, "pgup", "scroll up"};
  k.scroll_down = {{KEY_NPAGE}, "pgdn", "scroll down"};
  return k;
}

std::optional<Action> Keymap::resolve(int ch) const {
  if (quit.matches(ch)) return Action{Action::Kind::Quit, 0};
  if (clear.matches(ch)) return Action{Action::Kind::Clear, 0};
  if (send.matches(ch)) return Action{Action::Kind::Send, 0};
  for (size_t i = 0; i < quick.size(); ++i) {
    if (quick[i].binding.matches(ch)) return Action{Action::Kind::QuickAction, static_cast<int>(i)};
  }
  if (toggle_help.matches(ch)) return Action{Action::Kind::ToggleHelp, 0};
  if (export_doc.matches(ch)) return Action{Action::Kind::Export, 0};
  if (scroll_up.matches(ch)) return Action{Action::Kind::ScrollUp, 0};
  if (scroll_down.matches(ch)) return Action{Action::Kind::ScrollDown, 0};
  return std::nullopt;
}

const std::string& Keymap::quick_query(int index) const {
  if (index < 0 || index >= quick_action_count()) throw std::out_of_range("quick action index");
  return quick[static_cast<size_t>(index)].query;
}

std::vector<KeyBinding> Keymap::short_help() const {
  return {send, clear, quit, toggle_help};
}

std::vector<std::vector<KeyBinding>> Keymap::full_help() const {
  std::vector<KeyBinding> quick_group;
  for (const auto& q : quick) quick_group.push_back(q.binding);
  return {
    {send, clear, quit},
    quick_group,
    {export_doc, scroll_up, scroll_down, toggle_help},
  };
}

static std::string join_bindings(const std::vector<KeyBinding>& bs) {
  std::string out;
  for (const auto& b : bs) {
    if (!out.empty()) out += " | ";
    out += b.help_key + " " + b.help_desc;
  }
  return out;
}

std::vector<std::string> Keymap::help_lines(bool full, int width) const {
  std::vector<std::string> out;
  if (full) {
    for (const auto& group : full_help()) out.push_back(join_bindings(group));
  } else {
    out.push_back(join_bindings(short_help()));
  }
  if (width >= 0) {
    for (auto& l : out) if (static_cast<int>(l.size()) > width) l.resize(static_cast<size_t>(width));
  }
  return out;
}
