#pragma once
/*
 * Keymap
 *
 * Purpose: fixed table of key chords -> Action, plus short/full help projections.
 * Design: resolved once per key event with fixed precedence
 *         Quit > Clear > Send > QuickAction[1..N] > the rest.
 * Note: pure lookups; built by Keymap::defaults() and injected into Session.
 */
#include <optional>
#include <string>
#include <vector>

struct KeyBinding {
  std::vector<int> keys;
  std::string help_key;
  std::string help_desc;
  bool matches(int ch) const;
};

struct Action {
  enum class Kind { Quit, Clear, Send, QuickAction, ToggleHelp, Export, ScrollUp, ScrollDown };
  Kind kind = Kind::Send;
  int index = 0; // quick action slot (0-based), only meaningful for QuickAction
  bool operator==(const Action& o) const { return kind == o.kind && index == o.index; }
};

struct QuickActionBinding {
  KeyBinding binding;
  std::string query;
};

class Keymap {
public:
  static Keymap defaults();

  std::optional<Action> resolve(int ch) const;
  const std::string& quick_query(int index) const;
  int quick_action_count() const { return static_cast<int>(quick.size()); }

  std::vector<KeyBinding> short_help() const;
  std::vector<std::vector<KeyBinding>> full_help() const;
  std::vector<std::string> help_lines(bool full, int width) const;

  KeyBinding quit;
  KeyBinding clear;
  KeyBinding send;
  std::vector<QuickActionBinding> quick;
  KeyBinding toggle_help;
  KeyBinding export_doc;
  KeyBinding scroll_up;
  KeyBinding scroll_down;
};
