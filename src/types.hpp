#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Speaker/Turn/SessionState/Cursor/Event).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string>

enum class Speaker { User, Assistant };

enum class SessionState { Uninitialized, Ready, Closed };

struct Turn {
  Speaker speaker = Speaker::Assistant;
  std::string text;
  bool notice = false; // welcome/reset text, rendered without a speaker prefix
};

struct Cursor { int row = 0; int col = 0; };

// set on a key that arrived as ESC followed by another byte (an Alt chord)
constexpr int kAltModifier = 0x10000;

struct Event {
  enum class Kind { Key, Resize, Tick };
  Kind kind = Kind::Tick;
  int key = 0;
  int rows = 0;
  int cols = 0;

  static Event key_press(int ch) { return Event{Kind::Key, ch, 0, 0}; }
  static Event resize(int r, int c) { return Event{Kind::Resize, 0, r, c}; }
  static Event tick() { return Event{}; }
};
