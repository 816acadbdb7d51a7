#pragma once
/*
 * Session
 *
 * Purpose: the event loop and state machine (Uninitialized -> Ready -> Closed).
 * Owns: transcript, input buffer, transcript view; borrows terminal and generator.
 * Flow: one Event in -> state mutated -> full frame redrawn (except after Quit).
 */
#include <string>
#include "iterminal.hpp"
#include "input_buffer.hpp"
#include "keymap.hpp"
#include "layout.hpp"
#include "renderer.hpp"
#include "response_generator.hpp"
#include "settings.hpp"
#include "transcript.hpp"
#include "transcript_view.hpp"
#include "types.hpp"

class Session {
public:
  Session(ITerminal& term, Keymap keymap, const ResponseGenerator& generator, const Settings& settings);

  void run();
  void handle_event(const Event& e);
  void dispatch(const Action& a);

  SessionState state() const { return state_; }
  bool ready() const { return state_ != SessionState::Uninitialized; }
  int width() const { return width_; }
  int height() const { return height_; }
  const std::string& environment() const { return environment_; }
  const std::string& message() const { return message_; }
  void set_message(std::string m) { message_ = std::move(m); }
  bool show_full_help() const { return show_full_help_; }
  const Transcript& transcript() const { return transcript_; }
  const InputBuffer& input() const { return input_; }
  const TranscriptView& view() const { return view_; }
  const ScreenLayout& layout() const { return layout_; }

private:
  void on_resize(int rows, int cols);
  void on_key(int ch);
  void submit(const std::string& query);
  void clear_transcript();
  void export_document();
  void relayout();
  void refresh_view();
  void render();

  ITerminal& term_;
  Keymap keymap_;
  const ResponseGenerator& generator_;
  Renderer renderer_;
  std::string environment_;
  std::string working_directory_;
  SessionState state_ = SessionState::Uninitialized;
  int width_ = 0;
  int height_ = 0;
  bool show_full_help_ = false;
  std::string message_;
  Transcript transcript_;
  InputBuffer input_;
  TranscriptView view_;
  ScreenLayout layout_{};
};
