#include "session.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "markdown.hpp"

Session::Session(ITerminal& term, Keymap keymap, const ResponseGenerator& generator, const Settings& settings)
  : term_(term),
    keymap_(std::move(keymap)),
    generator_(generator),
    environment_(settings.environment),
    working_directory_(settings.working_directory),
    show_full_help_(settings.show_full_help),
    input_(settings.char_limit) {
  view_.set_content(transcript_.join());
}

void Session::run() {
  IEA_LOG_INFO("session started, environment=" + environment_);
  while (state_ != SessionState::Closed) {
    handle_event(term_.poll_event());
  }
  IEA_LOG_INFO("session closed");
}

void Session::handle_event(const Event& e) {
  switch (e.kind) {
    case Event::Kind::Resize: on_resize(e.rows, e.cols); break;
    case Event::Kind::Tick: input_.blink(); break;
    case Event::Kind::Key: on_key(e.key); break;
  }
  if (state_ != SessionState::Closed) render();
}

void Session::on_resize(int rows, int cols) {
  if (rows <= 0 || cols <= 0) return;
  height_ = rows;
  width_ = cols;
  relayout();
  if (state_ == SessionState::Uninitialized) {
    refresh_view();
    state_ = SessionState::Ready;
    IEA_LOG_INFO("ready at " + std::to_string(cols) + "x" + std::to_string(rows));
  } else {
    IEA_LOG_DEBUG("resized to " + std::to_string(cols) + "x" + std::to_string(rows));
  }
}

void Session::on_key(int ch) {
  auto action = keymap_.resolve(ch);
  if (state_ == SessionState::Uninitialized) {
    // nothing is sized yet; only quitting makes sense
    if (action && action->kind == Action::Kind::Quit) dispatch(*action);
    return;
  }
  if (action) { dispatch(*action); return; }
  input_.handle_key(ch);
}

void Session::dispatch(const Action& a) {
  switch (a.kind) {
    case Action::Kind::Quit:
      state_ = SessionState::Closed;
      IEA_LOG_INFO("quit requested");
      break;
    case Action::Kind::Clear:
      clear_transcript();
      break;
    case Action::Kind::Send:
      if (!input_.empty()) {
        std::string query = input_.value();
        submit(query);
        input_.clear();
      }
      break;
    case Action::Kind::QuickAction:
      if (a.index >= 0 && a.index < keymap_.quick_action_count()) submit(keymap_.quick_query(a.index));
      break;
    case Action::Kind::ToggleHelp:
      show_full_help_ = !show_full_help_;
      if (ready()) relayout();
      break;
    case Action::Kind::Export:
      export_document();
      break;
    case Action::Kind::ScrollUp:
      view_.page_up();
      break;
    case Action::Kind::ScrollDown:
      view_.page_down();
      break;
  }
}

void Session::submit(const std::string& query) {
  transcript_.append(Speaker::User, query);
  transcript_.append(Speaker::Assistant, generator_.generate(query));
  IEA_LOG_INFO("query answered with template: " + generator_.topic(query));
  message_.clear();
  refresh_view();
}

void Session::clear_transcript() {
  transcript_.reset(kClearedText);
  message_.clear();
  view_.set_content(transcript_.join());
  view_.scroll_to_bottom();
  IEA_LOG_INFO("transcript cleared");
}

void Session::export_document() {
  const Turn* doc = transcript_.last_assistant_document();
  if (!doc) {
    message_ = "no document to save";
    return;
  }
  auto path = export_path_for(working_directory_, doc->text);
  std::string msg;
  if (write_document(path, doc->text, msg)) {
    IEA_LOG_INFO(msg + " (environment=" + environment_ + ")");
  } else {
    IEA_LOG_ERROR(msg);
  }
  message_ = msg;
}

void Session::relayout() {
  int help_rows = static_cast<int>(keymap_.help_lines(show_full_help_, width_).size());
  layout_ = compute_layout(height_, width_, IEA_INPUT_ROWS, help_rows);
  Rect iv = inner(layout_.input);
  input_.set_width(iv.width);
  input_.set_height(iv.height);
  Rect tv = inner(layout_.transcript);
  view_.resize(tv.width, tv.height);
}

void Session::refresh_view() {
  view_.set_content(transcript_.join());
  view_.scroll_to_bottom();
}

void Session::render() {
  FrameInfo f;
  f.ready = ready();
  f.title = IEA_TITLE;
  f.environment = environment_;
  f.view = &view_;
  f.input = &input_;
  f.message = message_;
  f.help = keymap_.help_lines(show_full_help_, layout_.help.width);
  f.layout = layout_;
  renderer_.render(term_, f);
}
