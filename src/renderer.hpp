#pragma once
/*
 * Renderer
 *
 * Purpose: draw the full frame: title bar, bordered transcript, bordered input, status, help.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Session to render.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "input_buffer.hpp"
#include "layout.hpp"
#include "transcript_view.hpp"

struct FrameInfo {
  bool ready = false;
  std::string title;
  std::string environment;
  const TranscriptView* view = nullptr;
  const InputBuffer* input = nullptr;
  std::string message;
  std::vector<std::string> help;
  ScreenLayout layout{};
};

class Renderer {
public:
  void render(ITerminal& term, const FrameInfo& frame);
};
