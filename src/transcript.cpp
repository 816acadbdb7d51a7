#include "transcript.hpp"

const char* const kWelcomeText =
  "Welcome to the Innovation Engine Assistant!\n\n"
  "I can help you create executable documents for Kubernetes tasks.\n\n"
  "Type your question below and press Ctrl+S to send, or use the quick start options:";

const char* const kClearedText = "Chat cleared. How can I help you?";

Transcript::Transcript() {
  turns_.push_back(Turn{Speaker::Assistant, kWelcomeText, true});
}

void Transcript::append(Speaker who, const std::string& text) {
  turns_.push_back(Turn{who, text, false});
}

void Transcript::reset(const std::string& notice) {
  turns_.clear();
  turns_.push_back(Turn{Speaker::Assistant, notice, true});
}

const Turn* Transcript::last_assistant_document() const {
  for (auto it = turns_.rbegin(); it != turns_.rend(); ++it) {
    if (it->speaker == Speaker::Assistant && !it->notice) return &*it;
  }
  return nullptr;
}

std::string Transcript::join() const {
  std::string out;
  for (const auto& t : turns_) {
    if (!out.empty()) out += "\n\n";
    if (!t.notice) out += (t.speaker == Speaker::User ? "You: " : "Assistant: ");
    out += t.text;
  }
  return out;
}
