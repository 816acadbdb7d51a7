#pragma once
/*
 * Transcript
 *
 * Purpose: ordered, append-only list of Turns; source of truth for the viewport.
 * Invariant: never empty; reset() replaces everything with a single notice Turn.
 */
#include <string>
#include <vector>
#include "types.hpp"

extern const char* const kWelcomeText;
extern const char* const kClearedText;

class Transcript {
public:
  Transcript();

  void append(Speaker who, const std::string& text);
  void reset(const std::string& notice);

  int size() const { return static_cast<int>(turns_.size()); }
  const Turn& at(int i) const { return turns_.at(static_cast<size_t>(i)); }
  const std::vector<Turn>& turns() const { return turns_; }
  const Turn* last_assistant_document() const;

  std::string join() const;

private:
  std::vector<Turn> turns_;
};
