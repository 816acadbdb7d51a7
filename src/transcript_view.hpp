#pragma once
/*
 * TranscriptView
 *
 * Purpose: read-only scrollable window over the joined transcript text.
 * Note: a derived cache; set_content() is a full replace and the text is always
 *       recomputable from Transcript::join(), so nothing here needs saving.
 */
#include <string>
#include <vector>

class TranscriptView {
public:
  TranscriptView(int width = 80, int height = 20);

  void set_content(const std::string& text);
  const std::string& content() const { return content_; }

  void resize(int width, int height);
  void scroll_to_bottom();
  void scroll_up(int n);
  void scroll_down(int n);
  void page_up();
  void page_down();

  bool at_bottom() const { return offset_ >= max_offset(); }
  int offset() const { return offset_; }
  int width() const { return width_; }
  int height() const { return height_; }
  int line_count() const { return static_cast<int>(wrapped_.size()); }
  std::vector<std::string> visible_lines() const;

private:
  void rewrap();
  int max_offset() const;

  std::string content_;
  std::vector<std::string> wrapped_;
  int width_;
  int height_;
  int offset_ = 0;
};
