#include "transcript_view.hpp"
#include <algorithm>

static std::vector<std::string> split_block_lines(const std::string& block) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st <= block.size()) {
    size_t pos = block.find('\n', st);
    if (pos == std::string::npos) { lines.emplace_back(block.substr(st)); break; }
    lines.emplace_back(block.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}

TranscriptView::TranscriptView(int width, int height)
  : width_(std::max(1, width)), height_(std::max(1, height)) {}

void TranscriptView::rewrap() {
  wrapped_.clear();
  for (const auto& line : split_block_lines(content_)) {
    if (line.empty()) { wrapped_.emplace_back(); continue; }
    for (size_t st = 0; st < line.size(); st += static_cast<size_t>(width_)) {
      wrapped_.push_back(line.substr(st, static_cast<size_t>(width_)));
    }
  }
}

int TranscriptView::max_offset() const {
  return std::max(0, line_count() - height_);
}

void TranscriptView::set_content(const std::string& text) {
  content_ = text;
  rewrap();
  offset_ = std::min(offset_, max_offset());
}

void TranscriptView::resize(int width, int height) {
  bool was_bottom = at_bottom();
  int old_lines = std::max(1, line_count());
  int old_offset = offset_;
  width_ = std::max(1, width);
  height_ = std::max(1, height);
  rewrap();
  if (was_bottom) {
    offset_ = max_offset();
    return;
  }
  long scaled = static_cast<long>(old_offset) * line_count() / old_lines;
  offset_ = std::clamp(static_cast<int>(scaled), 0, max_offset());
}

void TranscriptView::scroll_to_bottom() { offset_ = max_offset(); }

void TranscriptView::scroll_up(int n) { offset_ = std::max(0, offset_ - std::max(0, n)); }

void TranscriptView::scroll_down(int n) { offset_ = std::min(max_offset(), offset_ + std::max(0, n)); }

void TranscriptView::page_up() { scroll_up(std::max(1, height_ - 1)); }

void TranscriptView::page_down() { scroll_down(std::max(1, height_ - 1)); }

std::vector<std::string> TranscriptView::visible_lines() const {
  std::vector<std::string> out;
  for (int i = offset_; i < line_count() && i < offset_ + height_; ++i) out.push_back(wrapped_[i]);
  return out;
}
