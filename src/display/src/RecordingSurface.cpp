/**
 * @file RecordingSurface.cpp
 * @brief In-memory surface.
 */

#include "src/display/inc/RecordingSurface.hpp"

namespace gpuwatch {

namespace display {

RecordingSurface::RecordingSurface(int rows, int cols)
    : rows_(rows < 0 ? 0 : rows), cols_(cols < 0 ? 0 : cols),
      glyphs_(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_), " "),
      styles_(glyphs_.size(), Style::NORMAL) {}

void RecordingSurface::clear() {
  for (std::string& g : glyphs_) {
    g = " ";
  }
  for (Style& s : styles_) {
    s = Style::NORMAL;
  }
  ++clearCount_;
}

void RecordingSurface::writeAt(int row, int col, std::string_view text, Style style) {
  if (row < 0 || col < 0 || row >= rows_ || col >= cols_ || text.empty()) {
    return;
  }

  writes_.push_back(RecordedWrite{row, col, std::string(text), style});

  // Split into code points; each occupies one column.
  int c = col;
  std::size_t i = 0;
  while (i < text.size() && c < cols_) {
    std::size_t next = i + 1;
    while (next < text.size() && (static_cast<unsigned char>(text[next]) & 0xC0U) == 0x80U) {
      ++next;
    }
    glyphs_[offset(row, c)] = std::string(text.substr(i, next - i));
    styles_[offset(row, c)] = style;
    ++c;
    i = next;
  }
}

std::string RecordingSurface::rowText(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) {
    return out;
  }
  for (int c = 0; c < cols_; ++c) {
    out += glyphs_[offset(row, c)];
  }
  return out;
}

std::string RecordingSurface::glyphAt(int row, int col) const {
  if (row < 0 || col < 0 || row >= rows_ || col >= cols_) {
    return {};
  }
  return glyphs_[offset(row, col)];
}

Style RecordingSurface::styleAt(int row, int col) const {
  if (row < 0 || col < 0 || row >= rows_ || col >= cols_) {
    return Style::NORMAL;
  }
  return styles_[offset(row, col)];
}

} // namespace display

} // namespace gpuwatch
