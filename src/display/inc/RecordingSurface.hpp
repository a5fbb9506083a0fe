#ifndef GPUWATCH_DISPLAY_RECORDING_SURFACE_HPP
#define GPUWATCH_DISPLAY_RECORDING_SURFACE_HPP
/**
 * @file RecordingSurface.hpp
 * @brief In-memory DisplaySurface for tests and headless rendering.
 *
 * Keeps a character grid plus a log of every accepted write, with
 * per-cell style, so callers can inspect exactly what was drawn.
 */

#include "src/display/inc/DisplaySurface.hpp"

#include <cstddef> // std::size_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace gpuwatch {

namespace display {

/**
 * @brief One accepted writeAt() call.
 */
struct RecordedWrite {
  int row{0};
  int col{0};
  std::string text;
  Style style{Style::NORMAL};
};

/**
 * @brief Fake surface backed by a grid of UTF-8 glyphs.
 */
class RecordingSurface final : public DisplaySurface {
public:
  RecordingSurface(int rows, int cols);

  [[nodiscard]] int rows() const noexcept override { return rows_; }
  [[nodiscard]] int cols() const noexcept override { return cols_; }

  void clear() override;
  void writeAt(int row, int col, std::string_view text, Style style) override;
  void flush() override { ++flushCount_; }

  /// @brief Full text of one row (cols glyphs; blanks are spaces).
  [[nodiscard]] std::string rowText(int row) const;

  /// @brief Glyph at one cell ("" outside the surface).
  [[nodiscard]] std::string glyphAt(int row, int col) const;

  /// @brief Style of one cell (NORMAL outside the surface).
  [[nodiscard]] Style styleAt(int row, int col) const;

  /// @brief Writes accepted since construction or the last resetLog().
  [[nodiscard]] const std::vector<RecordedWrite>& writes() const noexcept { return writes_; }

  [[nodiscard]] std::size_t clearCount() const noexcept { return clearCount_; }
  [[nodiscard]] std::size_t flushCount() const noexcept { return flushCount_; }

  /// @brief Forget the write log; grid contents are kept.
  void resetLog() noexcept { writes_.clear(); }

private:
  [[nodiscard]] std::size_t offset(int row, int col) const noexcept {
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) +
           static_cast<std::size_t>(col);
  }

  int rows_;
  int cols_;
  std::vector<std::string> glyphs_;
  std::vector<Style> styles_;
  std::vector<RecordedWrite> writes_;
  std::size_t clearCount_{0};
  std::size_t flushCount_{0};
};

} // namespace display

} // namespace gpuwatch

#endif // GPUWATCH_DISPLAY_RECORDING_SURFACE_HPP
