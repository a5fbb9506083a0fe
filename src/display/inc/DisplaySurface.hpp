#ifndef GPUWATCH_DISPLAY_DISPLAY_SURFACE_HPP
#define GPUWATCH_DISPLAY_DISPLAY_SURFACE_HPP
/**
 * @file DisplaySurface.hpp
 * @brief Character-cell terminal surface interface.
 *
 * Coordinates are zero-based (row, col). Text is UTF-8; one code point
 * occupies one column. Writes past the right edge are clipped; writes
 * outside the surface are ignored.
 */

#include <cstdint>     // std::uint8_t
#include <string_view> // std::string_view

namespace gpuwatch {

namespace display {

/**
 * @brief Visual style of a written cell.
 */
enum class Style : std::uint8_t {
  NORMAL = 0, ///< Default foreground
  TITLE,      ///< Panel titles (bold)
  LABEL,      ///< Static field labels
  DIM,        ///< Unknown values, unfilled bar cells, separators
  LOW,        ///< Green tier
  MEDIUM,     ///< Yellow tier
  HIGH,       ///< Red tier
};

/**
 * @brief Human-readable style name.
 */
[[nodiscard]] const char* toString(Style style) noexcept;

/**
 * @brief Output surface the dashboard draws on.
 */
class DisplaySurface {
public:
  virtual ~DisplaySurface() = default;

  /// @brief Surface height in rows.
  [[nodiscard]] virtual int rows() const noexcept = 0;

  /// @brief Surface width in columns.
  [[nodiscard]] virtual int cols() const noexcept = 0;

  /// @brief Blank the whole surface.
  virtual void clear() = 0;

  /// @brief Write text at (row, col) in the given style.
  virtual void writeAt(int row, int col, std::string_view text, Style style) = 0;

  /// @brief Make pending writes visible.
  virtual void flush() = 0;
};

} // namespace display

} // namespace gpuwatch

#endif // GPUWATCH_DISPLAY_DISPLAY_SURFACE_HPP
