#ifndef GPUWATCH_DISPLAY_CURSES_SURFACE_HPP
#define GPUWATCH_DISPLAY_CURSES_SURFACE_HPP
/**
 * @file CursesSurface.hpp
 * @brief ncurses implementation of DisplaySurface.
 * @note Owns the terminal between open() and destruction. One instance per process.
 */

#include "src/display/inc/DisplaySurface.hpp"

#include <cstdint> // std::uint8_t
#include <memory>  // std::unique_ptr

// Forward declaration from <curses.h>; keeps curses macros out of includers.
struct screen;

namespace gpuwatch {

namespace display {

/**
 * @brief Outcome of CursesSurface::open().
 */
enum class SurfaceStatus : std::uint8_t {
  OK = 0,               ///< Terminal is in curses mode
  NOT_A_TERMINAL,       ///< stdout is not a tty
  NEWTERM_FAILED,       ///< ncurses could not initialize the terminal
  NO_CURSOR_ADDRESSING, ///< Terminal type lacks cursor positioning
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(SurfaceStatus status) noexcept;

/**
 * @brief Full-screen ncurses surface.
 *
 * Restores the terminal (endwin) in its destructor.
 */
class CursesSurface final : public DisplaySurface {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  /**
   * @brief Enter curses mode on stdout.
   * @param out Receives the surface on success.
   * @return OK, or the reason the terminal cannot be used.
   */
  [[nodiscard]] static SurfaceStatus open(std::unique_ptr<CursesSurface>& out);

  /// @brief Reachable only through open().
  CursesSurface(PrivateTag /*tag*/, screen* scr, bool colors) noexcept
      : screen_(scr), colors_(colors) {}

  ~CursesSurface() override;

  CursesSurface(const CursesSurface&) = delete;
  CursesSurface& operator=(const CursesSurface&) = delete;

  [[nodiscard]] int rows() const noexcept override;
  [[nodiscard]] int cols() const noexcept override;

  void clear() override;
  void writeAt(int row, int col, std::string_view text, Style style) override;
  void flush() override;

private:
  screen* screen_;
  bool colors_;
};

} // namespace display

} // namespace gpuwatch

#endif // GPUWATCH_DISPLAY_CURSES_SURFACE_HPP
