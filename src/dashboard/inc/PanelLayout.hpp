#ifndef GPUWATCH_DASHBOARD_PANEL_LAYOUT_HPP
#define GPUWATCH_DASHBOARD_PANEL_LAYOUT_HPP
/**
 * @file PanelLayout.hpp
 * @brief Fixed screen positions of every dashboard field.
 *
 * Computed once at dashboard start from the surface size, GPU count, bar
 * width and history length. Fields below the last row or right of the last
 * column are not visible; fields cut by the right edge are narrowed.
 *
 * Screen structure (rows):
 *   0      header: title, driver, CUDA, GPU count, backend
 *   1      header: wall clock, status indicator
 *   2      separator
 *   3..    one GPU_PANEL_HEIGHT block per GPU
 *   then   process panel (title, column header, PROCESS rows)
 */

#include "src/display/inc/DisplaySurface.hpp"
#include "src/dashboard/inc/MetricHistory.hpp"

#include <array>   // std::array
#include <cstddef> // std::size_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace gpuwatch {

namespace dashboard {

/* ----------------------------- Constants ----------------------------- */

inline constexpr int DEFAULT_BAR_WIDTH = 40;
inline constexpr int DEFAULT_PROCESS_ROWS = 8;

inline constexpr int HEADER_HEIGHT = 3;
inline constexpr int GPU_PANEL_HEIGHT = 10; ///< Title, 3 bars, details, 4 sparklines, spacer

inline constexpr int LABEL_COL = 1;
inline constexpr int VALUE_COL = 7;

inline constexpr int UTIL_TEXT_WIDTH = 6;
inline constexpr int MEMORY_TEXT_WIDTH = 24;
inline constexpr int POWER_TEXT_WIDTH = 16;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Screen slot of one field.
 */
struct Field {
  int row{-1};
  int col{0};
  int width{0};         ///< Columns available (already clipped to the surface)
  bool visible{false};  ///< False if the field lies off the surface
};

/**
 * @brief Static text drawn once with the frame.
 */
struct Label {
  Field at;
  std::string text;
  display::Style style{display::Style::LABEL};
};

/**
 * @brief Field positions of one GPU panel.
 */
struct GpuPanel {
  int top{0};
  Field title;
  Field utilizationBar;
  Field utilizationText;
  Field memoryBar;
  Field memoryText;
  Field powerBar;
  Field powerText;
  Field temperature;
  Field graphicsClock;
  Field memoryClock;
  Field fanSpeed;
  std::array<Field, METRIC_COUNT> sparklines; ///< Indexed by Metric
};

/**
 * @brief Inputs of computeLayout().
 */
struct LayoutParams {
  int rows{0};
  int cols{0};
  std::size_t gpuCount{0};
  int barWidth{DEFAULT_BAR_WIDTH};
  std::size_t historyLength{DEFAULT_HISTORY_LENGTH};
  bool showProcesses{true};
  int processRows{DEFAULT_PROCESS_ROWS};
};

/**
 * @brief Complete dashboard layout.
 */
struct PanelLayout {
  int rows{0};
  int cols{0};

  // Header values
  Field driver;
  Field cuda;
  Field gpuCount;
  Field backend;
  Field clock;
  Field status;

  std::vector<GpuPanel> gpus;

  bool processesShown{false};
  std::vector<Field> processRows;

  std::vector<Label> labels; ///< Static frame (titles, labels, separators)

  int height{0}; ///< Rows the full layout needs (may exceed rows)
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Compute the layout for the given surface and content.
 */
[[nodiscard]] PanelLayout computeLayout(const LayoutParams& params);

/**
 * @brief Position a field, clipping it against the surface.
 */
[[nodiscard]] Field place(int row, int col, int width, int rows, int cols) noexcept;

} // namespace dashboard

} // namespace gpuwatch

#endif // GPUWATCH_DASHBOARD_PANEL_LAYOUT_HPP
