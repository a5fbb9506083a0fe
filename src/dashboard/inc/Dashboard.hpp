#ifndef GPUWATCH_DASHBOARD_DASHBOARD_HPP
#define GPUWATCH_DASHBOARD_DASHBOARD_HPP
/**
 * @file Dashboard.hpp
 * @brief Live GPU dashboard: poll, keep history, redraw changed cells.
 *
 * Lifecycle:
 *   UNINITIALIZED --start(ok result)--> RUNNING
 *
 * start() clears the surface and draws the static frame exactly once.
 * Every later tick() renders all fields as cells and writes only those that
 * differ from the cached cell at the same position, then flushes once.
 *
 * A failed poll leaves values and histories untouched and switches the
 * status indicator to STALE with the consecutive failure count.
 *
 * @note Not thread-safe. Several instances may coexist.
 */

#include "src/dashboard/inc/MetricHistory.hpp"
#include "src/dashboard/inc/PanelLayout.hpp"
#include "src/display/inc/DisplaySurface.hpp"
#include "src/telemetry/inc/TelemetryProvider.hpp"

#include <chrono>     // std::chrono::milliseconds
#include <csignal>    // std::sig_atomic_t
#include <cstddef>    // std::size_t
#include <cstdint>    // std::uint8_t
#include <ctime>      // std::time_t
#include <functional> // std::function
#include <map>        // std::map
#include <optional>   // std::optional
#include <string>     // std::string
#include <string_view> // std::string_view
#include <utility>    // std::pair
#include <vector>     // std::vector

namespace gpuwatch {

namespace dashboard {

/* ----------------------------- Constants ----------------------------- */

/// Default time between polls.
inline constexpr std::chrono::milliseconds DEFAULT_INTERVAL{500};

/// Longest single sleep inside run(); bounds interrupt latency.
inline constexpr std::chrono::milliseconds SLEEP_SLICE{50};

/* ----------------------------- Types ----------------------------- */

enum class DashboardState : std::uint8_t {
  UNINITIALIZED = 0,
  RUNNING,
};

/**
 * @brief Outcome of start() / tick().
 */
enum class TickStatus : std::uint8_t {
  UPDATED = 0,     ///< Fresh data applied
  STALE,           ///< Poll failed; previous values kept
  STARTUP_FAILURE, ///< First poll failed; nothing drawn
};

[[nodiscard]] const char* toString(DashboardState state) noexcept;
[[nodiscard]] const char* toString(TickStatus status) noexcept;

/**
 * @brief Dashboard settings.
 */
struct DashboardConfig {
  std::size_t historyLength{DEFAULT_HISTORY_LENGTH};
  int barWidth{DEFAULT_BAR_WIDTH};
  int processRows{DEFAULT_PROCESS_ROWS};
  bool showProcesses{true};
  std::chrono::milliseconds interval{DEFAULT_INTERVAL};
};

/// Wall clock source for the header time.
using WallClock = std::function<std::time_t()>;

/**
 * @brief Text and style at one screen position.
 */
struct Cell {
  std::string text;
  display::Style style{display::Style::NORMAL};

  bool operator==(const Cell& other) const noexcept {
    return style == other.style && text == other.text;
  }
  bool operator!=(const Cell& other) const noexcept { return !(*this == other); }
};

/* ----------------------------- Dashboard ----------------------------- */

class Dashboard {
public:
  /**
   * @param provider Telemetry source; must outlive the dashboard.
   * @param surface  Output surface; must outlive the dashboard.
   * @param config   Settings.
   * @param clock    Wall clock (defaults to std::time).
   */
  Dashboard(telemetry::TelemetryProvider& provider, display::DisplaySurface& surface,
            DashboardConfig config, WallClock clock = {});

  /**
   * @brief Enter RUNNING with the first poll result.
   * @return UPDATED, or STARTUP_FAILURE (no writes) if first is not ok.
   * @note In RUNNING this behaves like a tick with the given result.
   */
  TickStatus start(const telemetry::PollResult& first);

  /**
   * @brief Poll once and redraw changed cells.
   * @note In UNINITIALIZED this polls and calls start().
   */
  TickStatus tick();

  /**
   * @brief Tick at the configured interval until stop becomes non-zero.
   */
  void run(const volatile std::sig_atomic_t& stop);

  [[nodiscard]] DashboardState state() const noexcept { return state_; }
  [[nodiscard]] const PanelLayout& layout() const noexcept { return layout_; }

  /// @brief History of GPU panel i, or nullptr if out of range.
  [[nodiscard]] const GpuHistory* history(std::size_t gpu) const noexcept;

  /// @brief Last successfully applied data.
  [[nodiscard]] const telemetry::PollResult& current() const noexcept { return current_; }

  [[nodiscard]] int consecutiveFailures() const noexcept { return failures_; }

  /// @brief Cells written by the most recent start() or tick().
  [[nodiscard]] std::size_t cellsWritten() const noexcept { return cellsWritten_; }

private:
  TickStatus update(const telemetry::PollResult& result);
  void drawFrame();
  void apply(const telemetry::PollResult& result);
  void render();
  void renderHeader();
  void renderGpu(const GpuPanel& panel, const telemetry::GpuSnapshot& gpu,
                 const GpuHistory& hist);
  void renderBar(const Field& field, const std::optional<double>& percent);
  void renderSparkline(const Field& field, const MetricHistory& hist, Metric metric,
                       const telemetry::GpuSnapshot& gpu);
  void renderProcesses();

  void putText(const Field& field, std::string_view text, display::Style style);
  void emit(int row, int col, std::string text, display::Style style);

  telemetry::TelemetryProvider& provider_;
  display::DisplaySurface& surface_;
  DashboardConfig config_;
  WallClock clock_;

  DashboardState state_{DashboardState::UNINITIALIZED};
  PanelLayout layout_;
  std::vector<GpuHistory> histories_;
  telemetry::PollResult current_;

  int failures_{0};
  telemetry::PollStatus lastFailure_{telemetry::PollStatus::OK};
  std::string lastFailureDetail_;

  std::map<std::pair<int, int>, Cell> cache_;
  std::size_t cellsWritten_{0};
};

} // namespace dashboard

} // namespace gpuwatch

#endif // GPUWATCH_DASHBOARD_DASHBOARD_HPP
