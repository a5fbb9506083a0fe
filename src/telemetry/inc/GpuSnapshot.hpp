#ifndef GPUWATCH_TELEMETRY_GPU_SNAPSHOT_HPP
#define GPUWATCH_TELEMETRY_GPU_SNAPSHOT_HPP
/**
 * @file GpuSnapshot.hpp
 * @brief Point-in-time GPU telemetry record.
 *
 * Every numeric field is optional: std::nullopt is the "unknown" sentinel for
 * a value the provider did not report or that failed to parse. Renderers show
 * unknown values as "N/A" and never feed them into history.
 */

#include <cstdint>  // std::uint32_t
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace gpuwatch {

namespace telemetry {

/* ----------------------------- GpuProcessEntry ----------------------------- */

/**
 * @brief Compute process running on a GPU.
 */
struct GpuProcessEntry {
  std::uint32_t pid{0};                ///< Process ID
  std::string name;                    ///< Executable basename ("" if unknown)
  std::optional<double> usedMemoryMiB; ///< GPU memory held by the process

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- GpuSnapshot ----------------------------- */

/**
 * @brief Telemetry for one GPU from one poll.
 */
struct GpuSnapshot {
  int index{-1};    ///< GPU ordinal (0-based)
  std::string name; ///< Product name
  std::string uuid; ///< Device UUID ("" if unknown)

  // Utilization (percent, 0-100)
  std::optional<double> utilizationPercent;       ///< Compute utilization
  std::optional<double> memoryUtilizationPercent; ///< Memory controller utilization

  // Memory (MiB)
  std::optional<double> memoryUsedMiB;  ///< Framebuffer memory in use
  std::optional<double> memoryTotalMiB; ///< Framebuffer memory installed

  // Thermal / power
  std::optional<double> temperatureC; ///< Core temperature (Celsius)
  std::optional<double> powerDrawW;   ///< Board power draw (W)
  std::optional<double> powerLimitW;  ///< Enforced power limit (W)

  // Clocks (MHz)
  std::optional<double> graphicsClockMHz; ///< Graphics clock
  std::optional<double> memoryClockMHz;   ///< Memory clock

  // Fan (percent)
  std::optional<double> fanSpeedPercent; ///< Fan duty ("unknown" for passive boards)

  std::vector<GpuProcessEntry> processes; ///< Running compute processes (may be empty)

  int fieldErrors{0}; ///< Fields that were present but unparseable

  /// @brief Memory used as percent of total, unknown if either side is unknown or total is 0.
  [[nodiscard]] std::optional<double> memoryPercent() const noexcept;

  /// @brief Power draw as percent of limit, unknown if either side is unknown or limit is 0.
  [[nodiscard]] std::optional<double> powerPercent() const noexcept;

  /// @brief Human-readable one-line summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace telemetry

} // namespace gpuwatch

#endif // GPUWATCH_TELEMETRY_GPU_SNAPSHOT_HPP
