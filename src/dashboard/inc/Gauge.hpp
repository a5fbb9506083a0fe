#ifndef GPUWATCH_DASHBOARD_GAUGE_HPP
#define GPUWATCH_DASHBOARD_GAUGE_HPP
/**
 * @file Gauge.hpp
 * @brief Bar fill and color tier arithmetic.
 */

#include "src/display/inc/DisplaySurface.hpp"

#include <cstdint>  // std::uint8_t
#include <optional> // std::optional

namespace gpuwatch {

namespace dashboard {

/* ----------------------------- Tiers ----------------------------- */

/**
 * @brief Severity bucket of a value.
 */
enum class Tier : std::uint8_t {
  LOW = 0, ///< At or below medium threshold (green)
  MEDIUM,  ///< Above medium, at or below high (yellow)
  HIGH,    ///< Above high threshold (red)
};

/**
 * @brief Tier boundaries. A value strictly greater than a bound is in the higher tier.
 */
struct Thresholds {
  double medium;
  double high;
};

/// Utilization, memory, power and fan (percent).
inline constexpr Thresholds PERCENT_THRESHOLDS{50.0, 80.0};

/// Core temperature (Celsius).
inline constexpr Thresholds TEMPERATURE_THRESHOLDS{65.0, 80.0};

/**
 * @brief Classify a value.
 */
[[nodiscard]] constexpr Tier colorTier(double value, Thresholds limits) noexcept {
  if (value > limits.high) {
    return Tier::HIGH;
  }
  if (value > limits.medium) {
    return Tier::MEDIUM;
  }
  return Tier::LOW;
}

/**
 * @brief Display style of a tier.
 */
[[nodiscard]] display::Style tierStyle(Tier tier) noexcept;

/**
 * @brief Style for an optional value: tier color when known, DIM when unknown.
 */
[[nodiscard]] display::Style valueStyle(const std::optional<double>& value,
                                        Thresholds limits) noexcept;

/* ----------------------------- Bars ----------------------------- */

/// Glyph of a filled bar cell.
inline constexpr const char* BAR_FILLED = "█";

/// Glyph of an unfilled bar cell.
inline constexpr const char* BAR_EMPTY = "░";

/**
 * @brief Filled cell count of a bar.
 * @param percent Value in percent (NaN counts as 0).
 * @param width   Bar width in cells.
 * @return floor(percent * width / 100) clamped to [0, width].
 */
[[nodiscard]] int barFill(double percent, int width) noexcept;

} // namespace dashboard

} // namespace gpuwatch

#endif // GPUWATCH_DASHBOARD_GAUGE_HPP
