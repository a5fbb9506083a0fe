#ifndef GPUWATCH_DASHBOARD_SPARKLINE_HPP
#define GPUWATCH_DASHBOARD_SPARKLINE_HPP
/**
 * @file Sparkline.hpp
 * @brief Eight-level block-glyph sparklines.
 *
 * Levels are scaled to the min..max of the buffer being drawn, so the
 * lowest sample is always level 0 and the highest level 7. A flat buffer
 * draws level 0 throughout.
 */

#include "src/dashboard/inc/MetricHistory.hpp"

#include <array>   // std::array
#include <cstddef> // std::size_t
#include <vector>  // std::vector

namespace gpuwatch {

namespace dashboard {

inline constexpr int SPARK_LEVELS = 8;

/// Glyphs for levels 0..7.
inline constexpr std::array<const char*, SPARK_LEVELS> SPARK_GLYPHS = {
    "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█",
};

/**
 * @brief Level of one sample.
 * @return floor(8 * (v - lo) / (hi - lo)) clamped to [0, 7]; 0 when hi == lo.
 */
[[nodiscard]] int sparkLevel(double value, double lo, double hi) noexcept;

/**
 * @brief Levels of every sample in history, oldest first.
 */
[[nodiscard]] std::vector<int> sparkLevels(const MetricHistory& history);

/**
 * @brief Glyph for a level (clamped to the valid range).
 */
[[nodiscard]] const char* sparkGlyph(int level) noexcept;

} // namespace dashboard

} // namespace gpuwatch

#endif // GPUWATCH_DASHBOARD_SPARKLINE_HPP
