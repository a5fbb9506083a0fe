/**
 * @file Sparkline.cpp
 * @brief Sparkline level computation.
 */

#include "src/dashboard/inc/Sparkline.hpp"

#include <cmath> // std::floor

namespace gpuwatch {

namespace dashboard {

int sparkLevel(double value, double lo, double hi) noexcept {
  if (!(hi > lo)) {
    return 0;
  }
  const double SCALED = std::floor(SPARK_LEVELS * (value - lo) / (hi - lo));
  if (!(SCALED > 0.0)) {
    return 0;
  }
  if (SCALED >= SPARK_LEVELS - 1) {
    return SPARK_LEVELS - 1;
  }
  return static_cast<int>(SCALED);
}

std::vector<int> sparkLevels(const MetricHistory& history) {
  std::vector<int> levels;
  if (history.empty()) {
    return levels;
  }

  const double LO = *history.min();
  const double HI = *history.max();
  levels.reserve(history.size());
  for (std::size_t i = 0; i < history.size(); ++i) {
    levels.push_back(sparkLevel(history.at(i), LO, HI));
  }
  return levels;
}

const char* sparkGlyph(int level) noexcept {
  if (level < 0) {
    level = 0;
  }
  if (level >= SPARK_LEVELS) {
    level = SPARK_LEVELS - 1;
  }
  return SPARK_GLYPHS[static_cast<std::size_t>(level)];
}

} // namespace dashboard

} // namespace gpuwatch
