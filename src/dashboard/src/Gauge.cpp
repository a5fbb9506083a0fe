/**
 * @file Gauge.cpp
 * @brief Bar fill and tier styles.
 */

#include "src/dashboard/inc/Gauge.hpp"

#include <cmath> // std::floor, std::isnan

namespace gpuwatch {

namespace dashboard {

display::Style tierStyle(Tier tier) noexcept {
  switch (tier) {
  case Tier::LOW:
    return display::Style::LOW;
  case Tier::MEDIUM:
    return display::Style::MEDIUM;
  case Tier::HIGH:
    return display::Style::HIGH;
  }
  return display::Style::NORMAL;
}

display::Style valueStyle(const std::optional<double>& value, Thresholds limits) noexcept {
  if (!value) {
    return display::Style::DIM;
  }
  return tierStyle(colorTier(*value, limits));
}

int barFill(double percent, int width) noexcept {
  if (width <= 0 || std::isnan(percent)) {
    return 0;
  }
  const double CELLS = std::floor(percent * static_cast<double>(width) / 100.0);
  if (CELLS <= 0.0) {
    return 0;
  }
  if (CELLS >= static_cast<double>(width)) {
    return width;
  }
  return static_cast<int>(CELLS);
}

} // namespace dashboard

} // namespace gpuwatch
