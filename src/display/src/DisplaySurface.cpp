/**
 * @file DisplaySurface.cpp
 * @brief Style names.
 */

#include "src/display/inc/DisplaySurface.hpp"

namespace gpuwatch {

namespace display {

const char* toString(Style style) noexcept {
  switch (style) {
  case Style::NORMAL:
    return "NORMAL";
  case Style::TITLE:
    return "TITLE";
  case Style::LABEL:
    return "LABEL";
  case Style::DIM:
    return "DIM";
  case Style::LOW:
    return "LOW";
  case Style::MEDIUM:
    return "MEDIUM";
  case Style::HIGH:
    return "HIGH";
  }
  return "UNKNOWN";
}

} // namespace display

} // namespace gpuwatch
