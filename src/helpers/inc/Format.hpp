#ifndef GPUWATCH_HELPERS_FORMAT_HPP
#define GPUWATCH_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for telemetry values.
 *
 * Every formatter takes an optional value and renders the unknown sentinel
 * as "N/A", so panel code never branches on availability itself.
 *
 * @note Returns std::string (heap allocation). Render path only.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

namespace gpuwatch {
namespace helpers {
namespace format {

/* ----------------------------- Constants ----------------------------- */

/// Text shown for an unknown value.
inline constexpr std::string_view NA_TEXT = "N/A";

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format an optional value with a fixed precision and unit suffix.
 * @param value     Value or std::nullopt.
 * @param unit      Suffix appended directly after the number (e.g. "%", " W").
 * @param precision Digits after the decimal point.
 * @return e.g. "65%", "285.0 W", or "N/A".
 */
[[nodiscard]] inline std::string valueOrNa(const std::optional<double>& value,
                                           std::string_view unit, int precision = 0) {
  if (!value) {
    return std::string(NA_TEXT);
  }
  return fmt::format("{:.{}f}{}", *value, precision, unit);
}

/**
 * @brief Format a MiB amount using MiB below 1 GiB and GiB above.
 * @param mib Value in MiB or std::nullopt.
 * @return e.g. "512 MiB", "8.0 GiB", or "N/A".
 */
[[nodiscard]] inline std::string mebibytes(const std::optional<double>& mib) {
  if (!mib) {
    return std::string(NA_TEXT);
  }
  if (*mib >= 1024.0) {
    return fmt::format("{:.1f} GiB", *mib / 1024.0);
  }
  return fmt::format("{:.0f} MiB", *mib);
}

/**
 * @brief Format a used/total memory pair with the used percentage.
 * @return e.g. "8.0/24.0 GiB (33%)"; "N/A" when either side is unknown.
 */
[[nodiscard]] inline std::string memoryUsage(const std::optional<double>& usedMiB,
                                             const std::optional<double>& totalMiB,
                                             const std::optional<double>& percent) {
  if (!usedMiB || !totalMiB) {
    return std::string(NA_TEXT);
  }
  const std::string PCT = percent ? fmt::format(" ({:.0f}%)", *percent) : std::string{};
  return fmt::format("{:.1f}/{:.1f} GiB{}", *usedMiB / 1024.0, *totalMiB / 1024.0, PCT);
}

/**
 * @brief Format power draw against its limit.
 * @return "285.0/450 W", "285.0 W" without limit, or "N/A".
 */
[[nodiscard]] inline std::string powerUsage(const std::optional<double>& drawW,
                                            const std::optional<double>& limitW) {
  if (!drawW) {
    return std::string(NA_TEXT);
  }
  if (!limitW) {
    return fmt::format("{:.1f} W", *drawW);
  }
  return fmt::format("{:.1f}/{:.0f} W", *drawW, *limitW);
}

/**
 * @brief Format a CUDA driver version integer (e.g. 12040 -> "12.4").
 * @param version Encoded version (major * 1000 + minor * 10), <= 0 if unknown.
 */
[[nodiscard]] inline std::string cudaVersion(int version) {
  if (version <= 0) {
    return std::string(NA_TEXT);
  }
  return fmt::format("{}.{}", version / 1000, (version % 1000) / 10);
}

} // namespace format
} // namespace helpers
} // namespace gpuwatch

#endif // GPUWATCH_HELPERS_FORMAT_HPP
