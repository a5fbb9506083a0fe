/**
 * @file GpuSnapshot.cpp
 * @brief Derived values and string forms for GpuSnapshot.
 */

#include "src/telemetry/inc/GpuSnapshot.hpp"

#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace gpuwatch {

namespace telemetry {

namespace fmtx = gpuwatch::helpers::format;

namespace {

/// Ratio as percent; unknown when either side is unknown or the base is not positive.
std::optional<double> percentOf(const std::optional<double>& part,
                                const std::optional<double>& whole) noexcept {
  if (!part || !whole || *whole <= 0.0) {
    return std::nullopt;
  }
  return 100.0 * *part / *whole;
}

} // namespace

/* ----------------------------- GpuProcessEntry ----------------------------- */

std::string GpuProcessEntry::toString() const {
  return fmt::format("PID {} ({}): {}", pid, name.empty() ? "?" : name,
                     fmtx::mebibytes(usedMemoryMiB));
}

/* ----------------------------- GpuSnapshot ----------------------------- */

std::optional<double> GpuSnapshot::memoryPercent() const noexcept {
  return percentOf(memoryUsedMiB, memoryTotalMiB);
}

std::optional<double> GpuSnapshot::powerPercent() const noexcept {
  return percentOf(powerDrawW, powerLimitW);
}

std::string GpuSnapshot::toString() const {
  return fmt::format("[GPU {}] {} - util {}, mem {}, {}, power {}, gr {}, mem clk {}, fan {}, "
                     "{} procs",
                     index, name, fmtx::valueOrNa(utilizationPercent, "%"),
                     fmtx::memoryUsage(memoryUsedMiB, memoryTotalMiB, memoryPercent()),
                     fmtx::valueOrNa(temperatureC, "C"), fmtx::powerUsage(powerDrawW, powerLimitW),
                     fmtx::valueOrNa(graphicsClockMHz, " MHz"),
                     fmtx::valueOrNa(memoryClockMHz, " MHz"), fmtx::valueOrNa(fanSpeedPercent, "%"),
                     processes.size());
}

} // namespace telemetry

} // namespace gpuwatch
