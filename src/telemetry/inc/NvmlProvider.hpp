#ifndef GPUWATCH_TELEMETRY_NVML_PROVIDER_HPP
#define GPUWATCH_TELEMETRY_NVML_PROVIDER_HPP
/**
 * @file NvmlProvider.hpp
 * @brief Telemetry via the NVML library, queried in a timed child process.
 *
 * NVML calls can block indefinitely on a wedged driver. Each poll therefore
 * forks, runs one NVML session in the child and ships a fixed-size
 * nvml::Message back over a pipe; the parent kills the child at the timeout.
 *
 * Without NVML in the build every poll returns PROVIDER_MISSING.
 */

#include "src/telemetry/inc/TelemetryProvider.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint32_t
#include <string_view> // std::string_view

namespace gpuwatch {

namespace telemetry {

namespace nvml {

/* ----------------------------- Message Limits ----------------------------- */

inline constexpr std::size_t MAX_DEVICES = 16;
inline constexpr std::size_t MAX_PROCESSES = 32;
inline constexpr std::size_t NAME_SIZE = 96;
inline constexpr std::size_t PROCESS_NAME_SIZE = 64;
inline constexpr std::size_t TEXT_SIZE = 128;

/**
 * @brief Numeric metrics carried per device. Presence is tracked in a bitmask.
 */
enum Metric : std::uint8_t {
  METRIC_UTILIZATION = 0,
  METRIC_MEMORY_UTILIZATION,
  METRIC_MEMORY_USED,
  METRIC_MEMORY_TOTAL,
  METRIC_TEMPERATURE,
  METRIC_POWER_DRAW,
  METRIC_POWER_LIMIT,
  METRIC_GRAPHICS_CLOCK,
  METRIC_MEMORY_CLOCK,
  METRIC_FAN_SPEED,
  METRIC_COUNT,
};

/* ----------------------------- Wire Records ----------------------------- */

struct ProcessRecord {
  std::uint32_t pid;
  std::uint8_t hasMemory;
  double usedMemoryMiB;
  char name[PROCESS_NAME_SIZE];
};

struct DeviceRecord {
  char name[NAME_SIZE];
  char uuid[NAME_SIZE];
  double values[METRIC_COUNT];
  std::uint32_t presentMask; ///< Bit i set if values[i] is known
  std::uint32_t processCount;
  ProcessRecord processes[MAX_PROCESSES];

  void set(Metric metric, double value) noexcept {
    values[metric] = value;
    presentMask |= (1U << metric);
  }

  [[nodiscard]] bool has(Metric metric) const noexcept {
    return (presentMask & (1U << metric)) != 0;
  }
};

/**
 * @brief Complete answer of one NVML child session.
 */
struct Message {
  std::uint8_t status;       ///< PollStatus value
  char detail[TEXT_SIZE];    ///< Failure text
  char driver[TEXT_SIZE];    ///< Driver version
  std::int32_t cudaVersion;  ///< major*1000 + minor*10, 0 if unknown
  std::uint32_t deviceCount; ///< Devices reported by NVML (may exceed MAX_DEVICES)
  DeviceRecord devices[MAX_DEVICES];
};

/**
 * @brief Copy text into a fixed buffer, truncating and always terminating.
 */
template <std::size_t N> void copyText(char (&dst)[N], std::string_view src) noexcept {
  const std::size_t LEN = src.size() < N - 1 ? src.size() : N - 1;
  for (std::size_t i = 0; i < LEN; ++i) {
    dst[i] = src[i];
  }
  dst[LEN] = '\0';
}

/**
 * @brief Convert a child message into a PollResult.
 * @note Devices past MAX_DEVICES are dropped; zero devices yields NO_DEVICES.
 */
[[nodiscard]] PollResult decodeMessage(const Message& msg);

} // namespace nvml

/* ----------------------------- NvmlProvider ----------------------------- */

/**
 * @brief Provider backed by NVML.
 */
class NvmlProvider final : public TelemetryProvider {
public:
  NvmlProvider(std::chrono::milliseconds timeout, bool queryProcesses) noexcept
      : timeout_(timeout), queryProcesses_(queryProcesses) {}

  [[nodiscard]] PollResult poll() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "nvml"; }

private:
  std::chrono::milliseconds timeout_;
  bool queryProcesses_;
};

} // namespace telemetry

} // namespace gpuwatch

#endif // GPUWATCH_TELEMETRY_NVML_PROVIDER_HPP
