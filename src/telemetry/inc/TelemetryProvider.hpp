#ifndef GPUWATCH_TELEMETRY_TELEMETRY_PROVIDER_HPP
#define GPUWATCH_TELEMETRY_TELEMETRY_PROVIDER_HPP
/**
 * @file TelemetryProvider.hpp
 * @brief Telemetry source interface, poll result, and backend selection.
 *
 * A provider answers poll() with either a list of GpuSnapshot records or a
 * typed failure (PollStatus other than OK). Failures are values: nothing
 * here throws, and a failed poll never carries partial GPU data.
 */

#include "src/telemetry/inc/GpuSnapshot.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <cstdint>     // std::uint8_t
#include <memory>      // std::unique_ptr
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace gpuwatch {

namespace telemetry {

/* ----------------------------- Constants ----------------------------- */

/// Default upper bound for one provider call.
inline constexpr std::chrono::milliseconds DEFAULT_POLL_TIMEOUT{2000};

/// Environment variable naming the nvidia-smi executable.
inline constexpr const char* SMI_PATH_ENV = "GPUWATCH_NVIDIA_SMI";

/* ----------------------------- PollStatus ----------------------------- */

/**
 * @brief Outcome of one provider poll. Anything but OK means telemetry is unavailable.
 */
enum class PollStatus : std::uint8_t {
  OK = 0,             ///< Snapshot(s) parsed
  PROVIDER_MISSING,   ///< Executable not found or backend not built in
  DRIVER_UNAVAILABLE, ///< Provider ran but reported failure
  TIMEOUT,            ///< Provider exceeded the poll timeout and was killed
  MALFORMED_RESPONSE, ///< Response unusable as a whole
  NO_DEVICES,         ///< Provider answered but reported zero GPUs
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(PollStatus status) noexcept;

/* ----------------------------- PollResult ----------------------------- */

/**
 * @brief Result of TelemetryProvider::poll().
 */
struct PollResult {
  PollStatus status{PollStatus::PROVIDER_MISSING}; ///< Outcome
  std::string detail;                              ///< Diagnostic text for failures
  std::vector<GpuSnapshot> gpus;                   ///< Ordered by GPU index (empty unless OK)
  std::string driverVersion;                       ///< Driver version ("" if unknown)
  int cudaVersion{0}; ///< CUDA driver version (major*1000 + minor*10), 0 if unknown

  /// @brief True if the poll produced usable data.
  [[nodiscard]] bool ok() const noexcept { return status == PollStatus::OK; }

  /// @brief Build a failed result.
  [[nodiscard]] static PollResult failure(PollStatus status, std::string detail);
};

/* ----------------------------- TelemetryProvider ----------------------------- */

/**
 * @brief Source of GPU telemetry.
 *
 * Implementations must bound poll() by their configured timeout.
 */
class TelemetryProvider {
public:
  virtual ~TelemetryProvider() = default;

  /// @brief Query all GPUs once.
  [[nodiscard]] virtual PollResult poll() = 0;

  /// @brief Short backend name for display (e.g. "nvidia-smi").
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/* ----------------------------- Backend Selection ----------------------------- */

/**
 * @brief Telemetry backend choice.
 */
enum class Backend : std::uint8_t {
  AUTO = 0, ///< NVML when compiled in, else nvidia-smi
  SMI,      ///< nvidia-smi subprocess
  NVML,     ///< NVML library in a timed child process
};

/**
 * @brief Human-readable backend name ("auto", "smi", "nvml").
 */
[[nodiscard]] const char* toString(Backend backend) noexcept;

/**
 * @brief Parse a backend name as accepted by --backend.
 * @return Backend, or std::nullopt for an unknown name.
 */
[[nodiscard]] std::optional<Backend> parseBackend(std::string_view text) noexcept;

/**
 * @brief Provider construction parameters.
 */
struct ProviderConfig {
  Backend backend{Backend::AUTO};                      ///< Which backend to build
  std::string smiPath;                                 ///< Explicit nvidia-smi path ("" = search)
  std::chrono::milliseconds timeout{DEFAULT_POLL_TIMEOUT}; ///< Per-poll bound
  bool queryProcesses{true};                           ///< Include compute process lists
};

/**
 * @brief True if the NVML backend was compiled into this build.
 */
[[nodiscard]] bool nvmlBackendAvailable() noexcept;

/**
 * @brief Build the provider selected by config.
 * @return Owning pointer; never null.
 */
[[nodiscard]] std::unique_ptr<TelemetryProvider> makeProvider(const ProviderConfig& config);

} // namespace telemetry

} // namespace gpuwatch

#endif // GPUWATCH_TELEMETRY_TELEMETRY_PROVIDER_HPP
