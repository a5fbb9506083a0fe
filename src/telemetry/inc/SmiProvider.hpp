#ifndef GPUWATCH_TELEMETRY_SMI_PROVIDER_HPP
#define GPUWATCH_TELEMETRY_SMI_PROVIDER_HPP
/**
 * @file SmiProvider.hpp
 * @brief Telemetry via the nvidia-smi command-line tool.
 * @note Linux-only. Each poll spawns nvidia-smi (twice when process listing is on).
 */

#include "src/telemetry/inc/TelemetryProvider.hpp"

#include <chrono>      // std::chrono::milliseconds
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace gpuwatch {

namespace telemetry {

/// Locations checked when nvidia-smi is not on $PATH.
inline constexpr const char* SMI_FALLBACK_PATHS[] = {
    "/usr/bin/nvidia-smi",
    "/usr/local/bin/nvidia-smi",
    "/opt/nvidia/sbin/nvidia-smi",
    "/bin/nvidia-smi",
};

/**
 * @brief Resolve the nvidia-smi executable.
 * @param explicitPath Path given by the user ("" to search).
 * @return Explicit path if executable; else $GPUWATCH_NVIDIA_SMI; else $PATH;
 *         else the first existing fallback path; "" if none.
 */
[[nodiscard]] std::string locateSmi(std::string_view explicitPath);

/**
 * @brief Provider backed by nvidia-smi CSV queries.
 */
class SmiProvider final : public TelemetryProvider {
public:
  /// Construction options.
  struct Options {
    std::string executable; ///< nvidia-smi path ("" = locateSmi())
    std::chrono::milliseconds timeout{DEFAULT_POLL_TIMEOUT}; ///< Bound on one poll, both queries included
    bool queryProcesses{true}; ///< Also run the compute-apps query
  };

  explicit SmiProvider(Options options);

  [[nodiscard]] PollResult poll() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "nvidia-smi"; }

  /// @brief Resolved executable path ("" if none was found).
  [[nodiscard]] const std::string& executable() const noexcept { return executable_; }

  /// @brief argv of the GPU query invocation.
  [[nodiscard]] std::vector<std::string> gpuQueryArgv() const;

  /// @brief argv of the compute-apps query invocation.
  [[nodiscard]] std::vector<std::string> computeAppsArgv() const;

private:
  Options options_;
  std::string executable_;
};

} // namespace telemetry

} // namespace gpuwatch

#endif // GPUWATCH_TELEMETRY_SMI_PROVIDER_HPP
