/**
 * @file TelemetryProvider.cpp
 * @brief Poll status strings and backend selection.
 */

#include "src/telemetry/inc/TelemetryProvider.hpp"

#include "src/telemetry/inc/NvmlProvider.hpp"
#include "src/telemetry/inc/SmiProvider.hpp"

namespace gpuwatch {

namespace telemetry {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(PollStatus status) noexcept {
  switch (status) {
  case PollStatus::OK:
    return "OK";
  case PollStatus::PROVIDER_MISSING:
    return "PROVIDER_MISSING";
  case PollStatus::DRIVER_UNAVAILABLE:
    return "DRIVER_UNAVAILABLE";
  case PollStatus::TIMEOUT:
    return "TIMEOUT";
  case PollStatus::MALFORMED_RESPONSE:
    return "MALFORMED_RESPONSE";
  case PollStatus::NO_DEVICES:
    return "NO_DEVICES";
  }
  return "UNKNOWN";
}

PollResult PollResult::failure(PollStatus status, std::string detail) {
  PollResult result{};
  result.status = status;
  result.detail = std::move(detail);
  return result;
}

/* ----------------------------- Backend Selection ----------------------------- */

const char* toString(Backend backend) noexcept {
  switch (backend) {
  case Backend::AUTO:
    return "auto";
  case Backend::SMI:
    return "smi";
  case Backend::NVML:
    return "nvml";
  }
  return "unknown";
}

std::optional<Backend> parseBackend(std::string_view text) noexcept {
  if (text == "auto") {
    return Backend::AUTO;
  }
  if (text == "smi" || text == "nvidia-smi") {
    return Backend::SMI;
  }
  if (text == "nvml") {
    return Backend::NVML;
  }
  return std::nullopt;
}

std::unique_ptr<TelemetryProvider> makeProvider(const ProviderConfig& config) {
  Backend backend = config.backend;
  if (backend == Backend::AUTO) {
    backend = nvmlBackendAvailable() ? Backend::NVML : Backend::SMI;
  }

  if (backend == Backend::NVML) {
    return std::make_unique<NvmlProvider>(config.timeout, config.queryProcesses);
  }

  SmiProvider::Options opts{};
  opts.executable = config.smiPath;
  opts.timeout = config.timeout;
  opts.queryProcesses = config.queryProcesses;
  return std::make_unique<SmiProvider>(std::move(opts));
}

} // namespace telemetry

} // namespace gpuwatch
