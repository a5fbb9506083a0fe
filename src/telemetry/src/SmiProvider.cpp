/**
 * @file SmiProvider.cpp
 * @brief nvidia-smi subprocess telemetry backend.
 * @note Process listing is best effort: its failure leaves process lists empty
 *       and never fails the poll.
 */

#include "src/telemetry/inc/SmiProvider.hpp"

#include "src/exec/inc/ChildProcess.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/telemetry/inc/SmiCsv.hpp"

#include <chrono>  // std::chrono::steady_clock
#include <cstdlib> // std::getenv

#include <fmt/core.h>

namespace gpuwatch {

namespace telemetry {

namespace files = gpuwatch::helpers::files;

/* ----------------------------- Lookup ----------------------------- */

std::string locateSmi(std::string_view explicitPath) {
  if (!explicitPath.empty()) {
    const std::string PATH(explicitPath);
    return files::isExecutableFile(PATH.c_str()) ? PATH : std::string{};
  }

  if (const char* env = std::getenv(SMI_PATH_ENV); env != nullptr && *env != '\0') {
    if (files::isExecutableFile(env)) {
      return env;
    }
  }

  std::string found = files::findInPath("nvidia-smi");
  if (!found.empty()) {
    return found;
  }

  for (const char* candidate : SMI_FALLBACK_PATHS) {
    if (files::isExecutableFile(candidate)) {
      return candidate;
    }
  }
  return {};
}

/* ----------------------------- SmiProvider ----------------------------- */

SmiProvider::SmiProvider(Options options)
    : options_(std::move(options)), executable_(locateSmi(options_.executable)) {}

std::vector<std::string> SmiProvider::gpuQueryArgv() const {
  return {executable_, fmt::format("--query-gpu={}", smi::GPU_QUERY_FIELDS),
          fmt::format("--format={}", smi::QUERY_FORMAT)};
}

std::vector<std::string> SmiProvider::computeAppsArgv() const {
  return {executable_, fmt::format("--query-compute-apps={}", smi::COMPUTE_APPS_QUERY_FIELDS),
          fmt::format("--format={}", smi::QUERY_FORMAT)};
}

PollResult SmiProvider::poll() {
  if (executable_.empty()) {
    const std::string WANTED = options_.executable.empty() ? "nvidia-smi" : options_.executable;
    return PollResult::failure(PollStatus::PROVIDER_MISSING,
                               fmt::format("{} not found or not executable", WANTED));
  }

  // One deadline covers both queries.
  const auto DEADLINE = std::chrono::steady_clock::now() + options_.timeout;

  const exec::CommandResult RUN = exec::runCommand(gpuQueryArgv(), options_.timeout);
  switch (RUN.status) {
  case exec::ExecStatus::OK:
    break;
  case exec::ExecStatus::TIMEOUT:
    return PollResult::failure(PollStatus::TIMEOUT,
                               fmt::format("{} did not answer within {} ms", executable_,
                                           options_.timeout.count()));
  case exec::ExecStatus::EXEC_FAILED:
    return PollResult::failure(PollStatus::PROVIDER_MISSING,
                               fmt::format("cannot execute {}", executable_));
  case exec::ExecStatus::SPAWN_FAILED:
  case exec::ExecStatus::IO_ERROR:
    return PollResult::failure(PollStatus::DRIVER_UNAVAILABLE,
                               fmt::format("running {} failed: {}", executable_,
                                           exec::toString(RUN.status)));
  }

  if (RUN.exitCode != 0) {
    return PollResult::failure(PollStatus::DRIVER_UNAVAILABLE,
                               fmt::format("{} exited with status {}", executable_, RUN.exitCode));
  }

  PollResult result = smi::parseGpuQueryOutput(RUN.output);
  if (!result.ok() || !options_.queryProcesses) {
    return result;
  }

  const auto REMAINING = std::chrono::duration_cast<std::chrono::milliseconds>(
      DEADLINE - std::chrono::steady_clock::now());
  if (REMAINING.count() <= 0) {
    return result;
  }

  const exec::CommandResult APPS = exec::runCommand(computeAppsArgv(), REMAINING);
  if (APPS.succeeded()) {
    smi::attachProcesses(result.gpus, smi::parseComputeAppsOutput(APPS.output));
  }

  return result;
}

} // namespace telemetry

} // namespace gpuwatch
