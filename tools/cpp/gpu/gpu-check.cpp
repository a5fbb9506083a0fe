/**
 * @file gpu-check.cpp
 * @brief One-shot telemetry backend diagnostics.
 *
 * Probes each telemetry backend once and reports whether gpu-watch can run,
 * with a per-GPU summary and a hint for each failure.
 * Exit 0 if at least one backend works, 2 otherwise, 1 on bad arguments.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/telemetry/inc/SmiProvider.hpp"
#include "src/telemetry/inc/TelemetryProvider.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = gpuwatch::helpers::args;
namespace fmtx = gpuwatch::helpers::format;
namespace telemetry = gpuwatch::telemetry;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_BAD_ARGS = 1;
constexpr int EXIT_NO_BACKEND = 2;

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_BACKEND = 2,
  ARG_SMI_PATH = 3,
  ARG_TIMEOUT = 4,
};

constexpr std::string_view DESCRIPTION =
    "Probe GPU telemetry backends (nvidia-smi, NVML) and report whether gpu-watch can run.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_BACKEND] = {"--backend", 1, false, "Probe only this backend: auto|smi|nvml"};
  map[ARG_SMI_PATH] = {"--smi-path", 1, false, "Path to nvidia-smi"};
  map[ARG_TIMEOUT] = {"--timeout", 1, false, "Per-probe timeout in ms (default: 2000)"};
  return map;
}

/// Result of probing one backend.
struct Probe {
  telemetry::Backend backend{telemetry::Backend::SMI};
  std::string providerName;
  telemetry::PollResult result;
};

/// Suggested fix for a failed probe.
const char* hintFor(telemetry::PollStatus status, telemetry::Backend backend) noexcept {
  switch (status) {
  case telemetry::PollStatus::OK:
    return "";
  case telemetry::PollStatus::PROVIDER_MISSING:
    return backend == telemetry::Backend::NVML
               ? "rebuild with NVML (libnvidia-ml) available"
               : "install the NVIDIA driver utilities or pass --smi-path / set GPUWATCH_NVIDIA_SMI";
  case telemetry::PollStatus::DRIVER_UNAVAILABLE:
    return "the NVIDIA kernel driver is not loaded or does not match the user-space libraries";
  case telemetry::PollStatus::TIMEOUT:
    return "the driver is not responding; raise --timeout or check dmesg";
  case telemetry::PollStatus::MALFORMED_RESPONSE:
    return "unexpected nvidia-smi output; check the driver version";
  case telemetry::PollStatus::NO_DEVICES:
    return "no NVIDIA GPU is visible to the driver";
  }
  return "";
}

/// Escape a string for a JSON string literal.
std::string jsonEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char C : text) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(C));
      } else {
        out += C;
      }
    }
  }
  return out;
}

std::string jsonNumber(const std::optional<double>& value) {
  return value ? fmt::format("{:.1f}", *value) : std::string("null");
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const std::vector<Probe>& probes, const std::string& smiPath) {
  fmt::print("=== Telemetry Backends ===\n");
  fmt::print("  nvidia-smi:   {}\n", smiPath.empty() ? "not found" : smiPath);
  fmt::print("  NVML:         {}\n",
             telemetry::nvmlBackendAvailable() ? "compiled in" : "not compiled in");

  for (const Probe& p : probes) {
    const telemetry::PollResult& r = p.result;
    fmt::print("\n=== {} ===\n", p.providerName);
    fmt::print("  Status:       {}\n", telemetry::toString(r.status));
    if (!r.ok()) {
      fmt::print("  Detail:       {}\n", r.detail);
      fmt::print("  Hint:         {}\n", hintFor(r.status, p.backend));
      continue;
    }
    fmt::print("  Driver:       {}\n",
               r.driverVersion.empty() ? std::string(fmtx::NA_TEXT) : r.driverVersion);
    fmt::print("  CUDA:         {}\n", fmtx::cudaVersion(r.cudaVersion));
    fmt::print("  GPUs:         {}\n", r.gpus.size());
    for (const telemetry::GpuSnapshot& gpu : r.gpus) {
      fmt::print("    {}\n", gpu.toString());
      for (const telemetry::GpuProcessEntry& proc : gpu.processes) {
        fmt::print("      {}\n", proc.toString());
      }
    }
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const std::vector<Probe>& probes, const std::string& smiPath, bool anyOk) {
  fmt::print("{{\n");
  fmt::print("  \"smiPath\": \"{}\",\n", jsonEscape(smiPath));
  fmt::print("  \"nvmlCompiled\": {},\n", telemetry::nvmlBackendAvailable());
  fmt::print("  \"usable\": {},\n", anyOk);
  fmt::print("  \"backends\": [\n");

  for (std::size_t i = 0; i < probes.size(); ++i) {
    const Probe& p = probes[i];
    const telemetry::PollResult& r = p.result;
    fmt::print("    {{\n");
    fmt::print("      \"name\": \"{}\",\n", jsonEscape(p.providerName));
    fmt::print("      \"status\": \"{}\",\n", telemetry::toString(r.status));
    fmt::print("      \"detail\": \"{}\",\n", jsonEscape(r.detail));
    fmt::print("      \"driverVersion\": \"{}\",\n", jsonEscape(r.driverVersion));
    fmt::print("      \"cudaVersion\": {},\n", r.cudaVersion);
    fmt::print("      \"gpus\": [");
    for (std::size_t g = 0; g < r.gpus.size(); ++g) {
      const telemetry::GpuSnapshot& gpu = r.gpus[g];
      fmt::print("{}\n        {{\"index\": {}, \"name\": \"{}\", \"uuid\": \"{}\", "
                 "\"utilization\": {}, \"memoryUsedMiB\": {}, \"memoryTotalMiB\": {}, "
                 "\"temperatureC\": {}, \"powerDrawW\": {}, \"powerLimitW\": {}, "
                 "\"processes\": {}, \"fieldErrors\": {}}}",
                 g == 0 ? "" : ",", gpu.index, jsonEscape(gpu.name), jsonEscape(gpu.uuid),
                 jsonNumber(gpu.utilizationPercent), jsonNumber(gpu.memoryUsedMiB),
                 jsonNumber(gpu.memoryTotalMiB), jsonNumber(gpu.temperatureC),
                 jsonNumber(gpu.powerDrawW), jsonNumber(gpu.powerLimitW), gpu.processes.size(),
                 gpu.fieldErrors);
    }
    fmt::print("{}]\n", r.gpus.empty() ? "" : "\n      ");
    fmt::print("    }}{}\n", i + 1 < probes.size() ? "," : "");
  }

  fmt::print("  ]\n");
  fmt::print("}}\n");
}

} // namespace

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_BAD_ARGS;
  }
  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_OK;
  }

  telemetry::ProviderConfig base{};
  std::vector<telemetry::Backend> backends = {telemetry::Backend::SMI, telemetry::Backend::NVML};

  if (const auto IT = pargs.find(ARG_BACKEND); IT != pargs.end() && !IT->second.empty()) {
    const std::optional<telemetry::Backend> BACKEND = telemetry::parseBackend(IT->second[0]);
    if (!BACKEND) {
      fmt::print(stderr, "Error: --backend expects auto, smi or nvml, got '{}'\n", IT->second[0]);
      return EXIT_BAD_ARGS;
    }
    if (*BACKEND != telemetry::Backend::AUTO) {
      backends = {*BACKEND};
    }
  }
  if (const auto IT = pargs.find(ARG_SMI_PATH); IT != pargs.end() && !IT->second.empty()) {
    base.smiPath = std::string(IT->second[0]);
  }
  if (const auto IT = pargs.find(ARG_TIMEOUT); IT != pargs.end() && !IT->second.empty()) {
    const std::optional<int> MS = args::parseIntInRange(IT->second[0], 100, 30000);
    if (!MS) {
      fmt::print(stderr, "Error: --timeout expects an integer in [100, 30000], got '{}'\n",
                 IT->second[0]);
      return EXIT_BAD_ARGS;
    }
    base.timeout = std::chrono::milliseconds(*MS);
  }

  std::vector<Probe> probes;
  bool anyOk = false;
  for (const telemetry::Backend BACKEND : backends) {
    telemetry::ProviderConfig cfg = base;
    cfg.backend = BACKEND;
    const std::unique_ptr<telemetry::TelemetryProvider> PROVIDER = telemetry::makeProvider(cfg);

    Probe probe{};
    probe.backend = BACKEND;
    probe.providerName = std::string(PROVIDER->name());
    probe.result = PROVIDER->poll();
    anyOk = anyOk || probe.result.ok();
    probes.push_back(std::move(probe));
  }

  const std::string SMI_PATH = telemetry::locateSmi(base.smiPath);
  if (pargs.count(ARG_JSON) != 0) {
    printJson(probes, SMI_PATH, anyOk);
  } else {
    printHuman(probes, SMI_PATH);
    fmt::print("\n{}\n", anyOk ? "gpu-watch can run." : "gpu-watch cannot run: no usable backend.");
  }

  return anyOk ? EXIT_OK : EXIT_NO_BACKEND;
}
