/**
 * @file gpu-watch.cpp
 * @brief Live full-screen GPU dashboard.
 *
 * Polls nvidia-smi or NVML at a fixed interval and redraws only the cells
 * that changed. Runs until SIGINT/SIGTERM.
 *
 * Exit codes: 0 interrupted, 1 bad arguments, 2 first poll failed,
 * 3 terminal unusable.
 */

#include "src/dashboard/inc/Dashboard.hpp"
#include "src/display/inc/CursesSurface.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/telemetry/inc/TelemetryProvider.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = gpuwatch::helpers::args;
namespace dash = gpuwatch::dashboard;
namespace display = gpuwatch::display;
namespace telemetry = gpuwatch::telemetry;

namespace {

/* ----------------------------- Exit Codes ----------------------------- */

constexpr int EXIT_OK = 0;
constexpr int EXIT_BAD_ARGS = 1;
constexpr int EXIT_STARTUP_FAILURE = 2;
constexpr int EXIT_SURFACE_ERROR = 3;

/* ----------------------------- Signals ----------------------------- */

volatile std::sig_atomic_t g_stop = 0;

void signalHandler(int /*signum*/) { g_stop = 1; }

/* ----------------------------- Arguments ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_INTERVAL = 1,
  ARG_HISTORY = 2,
  ARG_BACKEND = 3,
  ARG_SMI_PATH = 4,
  ARG_TIMEOUT = 5,
  ARG_BAR_WIDTH = 6,
  ARG_PROCS_ROWS = 7,
  ARG_NO_PROCS = 8,
};

constexpr std::string_view DESCRIPTION =
    "Live GPU dashboard: utilization, memory, temperature, power, clocks, fan,\n"
    "history sparklines and compute processes. Ctrl+C to exit.";

constexpr int MIN_INTERVAL_MS = 100;
constexpr int MAX_INTERVAL_MS = 3600 * 1000;
constexpr int MIN_HISTORY = 2;
constexpr int MAX_HISTORY = 600;
constexpr int MIN_TIMEOUT_MS = 100;
constexpr int MAX_TIMEOUT_MS = 30000;
constexpr int MIN_BAR_WIDTH = 10;
constexpr int MAX_BAR_WIDTH = 200;
constexpr int MAX_PROCS_ROWS = 64;

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Refresh interval in ms (default: 500, min 100)"};
  map[ARG_HISTORY] = {"--history", 1, false, "Sparkline samples per metric (default: 60, 2-600)"};
  map[ARG_BACKEND] = {"--backend", 1, false, "Telemetry backend: auto|smi|nvml (default: auto)"};
  map[ARG_SMI_PATH] = {"--smi-path", 1, false, "Path to nvidia-smi"};
  map[ARG_TIMEOUT] = {"--timeout", 1, false, "Per-poll timeout in ms (default: 2000, 100-30000)"};
  map[ARG_BAR_WIDTH] = {"--bar-width", 1, false, "Bar width in cells (default: 40, 10-200)"};
  map[ARG_PROCS_ROWS] = {"--procs-rows", 1, false, "Process rows shown (default: 8, 0-64)"};
  map[ARG_NO_PROCS] = {"--no-procs", 0, false, "Hide the process panel"};
  return map;
}

struct Options {
  telemetry::ProviderConfig provider{};
  dash::DashboardConfig dashboard{};
};

/// Parse an integer flag into out; false with error text on a bad value.
bool intFlag(const args::ParsedArgs& pargs, ArgKey key, std::string_view flag, int lo, int hi,
             int& out, std::string& error) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return true;
  }
  const std::optional<int> VALUE = args::parseIntInRange(IT->second[0], lo, hi);
  if (!VALUE) {
    error = fmt::format("{} expects an integer in [{}, {}], got '{}'", flag, lo, hi,
                        IT->second[0]);
    return false;
  }
  out = *VALUE;
  return true;
}

bool buildOptions(const args::ParsedArgs& pargs, Options& opts, std::string& error) {
  int interval = static_cast<int>(dash::DEFAULT_INTERVAL.count());
  int history = static_cast<int>(dash::DEFAULT_HISTORY_LENGTH);
  int timeout = static_cast<int>(telemetry::DEFAULT_POLL_TIMEOUT.count());
  int barWidth = dash::DEFAULT_BAR_WIDTH;
  int procsRows = dash::DEFAULT_PROCESS_ROWS;

  if (!intFlag(pargs, ARG_INTERVAL, "--interval", MIN_INTERVAL_MS, MAX_INTERVAL_MS, interval,
               error) ||
      !intFlag(pargs, ARG_HISTORY, "--history", MIN_HISTORY, MAX_HISTORY, history, error) ||
      !intFlag(pargs, ARG_TIMEOUT, "--timeout", MIN_TIMEOUT_MS, MAX_TIMEOUT_MS, timeout, error) ||
      !intFlag(pargs, ARG_BAR_WIDTH, "--bar-width", MIN_BAR_WIDTH, MAX_BAR_WIDTH, barWidth,
               error) ||
      !intFlag(pargs, ARG_PROCS_ROWS, "--procs-rows", 0, MAX_PROCS_ROWS, procsRows, error)) {
    return false;
  }

  if (const auto IT = pargs.find(ARG_BACKEND); IT != pargs.end() && !IT->second.empty()) {
    const std::optional<telemetry::Backend> BACKEND = telemetry::parseBackend(IT->second[0]);
    if (!BACKEND) {
      error = fmt::format("--backend expects auto, smi or nvml, got '{}'", IT->second[0]);
      return false;
    }
    opts.provider.backend = *BACKEND;
  }

  if (const auto IT = pargs.find(ARG_SMI_PATH); IT != pargs.end() && !IT->second.empty()) {
    opts.provider.smiPath = std::string(IT->second[0]);
  }

  const bool SHOW_PROCS = pargs.count(ARG_NO_PROCS) == 0;

  opts.provider.timeout = std::chrono::milliseconds(timeout);
  opts.provider.queryProcesses = SHOW_PROCS;

  opts.dashboard.interval = std::chrono::milliseconds(interval);
  opts.dashboard.historyLength = static_cast<std::size_t>(history);
  opts.dashboard.barWidth = barWidth;
  opts.dashboard.processRows = procsRows;
  opts.dashboard.showProcesses = SHOW_PROCS;
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  Options opts{};

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
  if (!buildOptions(pargs, opts, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return EXIT_BAD_ARGS;
  }

  const std::unique_ptr<telemetry::TelemetryProvider> PROVIDER =
      telemetry::makeProvider(opts.provider);

  // First poll happens before the terminal is taken over.
  const telemetry::PollResult FIRST = PROVIDER->poll();
  if (!FIRST.ok()) {
    fmt::print(stderr, "Startup failure: {}: {}\n", telemetry::toString(FIRST.status),
               FIRST.detail);
    return EXIT_STARTUP_FAILURE;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  int failures = 0;
  {
    std::unique_ptr<display::CursesSurface> surface;
    const display::SurfaceStatus SURFACE = display::CursesSurface::open(surface);
    if (SURFACE != display::SurfaceStatus::OK) {
      fmt::print(stderr, "Display error: {}\n", display::toString(SURFACE));
      return EXIT_SURFACE_ERROR;
    }

    dash::Dashboard board(*PROVIDER, *surface, opts.dashboard);
    board.start(FIRST);
    board.run(g_stop);
    failures = board.consecutiveFailures();
  }

  if (failures > 0) {
    fmt::print(stderr, "gpu-watch: exiting with {} consecutive failed polls\n", failures);
  }
  return EXIT_OK;
}
