/**
 * @file Dashboard.cpp
 * @brief Dashboard state machine and cell-diff rendering.
 */

#include "src/dashboard/inc/Dashboard.hpp"

#include "src/dashboard/inc/Gauge.hpp"
#include "src/dashboard/inc/Sparkline.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <thread> // std::this_thread::sleep_for

#include <fmt/core.h>

namespace gpuwatch {

namespace dashboard {

using display::Style;
using telemetry::GpuSnapshot;
using telemetry::PollResult;

namespace fmtx = gpuwatch::helpers::format;
namespace str = gpuwatch::helpers::strings;

namespace {

std::time_t systemTime() { return std::time(nullptr); }

std::string clockText(std::time_t now) {
  std::tm local{};
  if (::localtime_r(&now, &local) == nullptr) {
    return std::string(fmtx::NA_TEXT);
  }
  return fmt::format("{:02}:{:02}:{:02}", local.tm_hour, local.tm_min, local.tm_sec);
}

/// Tier of one sparkline sample.
Style sampleStyle(Metric metric, double value, const GpuSnapshot& gpu) {
  switch (metric) {
  case Metric::UTILIZATION:
  case Metric::MEMORY:
    return tierStyle(colorTier(value, PERCENT_THRESHOLDS));
  case Metric::TEMPERATURE:
    return tierStyle(colorTier(value, TEMPERATURE_THRESHOLDS));
  case Metric::POWER:
    if (gpu.powerLimitW && *gpu.powerLimitW > 0.0) {
      return tierStyle(colorTier(value * 100.0 / *gpu.powerLimitW, PERCENT_THRESHOLDS));
    }
    return Style::LOW;
  }
  return Style::NORMAL;
}

} // namespace

/* ----------------------------- Status Strings ----------------------------- */

const char* toString(DashboardState state) noexcept {
  switch (state) {
  case DashboardState::UNINITIALIZED:
    return "UNINITIALIZED";
  case DashboardState::RUNNING:
    return "RUNNING";
  }
  return "UNKNOWN";
}

const char* toString(TickStatus status) noexcept {
  switch (status) {
  case TickStatus::UPDATED:
    return "UPDATED";
  case TickStatus::STALE:
    return "STALE";
  case TickStatus::STARTUP_FAILURE:
    return "STARTUP_FAILURE";
  }
  return "UNKNOWN";
}

/* ----------------------------- Lifecycle ----------------------------- */

Dashboard::Dashboard(telemetry::TelemetryProvider& provider, display::DisplaySurface& surface,
                     DashboardConfig config, WallClock clock)
    : provider_(provider), surface_(surface), config_(config),
      clock_(clock ? std::move(clock) : WallClock(systemTime)) {}

TickStatus Dashboard::start(const PollResult& first) {
  cellsWritten_ = 0;

  if (state_ == DashboardState::RUNNING) {
    return update(first);
  }
  if (!first.ok()) {
    return TickStatus::STARTUP_FAILURE;
  }

  LayoutParams params{};
  params.rows = surface_.rows();
  params.cols = surface_.cols();
  params.gpuCount = first.gpus.size();
  params.barWidth = config_.barWidth;
  params.historyLength = config_.historyLength;
  params.showProcesses = config_.showProcesses;
  params.processRows = config_.processRows;
  layout_ = computeLayout(params);

  histories_.assign(first.gpus.size(), GpuHistory(config_.historyLength));
  current_ = first;
  failures_ = 0;
  cache_.clear();

  surface_.clear();
  drawFrame();
  apply(first);
  render();
  surface_.flush();

  state_ = DashboardState::RUNNING;
  return TickStatus::UPDATED;
}

TickStatus Dashboard::tick() {
  if (state_ == DashboardState::UNINITIALIZED) {
    return start(provider_.poll());
  }
  cellsWritten_ = 0;
  return update(provider_.poll());
}

TickStatus Dashboard::update(const PollResult& result) {
  TickStatus status = TickStatus::UPDATED;
  if (result.ok()) {
    failures_ = 0;
    apply(result);
  } else {
    ++failures_;
    lastFailure_ = result.status;
    lastFailureDetail_ = result.detail;
    status = TickStatus::STALE;
  }

  render();
  surface_.flush();
  return status;
}

void Dashboard::run(const volatile std::sig_atomic_t& stop) {
  using Clock = std::chrono::steady_clock;

  while (stop == 0) {
    const Clock::time_point NEXT = Clock::now() + config_.interval;
    (void)tick();

    for (Clock::time_point now = Clock::now(); stop == 0 && now < NEXT; now = Clock::now()) {
      const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(NEXT - now);
      std::this_thread::sleep_for(LEFT < SLEEP_SLICE ? LEFT : SLEEP_SLICE);
    }
  }
}

const GpuHistory* Dashboard::history(std::size_t gpu) const noexcept {
  return gpu < histories_.size() ? &histories_[gpu] : nullptr;
}

/* ----------------------------- Data ----------------------------- */

void Dashboard::apply(const PollResult& result) {
  current_.status = telemetry::PollStatus::OK;
  current_.detail.clear();
  current_.driverVersion = result.driverVersion;
  current_.cudaVersion = result.cudaVersion;

  // Panel count is fixed at start; extra GPUs are ignored, missing ones keep old values.
  const std::size_t PANELS = histories_.size();
  current_.gpus.resize(PANELS);
  const std::size_t N = result.gpus.size() < PANELS ? result.gpus.size() : PANELS;

  for (std::size_t i = 0; i < N; ++i) {
    const GpuSnapshot& gpu = result.gpus[i];
    GpuHistory& hist = histories_[i];
    hist.record(Metric::UTILIZATION, gpu.utilizationPercent);
    hist.record(Metric::MEMORY, gpu.memoryPercent());
    hist.record(Metric::TEMPERATURE, gpu.temperatureC);
    hist.record(Metric::POWER, gpu.powerDrawW);
    current_.gpus[i] = gpu;
  }
}

/* ----------------------------- Rendering ----------------------------- */

void Dashboard::emit(int row, int col, std::string text, Style style) {
  Cell cell{std::move(text), style};
  const std::pair<int, int> KEY{row, col};
  const auto IT = cache_.find(KEY);
  if (IT != cache_.end() && IT->second == cell) {
    return;
  }
  surface_.writeAt(row, col, cell.text, cell.style);
  cache_[KEY] = std::move(cell);
  ++cellsWritten_;
}

void Dashboard::putText(const Field& field, std::string_view text, Style style) {
  if (!field.visible) {
    return;
  }
  emit(field.row, field.col, str::fitToWidth(text, static_cast<std::size_t>(field.width)), style);
}

void Dashboard::drawFrame() {
  for (const Label& label : layout_.labels) {
    if (!label.at.visible) {
      continue;
    }
    emit(label.at.row, label.at.col,
         std::string(str::clipToWidth(label.text, static_cast<std::size_t>(label.at.width))),
         label.style);
  }
}

void Dashboard::render() {
  renderHeader();
  for (std::size_t i = 0; i < layout_.gpus.size() && i < current_.gpus.size(); ++i) {
    renderGpu(layout_.gpus[i], current_.gpus[i], histories_[i]);
  }
  if (layout_.processesShown) {
    renderProcesses();
  }
}

void Dashboard::renderHeader() {
  const std::string DRIVER =
      current_.driverVersion.empty() ? std::string(fmtx::NA_TEXT) : current_.driverVersion;
  putText(layout_.driver, DRIVER, current_.driverVersion.empty() ? Style::DIM : Style::NORMAL);
  putText(layout_.cuda, fmtx::cudaVersion(current_.cudaVersion),
          current_.cudaVersion > 0 ? Style::NORMAL : Style::DIM);
  putText(layout_.gpuCount, fmt::format("{}", layout_.gpus.size()), Style::NORMAL);
  putText(layout_.backend, provider_.name(), Style::NORMAL);
  putText(layout_.clock, clockText(clock_()), Style::NORMAL);

  if (failures_ == 0) {
    putText(layout_.status, "LIVE", Style::LOW);
  } else {
    putText(layout_.status,
            fmt::format("STALE {} ({} failed poll{}): {}", telemetry::toString(lastFailure_),
                        failures_, failures_ == 1 ? "" : "s", lastFailureDetail_),
            Style::HIGH);
  }
}

void Dashboard::renderGpu(const GpuPanel& panel, const GpuSnapshot& gpu,
                          const GpuHistory& hist) {
  std::string title = fmt::format("GPU {}: {}", gpu.index, gpu.name);
  if (gpu.fieldErrors > 0) {
    title += fmt::format("  ({} unreadable field{})", gpu.fieldErrors,
                         gpu.fieldErrors == 1 ? "" : "s");
  }
  putText(panel.title, title, Style::TITLE);

  renderBar(panel.utilizationBar, gpu.utilizationPercent);
  putText(panel.utilizationText, fmtx::valueOrNa(gpu.utilizationPercent, "%"),
          valueStyle(gpu.utilizationPercent, PERCENT_THRESHOLDS));

  const std::optional<double> MEM_PCT = gpu.memoryPercent();
  renderBar(panel.memoryBar, MEM_PCT);
  putText(panel.memoryText, fmtx::memoryUsage(gpu.memoryUsedMiB, gpu.memoryTotalMiB, MEM_PCT),
          valueStyle(MEM_PCT, PERCENT_THRESHOLDS));

  const std::optional<double> PWR_PCT = gpu.powerPercent();
  renderBar(panel.powerBar, PWR_PCT);
  putText(panel.powerText, fmtx::powerUsage(gpu.powerDrawW, gpu.powerLimitW),
          gpu.powerDrawW ? valueStyle(PWR_PCT, PERCENT_THRESHOLDS) : Style::DIM);

  putText(panel.temperature, fmtx::valueOrNa(gpu.temperatureC, " C"),
          valueStyle(gpu.temperatureC, TEMPERATURE_THRESHOLDS));
  putText(panel.graphicsClock, fmtx::valueOrNa(gpu.graphicsClockMHz, " MHz"),
          gpu.graphicsClockMHz ? Style::NORMAL : Style::DIM);
  putText(panel.memoryClock, fmtx::valueOrNa(gpu.memoryClockMHz, " MHz"),
          gpu.memoryClockMHz ? Style::NORMAL : Style::DIM);
  putText(panel.fanSpeed, fmtx::valueOrNa(gpu.fanSpeedPercent, "%"),
          valueStyle(gpu.fanSpeedPercent, PERCENT_THRESHOLDS));

  for (std::size_t m = 0; m < METRIC_COUNT; ++m) {
    const auto METRIC = static_cast<Metric>(m);
    renderSparkline(panel.sparklines[m], hist[METRIC], METRIC, gpu);
  }
}

void Dashboard::renderBar(const Field& field, const std::optional<double>& percent) {
  if (!field.visible) {
    return;
  }
  const int FILLED = percent ? barFill(*percent, config_.barWidth) : 0;
  const Style FILL_STYLE = percent ? valueStyle(percent, PERCENT_THRESHOLDS) : Style::DIM;

  for (int c = 0; c < field.width; ++c) {
    if (c < FILLED) {
      emit(field.row, field.col + c, BAR_FILLED, FILL_STYLE);
    } else {
      emit(field.row, field.col + c, BAR_EMPTY, Style::DIM);
    }
  }
}

void Dashboard::renderSparkline(const Field& field, const MetricHistory& hist, Metric metric,
                                const GpuSnapshot& gpu) {
  if (!field.visible) {
    return;
  }

  const std::vector<int> LEVELS = sparkLevels(hist);
  const std::size_t WIDTH = static_cast<std::size_t>(field.width);
  const std::size_t N = LEVELS.size();

  // Newest sample in the rightmost column.
  for (std::size_t c = 0; c < WIDTH; ++c) {
    const int COL = field.col + static_cast<int>(c);
    if (c + N < WIDTH) {
      emit(field.row, COL, " ", Style::NORMAL);
      continue;
    }
    const std::size_t SAMPLE = N - WIDTH + c;
    emit(field.row, COL, sparkGlyph(LEVELS[SAMPLE]),
         sampleStyle(metric, hist.at(SAMPLE), gpu));
  }
}

void Dashboard::renderProcesses() {
  struct Row {
    int gpu;
    const telemetry::GpuProcessEntry* proc;
  };
  std::vector<Row> procs;
  for (const GpuSnapshot& gpu : current_.gpus) {
    for (const telemetry::GpuProcessEntry& p : gpu.processes) {
      procs.push_back(Row{gpu.index, &p});
    }
  }

  for (std::size_t i = 0; i < layout_.processRows.size(); ++i) {
    const Field& field = layout_.processRows[i];
    if (procs.empty()) {
      putText(field, i == 0 ? "No active GPU processes" : "", Style::DIM);
      continue;
    }
    if (i >= procs.size()) {
      putText(field, "", Style::NORMAL);
      continue;
    }
    const telemetry::GpuProcessEntry& p = *procs[i].proc;
    const std::string NAME = p.name.empty() ? std::string(fmtx::NA_TEXT) : p.name;
    putText(field,
            fmt::format("{:<4} {:<8} {} {:>10}", procs[i].gpu, p.pid, str::fitToWidth(NAME, 24),
                        fmtx::mebibytes(p.usedMemoryMiB)),
            Style::NORMAL);
  }
}

} // namespace dashboard

} // namespace gpuwatch
