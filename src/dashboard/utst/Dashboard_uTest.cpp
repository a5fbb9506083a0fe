/**
 * @file Dashboard_uTest.cpp
 * @brief Unit tests for gpuwatch::dashboard::Dashboard.
 *
 * A scripted provider feeds poll results into a dashboard drawing on a
 * RecordingSurface with a fixed wall clock.
 */

#include "src/dashboard/inc/Dashboard.hpp"
#include "src/dashboard/inc/Gauge.hpp"
#include "src/display/inc/RecordingSurface.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <deque>
#include <string>

using gpuwatch::dashboard::BAR_EMPTY;
using gpuwatch::dashboard::BAR_FILLED;
using gpuwatch::dashboard::Dashboard;
using gpuwatch::dashboard::DashboardConfig;
using gpuwatch::dashboard::DashboardState;
using gpuwatch::dashboard::Metric;
using gpuwatch::dashboard::TickStatus;
using gpuwatch::display::RecordingSurface;
using gpuwatch::display::Style;
using gpuwatch::telemetry::GpuProcessEntry;
using gpuwatch::telemetry::GpuSnapshot;
using gpuwatch::telemetry::PollResult;
using gpuwatch::telemetry::PollStatus;
using gpuwatch::telemetry::TelemetryProvider;

namespace {

constexpr int ROWS = 40;
constexpr int COLS = 120;
constexpr std::time_t FIXED_TIME = 1700000000;

/// Returns queued results in order, then repeats the last one.
class ScriptedProvider final : public TelemetryProvider {
public:
  void push(PollResult result) { queue_.push_back(std::move(result)); }

  PollResult poll() override {
    ++polls_;
    if (queue_.size() > 1) {
      PollResult front = std::move(queue_.front());
      queue_.pop_front();
      return front;
    }
    return queue_.empty() ? PollResult::failure(PollStatus::PROVIDER_MISSING, "empty script")
                          : queue_.front();
  }

  std::string_view name() const noexcept override { return "scripted"; }

  int polls() const noexcept { return polls_; }

private:
  std::deque<PollResult> queue_;
  int polls_{0};
};

/// Repeats one result and raises a stop flag on the given poll.
class StoppingProvider final : public TelemetryProvider {
public:
  StoppingProvider(PollResult result, volatile std::sig_atomic_t& stop, int stopAt)
      : result_(std::move(result)), stop_(stop), stopAt_(stopAt) {}

  PollResult poll() override {
    if (++polls_ == stopAt_) {
      stop_ = 1;
    }
    return result_;
  }

  std::string_view name() const noexcept override { return "stopping"; }

  int polls() const noexcept { return polls_; }

private:
  PollResult result_;
  volatile std::sig_atomic_t& stop_;
  int stopAt_;
  int polls_{0};
};

GpuSnapshot sampleGpu(double util) {
  GpuSnapshot g{};
  g.index = 0;
  g.name = "RTX 4090";
  g.uuid = "GPU-aaa";
  g.utilizationPercent = util;
  g.memoryUsedMiB = 8200.0;
  g.memoryTotalMiB = 24576.0;
  g.temperatureC = 72.0;
  g.powerDrawW = 285.0;
  g.powerLimitW = 450.0;
  g.graphicsClockMHz = 2520.0;
  g.memoryClockMHz = 10501.0;
  g.fanSpeedPercent = 30.0;
  return g;
}

PollResult okResult(double util = 65.0) {
  PollResult r{};
  r.status = PollStatus::OK;
  r.driverVersion = "550.54.15";
  r.gpus.push_back(sampleGpu(util));
  return r;
}

DashboardConfig config(std::size_t history = 60) {
  DashboardConfig cfg{};
  cfg.historyLength = history;
  return cfg;
}

/// Dashboard plus its collaborators.
struct Fixture {
  explicit Fixture(DashboardConfig cfg = config())
      : surface(ROWS, COLS), board(provider, surface, cfg, [] { return FIXED_TIME; }) {}

  ScriptedProvider provider;
  RecordingSurface surface;
  Dashboard board;
};

// Panel 0 rows.
constexpr int TITLE_ROW = 3;
constexpr int UTIL_ROW = 4;
constexpr int DETAIL_ROW = 7;
constexpr int SPARK_UTIL_ROW = 8;
constexpr int STATUS_ROW = 1;
constexpr int FIRST_PROCESS_ROW = 15;

bool rowContains(const RecordingSurface& s, int row, const std::string& text) {
  return s.rowText(row).find(text) != std::string::npos;
}

} // namespace

/* ----------------------------- Startup ----------------------------- */

/** @test A failed first poll draws nothing and stays UNINITIALIZED. */
TEST(DashboardTest, StartupFailureDrawsNothing) {
  Fixture f;
  const TickStatus STATUS =
      f.board.start(PollResult::failure(PollStatus::PROVIDER_MISSING, "nvidia-smi not found"));

  EXPECT_EQ(STATUS, TickStatus::STARTUP_FAILURE);
  EXPECT_EQ(f.board.state(), DashboardState::UNINITIALIZED);
  EXPECT_TRUE(f.surface.writes().empty());
  EXPECT_EQ(f.surface.clearCount(), 0U);
  EXPECT_EQ(f.surface.flushCount(), 0U);
}

/** @test Start clears once, draws the frame and current values, then flushes. */
TEST(DashboardTest, StartDrawsFrame) {
  Fixture f;
  ASSERT_EQ(f.board.start(okResult()), TickStatus::UPDATED);

  EXPECT_EQ(f.board.state(), DashboardState::RUNNING);
  EXPECT_EQ(f.surface.clearCount(), 1U);
  EXPECT_EQ(f.surface.flushCount(), 1U);
  EXPECT_GT(f.board.cellsWritten(), 0U);

  EXPECT_TRUE(rowContains(f.surface, 0, "gpu-watch"));
  EXPECT_TRUE(rowContains(f.surface, 0, "550.54.15"));
  EXPECT_TRUE(rowContains(f.surface, 0, "scripted"));
  EXPECT_TRUE(rowContains(f.surface, STATUS_ROW, "LIVE"));
  EXPECT_TRUE(rowContains(f.surface, TITLE_ROW, "GPU 0: RTX 4090"));
  EXPECT_TRUE(rowContains(f.surface, UTIL_ROW, "65%"));
  EXPECT_TRUE(rowContains(f.surface, DETAIL_ROW, "72 C"));
  EXPECT_TRUE(rowContains(f.surface, DETAIL_ROW, "2520 MHz"));
}

/** @test tick() before start() polls and starts. */
TEST(DashboardTest, TickStartsWhenUninitialized) {
  Fixture f;
  f.provider.push(okResult());
  EXPECT_EQ(f.board.tick(), TickStatus::UPDATED);
  EXPECT_EQ(f.board.state(), DashboardState::RUNNING);
  EXPECT_EQ(f.provider.polls(), 1);
}

/* ----------------------------- Bars ----------------------------- */

/** @test 65% utilization fills 26 of 40 bar cells. */
TEST(DashboardTest, UtilizationBarFill) {
  Fixture f;
  ASSERT_EQ(f.board.start(okResult(65.0)), TickStatus::UPDATED);

  const auto& bar = f.board.layout().gpus[0].utilizationBar;
  ASSERT_EQ(bar.width, 40);
  int filled = 0;
  for (int c = 0; c < bar.width; ++c) {
    if (f.surface.glyphAt(bar.row, bar.col + c) == BAR_FILLED) {
      ++filled;
      EXPECT_EQ(f.surface.styleAt(bar.row, bar.col + c), Style::MEDIUM);
    } else {
      EXPECT_EQ(f.surface.glyphAt(bar.row, bar.col + c), BAR_EMPTY);
    }
  }
  EXPECT_EQ(filled, 26);
}

/* ----------------------------- Diff Rendering ----------------------------- */

/** @test With full histories and identical data a tick writes no cells. */
TEST(DashboardTest, IdenticalTickWritesNothing) {
  Fixture f(config(2));
  f.provider.push(okResult());
  ASSERT_EQ(f.board.start(okResult()), TickStatus::UPDATED);

  ASSERT_EQ(f.board.tick(), TickStatus::UPDATED);
  f.surface.resetLog();
  ASSERT_EQ(f.board.tick(), TickStatus::UPDATED);

  EXPECT_EQ(f.board.cellsWritten(), 0U);
  EXPECT_TRUE(f.surface.writes().empty());
  EXPECT_EQ(f.surface.clearCount(), 1U);
  EXPECT_EQ(f.surface.flushCount(), 3U);
}

/** @test A changed value rewrites only part of the screen. */
TEST(DashboardTest, ChangedValueWritesSome) {
  Fixture f(config(2));
  ASSERT_EQ(f.board.start(okResult(65.0)), TickStatus::UPDATED);
  const std::size_t FIRST = f.board.cellsWritten();

  f.provider.push(okResult(90.0));
  f.surface.resetLog();
  ASSERT_EQ(f.board.tick(), TickStatus::UPDATED);

  EXPECT_GT(f.board.cellsWritten(), 0U);
  EXPECT_LT(f.board.cellsWritten(), FIRST);
  EXPECT_TRUE(rowContains(f.surface, UTIL_ROW, "90%"));
  EXPECT_EQ(f.surface.clearCount(), 1U);
}

/* ----------------------------- History ----------------------------- */

/** @test Each successful tick appends one sample per known metric. */
TEST(DashboardTest, HistoryGrows) {
  Fixture f;
  f.provider.push(okResult(10.0));
  ASSERT_EQ(f.board.start(okResult(5.0)), TickStatus::UPDATED);
  ASSERT_EQ(f.board.tick(), TickStatus::UPDATED);

  const auto* hist = f.board.history(0);
  ASSERT_NE(hist, nullptr);
  EXPECT_EQ((*hist)[Metric::UTILIZATION].size(), 2U);
  EXPECT_DOUBLE_EQ((*hist)[Metric::UTILIZATION].at(0), 5.0);
  EXPECT_DOUBLE_EQ((*hist)[Metric::UTILIZATION].at(1), 10.0);
  EXPECT_EQ(f.board.history(1), nullptr);
}

/** @test Sparkline is right-aligned: newest sample in the last column. */
TEST(DashboardTest, SparklineRightAligned) {
  Fixture f(config(4));
  f.provider.push(okResult(90.0));
  ASSERT_EQ(f.board.start(okResult(10.0)), TickStatus::UPDATED);
  ASSERT_EQ(f.board.tick(), TickStatus::UPDATED);

  const auto& spark = f.board.layout().gpus[0].sparklines[0];
  ASSERT_EQ(spark.row, SPARK_UTIL_ROW);
  ASSERT_EQ(spark.width, 4);
  EXPECT_EQ(f.surface.glyphAt(spark.row, spark.col + 0), " ");
  EXPECT_EQ(f.surface.glyphAt(spark.row, spark.col + 1), " ");
  EXPECT_EQ(f.surface.glyphAt(spark.row, spark.col + 2), "▁");
  EXPECT_EQ(f.surface.glyphAt(spark.row, spark.col + 3), "█");
  EXPECT_EQ(f.surface.styleAt(spark.row, spark.col + 2), Style::LOW);
  EXPECT_EQ(f.surface.styleAt(spark.row, spark.col + 3), Style::HIGH);
}

/* ----------------------------- Failures ----------------------------- */

/** @test A failed poll keeps values and history and shows STALE. */
TEST(DashboardTest, FailedPollIsStale) {
  Fixture f;
  f.provider.push(PollResult::failure(PollStatus::TIMEOUT, "no answer"));
  ASSERT_EQ(f.board.start(okResult(65.0)), TickStatus::UPDATED);

  EXPECT_EQ(f.board.tick(), TickStatus::STALE);
  EXPECT_EQ(f.board.tick(), TickStatus::STALE);

  EXPECT_EQ(f.board.consecutiveFailures(), 2);
  EXPECT_EQ((*f.board.history(0))[Metric::UTILIZATION].size(), 1U);
  EXPECT_TRUE(rowContains(f.surface, STATUS_ROW, "STALE TIMEOUT (2 failed polls): no answer"));
  EXPECT_EQ(f.surface.styleAt(STATUS_ROW, f.board.layout().status.col), Style::HIGH);
  EXPECT_TRUE(rowContains(f.surface, UTIL_ROW, "65%"));
  ASSERT_EQ(f.board.current().gpus.size(), 1U);
  EXPECT_EQ(f.board.current().gpus[0].name, "RTX 4090");
}

/** @test Recovery resets the failure count and shows LIVE. */
TEST(DashboardTest, RecoveryAfterFailure) {
  Fixture f;
  f.provider.push(PollResult::failure(PollStatus::DRIVER_UNAVAILABLE, "boom"));
  f.provider.push(okResult(30.0));
  ASSERT_EQ(f.board.start(okResult()), TickStatus::UPDATED);

  EXPECT_EQ(f.board.tick(), TickStatus::STALE);
  EXPECT_EQ(f.board.tick(), TickStatus::UPDATED);
  EXPECT_EQ(f.board.consecutiveFailures(), 0);
  EXPECT_TRUE(rowContains(f.surface, STATUS_ROW, "LIVE"));
  EXPECT_FALSE(rowContains(f.surface, STATUS_ROW, "STALE"));
}

/* ----------------------------- Unknown Values ----------------------------- */

/** @test Unknown fields render as N/A and stay out of history. */
TEST(DashboardTest, UnknownFieldsShowNa) {
  PollResult r = okResult();
  r.driverVersion.clear();
  r.gpus[0].temperatureC.reset();
  r.gpus[0].fanSpeedPercent.reset();
  r.gpus[0].fieldErrors = 1;

  Fixture f;
  ASSERT_EQ(f.board.start(r), TickStatus::UPDATED);

  const auto& panel = f.board.layout().gpus[0];
  EXPECT_EQ(f.surface.rowText(DETAIL_ROW).substr(static_cast<std::size_t>(panel.temperature.col), 3),
            "N/A");
  EXPECT_EQ(f.surface.styleAt(DETAIL_ROW, panel.temperature.col), Style::DIM);
  EXPECT_TRUE(rowContains(f.surface, TITLE_ROW, "(1 unreadable field)"));
  EXPECT_TRUE((*f.board.history(0))[Metric::TEMPERATURE].empty());
  EXPECT_EQ((*f.board.history(0))[Metric::UTILIZATION].size(), 1U);
  EXPECT_EQ(f.surface.glyphAt(0, f.board.layout().driver.col), "N");
}

/* ----------------------------- GPU Count ----------------------------- */

/** @test The panel count is fixed by the first poll. */
TEST(DashboardTest, PanelCountFixedAtStart) {
  Fixture f;
  PollResult two = okResult();
  two.gpus.push_back(sampleGpu(10.0));
  two.gpus[1].index = 1;
  f.provider.push(two);

  ASSERT_EQ(f.board.start(okResult()), TickStatus::UPDATED);
  ASSERT_EQ(f.board.tick(), TickStatus::UPDATED);

  EXPECT_EQ(f.board.layout().gpus.size(), 1U);
  EXPECT_EQ(f.board.current().gpus.size(), 1U);
  EXPECT_EQ(f.board.history(1), nullptr);
}

/* ----------------------------- Processes ----------------------------- */

/** @test Empty process lists show a placeholder. */
TEST(DashboardTest, NoProcessesPlaceholder) {
  Fixture f;
  ASSERT_EQ(f.board.start(okResult()), TickStatus::UPDATED);
  ASSERT_FALSE(f.board.layout().processRows.empty());
  EXPECT_EQ(f.board.layout().processRows[0].row, FIRST_PROCESS_ROW);
  EXPECT_TRUE(rowContains(f.surface, FIRST_PROCESS_ROW, "No active GPU processes"));
}

/** @test Processes are listed with GPU, PID, name and memory. */
TEST(DashboardTest, ProcessRows) {
  PollResult r = okResult();
  GpuProcessEntry p{};
  p.pid = 4242;
  p.name = "python3";
  p.usedMemoryMiB = 2048.0;
  r.gpus[0].processes.push_back(p);

  Fixture f;
  ASSERT_EQ(f.board.start(r), TickStatus::UPDATED);
  const std::string ROW = f.surface.rowText(FIRST_PROCESS_ROW);
  EXPECT_NE(ROW.find("4242"), std::string::npos);
  EXPECT_NE(ROW.find("python3"), std::string::npos);
  EXPECT_NE(ROW.find("2.0 GiB"), std::string::npos);
  EXPECT_FALSE(rowContains(f.surface, FIRST_PROCESS_ROW + 1, "No active"));
}

/** @test Hiding processes removes the panel. */
TEST(DashboardTest, ProcessesHidden) {
  DashboardConfig cfg = config();
  cfg.showProcesses = false;
  Fixture f(cfg);
  ASSERT_EQ(f.board.start(okResult()), TickStatus::UPDATED);
  EXPECT_FALSE(f.board.layout().processesShown);
  EXPECT_FALSE(rowContains(f.surface, TITLE_ROW + 10, "Processes"));
}

/* ----------------------------- Run Loop ----------------------------- */

/** @test run() polls once per interval and returns once the stop flag is raised. */
TEST(DashboardTest, RunStopsOnFlag) {
  volatile std::sig_atomic_t stop = 0;
  StoppingProvider provider(okResult(), stop, 3);
  RecordingSurface surface(ROWS, COLS);
  DashboardConfig cfg = config();
  cfg.interval = std::chrono::milliseconds(100);
  Dashboard board(provider, surface, cfg, [] { return FIXED_TIME; });

  const auto START = std::chrono::steady_clock::now();
  board.run(stop);
  const auto ELAPSED = std::chrono::steady_clock::now() - START;

  EXPECT_EQ(provider.polls(), 3);
  EXPECT_EQ(board.state(), DashboardState::RUNNING);
  EXPECT_GE(ELAPSED, std::chrono::milliseconds(200));
  EXPECT_LT(ELAPSED, std::chrono::milliseconds(1000));
}

/** @test A flag raised before run() means no poll and no drawing. */
TEST(DashboardTest, RunWithFlagAlreadySet) {
  Fixture f;
  f.provider.push(okResult());
  const volatile std::sig_atomic_t STOP = 1;

  f.board.run(STOP);

  EXPECT_EQ(f.provider.polls(), 0);
  EXPECT_EQ(f.board.state(), DashboardState::UNINITIALIZED);
  EXPECT_TRUE(f.surface.writes().empty());
}

/* ----------------------------- Strings ----------------------------- */

/** @test State and tick status names. */
TEST(DashboardTest, StatusStrings) {
  EXPECT_STREQ(toString(DashboardState::RUNNING), "RUNNING");
  EXPECT_STREQ(toString(TickStatus::STALE), "STALE");
  EXPECT_STREQ(toString(TickStatus::STARTUP_FAILURE), "STARTUP_FAILURE");
}
