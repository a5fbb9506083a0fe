/**
 * @file PanelLayout_uTest.cpp
 * @brief Unit tests for dashboard field placement.
 */

#include "src/dashboard/inc/PanelLayout.hpp"

#include <gtest/gtest.h>

using gpuwatch::dashboard::computeLayout;
using gpuwatch::dashboard::Field;
using gpuwatch::dashboard::GPU_PANEL_HEIGHT;
using gpuwatch::dashboard::HEADER_HEIGHT;
using gpuwatch::dashboard::LayoutParams;
using gpuwatch::dashboard::Metric;
using gpuwatch::dashboard::PanelLayout;
using gpuwatch::dashboard::place;
using gpuwatch::dashboard::VALUE_COL;

namespace {

LayoutParams params(int rows, int cols, std::size_t gpus) {
  LayoutParams p{};
  p.rows = rows;
  p.cols = cols;
  p.gpuCount = gpus;
  return p;
}

} // namespace

/* ----------------------------- place ----------------------------- */

/** @test Fields inside the surface keep their width. */
TEST(PanelLayoutTest, PlaceInside) {
  const Field F = place(2, 10, 5, 24, 80);
  EXPECT_TRUE(F.visible);
  EXPECT_EQ(F.row, 2);
  EXPECT_EQ(F.col, 10);
  EXPECT_EQ(F.width, 5);
}

/** @test Fields cut by the right edge are narrowed. */
TEST(PanelLayoutTest, PlaceClipped) {
  const Field F = place(0, 75, 20, 24, 80);
  EXPECT_TRUE(F.visible);
  EXPECT_EQ(F.width, 5);
}

/** @test Fields off the surface are invisible. */
TEST(PanelLayoutTest, PlaceOutside) {
  EXPECT_FALSE(place(24, 0, 5, 24, 80).visible);
  EXPECT_FALSE(place(0, 80, 5, 24, 80).visible);
  EXPECT_FALSE(place(-1, 0, 5, 24, 80).visible);
  EXPECT_FALSE(place(0, 0, 0, 24, 80).visible);
}

/* ----------------------------- computeLayout ----------------------------- */

/** @test GPU panels stack below the header at fixed height. */
TEST(PanelLayoutTest, PanelsStack) {
  const PanelLayout L = computeLayout(params(60, 120, 2));
  ASSERT_EQ(L.gpus.size(), 2U);
  EXPECT_EQ(L.gpus[0].top, HEADER_HEIGHT);
  EXPECT_EQ(L.gpus[1].top, HEADER_HEIGHT + GPU_PANEL_HEIGHT);

  const auto& g = L.gpus[0];
  EXPECT_EQ(g.utilizationBar.row, HEADER_HEIGHT + 1);
  EXPECT_EQ(g.utilizationBar.col, VALUE_COL);
  EXPECT_EQ(g.utilizationBar.width, 40);
  EXPECT_EQ(g.utilizationText.col, VALUE_COL + 41);
  EXPECT_EQ(g.memoryBar.row, HEADER_HEIGHT + 2);
  EXPECT_EQ(g.powerBar.row, HEADER_HEIGHT + 3);
  EXPECT_EQ(g.temperature.row, HEADER_HEIGHT + 4);

  const auto& spark = g.sparklines[static_cast<std::size_t>(Metric::POWER)];
  EXPECT_EQ(spark.row, HEADER_HEIGHT + 8);
  EXPECT_EQ(spark.width, 60);
}

/** @test Process panel follows the last GPU and sets the total height. */
TEST(PanelLayoutTest, ProcessPanel) {
  LayoutParams p = params(60, 120, 1);
  p.processRows = 3;
  const PanelLayout L = computeLayout(p);

  EXPECT_TRUE(L.processesShown);
  ASSERT_EQ(L.processRows.size(), 3U);
  EXPECT_EQ(L.processRows[0].row, HEADER_HEIGHT + GPU_PANEL_HEIGHT + 2);
  EXPECT_EQ(L.height, HEADER_HEIGHT + GPU_PANEL_HEIGHT + 2 + 3);
}

/** @test Hidden process panel contributes nothing. */
TEST(PanelLayoutTest, ProcessPanelHidden) {
  LayoutParams p = params(60, 120, 1);
  p.showProcesses = false;
  const PanelLayout L = computeLayout(p);
  EXPECT_FALSE(L.processesShown);
  EXPECT_TRUE(L.processRows.empty());
  EXPECT_EQ(L.height, HEADER_HEIGHT + GPU_PANEL_HEIGHT);
}

/** @test On a small surface, lower panels are invisible rather than misplaced. */
TEST(PanelLayoutTest, SmallSurface) {
  const PanelLayout L = computeLayout(params(12, 40, 2));
  EXPECT_TRUE(L.gpus[0].title.visible);
  EXPECT_TRUE(L.gpus[0].utilizationBar.visible);
  EXPECT_EQ(L.gpus[0].utilizationBar.width, 40 - VALUE_COL);
  EXPECT_FALSE(L.gpus[0].utilizationText.visible);
  EXPECT_FALSE(L.gpus[1].title.visible);
  EXPECT_GT(L.height, 12);

  for (const auto& label : L.labels) {
    if (label.at.visible) {
      EXPECT_LT(label.at.row, 12);
      EXPECT_LE(label.at.col + label.at.width, 40);
    }
  }
}

/** @test Header fields sit on the first two rows. */
TEST(PanelLayoutTest, Header) {
  const PanelLayout L = computeLayout(params(40, 100, 1));
  EXPECT_EQ(L.driver.row, 0);
  EXPECT_EQ(L.cuda.row, 0);
  EXPECT_EQ(L.gpuCount.row, 0);
  EXPECT_EQ(L.backend.row, 0);
  EXPECT_EQ(L.clock.row, 1);
  EXPECT_EQ(L.status.row, 1);
  EXPECT_EQ(L.status.col + L.status.width, 100);
  EXPECT_FALSE(L.labels.empty());
}
