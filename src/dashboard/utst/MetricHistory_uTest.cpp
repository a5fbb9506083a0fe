/**
 * @file MetricHistory_uTest.cpp
 * @brief Unit tests for gpuwatch::dashboard::MetricHistory and GpuHistory.
 */

#include "src/dashboard/inc/MetricHistory.hpp"

#include <gtest/gtest.h>

#include <optional>

using gpuwatch::dashboard::GpuHistory;
using gpuwatch::dashboard::Metric;
using gpuwatch::dashboard::MetricHistory;

/** @test Empty history reports nothing. */
TEST(MetricHistoryTest, Empty) {
  const MetricHistory H(5);
  EXPECT_TRUE(H.empty());
  EXPECT_EQ(H.capacity(), 5U);
  EXPECT_FALSE(H.latest().has_value());
  EXPECT_FALSE(H.min().has_value());
  EXPECT_TRUE(H.values().empty());
}

/** @test Zero capacity is raised to one. */
TEST(MetricHistoryTest, ZeroCapacity) {
  MetricHistory h(0);
  EXPECT_EQ(h.capacity(), 1U);
  h.push(1.0);
  h.push(2.0);
  EXPECT_EQ(h.size(), 1U);
  EXPECT_DOUBLE_EQ(h.latest().value_or(-1.0), 2.0);
}

/** @test Overflow keeps the newest samples in arrival order. */
TEST(MetricHistoryTest, EvictsOldest) {
  MetricHistory h(60);
  for (int i = 1; i <= 61; ++i) {
    h.push(static_cast<double>(i));
  }

  ASSERT_EQ(h.size(), 60U);
  EXPECT_DOUBLE_EQ(h.at(0), 2.0);
  EXPECT_DOUBLE_EQ(h.at(59), 61.0);

  const auto VALUES = h.values();
  ASSERT_EQ(VALUES.size(), 60U);
  for (std::size_t i = 0; i < VALUES.size(); ++i) {
    EXPECT_DOUBLE_EQ(VALUES[i], static_cast<double>(i + 2));
  }
  EXPECT_DOUBLE_EQ(h.min().value_or(-1.0), 2.0);
  EXPECT_DOUBLE_EQ(h.max().value_or(-1.0), 61.0);
  EXPECT_DOUBLE_EQ(h.latest().value_or(-1.0), 61.0);
}

/** @test clear() keeps capacity. */
TEST(MetricHistoryTest, Clear) {
  MetricHistory h(3);
  h.push(1.0);
  h.push(2.0);
  h.clear();
  EXPECT_TRUE(h.empty());
  EXPECT_EQ(h.capacity(), 3U);
  h.push(7.0);
  EXPECT_DOUBLE_EQ(h.at(0), 7.0);
}

/** @test Unknown values are not recorded. */
TEST(GpuHistoryTest, SkipsUnknown) {
  GpuHistory g(4);
  g.record(Metric::UTILIZATION, 10.0);
  g.record(Metric::UTILIZATION, std::nullopt);
  g.record(Metric::POWER, std::nullopt);

  EXPECT_EQ(g[Metric::UTILIZATION].size(), 1U);
  EXPECT_TRUE(g[Metric::POWER].empty());
  EXPECT_EQ(g[Metric::MEMORY].capacity(), 4U);
}

/** @test Metric labels. */
TEST(GpuHistoryTest, MetricNames) {
  EXPECT_STREQ(toString(Metric::UTILIZATION), "GPU");
  EXPECT_STREQ(toString(Metric::MEMORY), "MEM");
  EXPECT_STREQ(toString(Metric::TEMPERATURE), "TEMP");
  EXPECT_STREQ(toString(Metric::POWER), "PWR");
}
