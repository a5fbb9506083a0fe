/**
 * @file Sparkline_uTest.cpp
 * @brief Unit tests for sparkline level scaling.
 */

#include "src/dashboard/inc/Sparkline.hpp"

#include <gtest/gtest.h>

#include <string>

using gpuwatch::dashboard::MetricHistory;
using gpuwatch::dashboard::SPARK_GLYPHS;
using gpuwatch::dashboard::sparkGlyph;
using gpuwatch::dashboard::sparkLevel;
using gpuwatch::dashboard::sparkLevels;

/** @test Range ends map to the lowest and highest level. */
TEST(SparklineTest, LevelEnds) {
  EXPECT_EQ(sparkLevel(10.0, 10.0, 90.0), 0);
  EXPECT_EQ(sparkLevel(90.0, 10.0, 90.0), 7);
  EXPECT_EQ(sparkLevel(50.0, 10.0, 90.0), 4);
}

/** @test A flat or inverted range is level 0. */
TEST(SparklineTest, FlatRange) {
  EXPECT_EQ(sparkLevel(5.0, 5.0, 5.0), 0);
  EXPECT_EQ(sparkLevel(5.0, 9.0, 1.0), 0);
}

/** @test Levels follow the buffer's own min and max. */
TEST(SparklineTest, LevelsFromHistory) {
  MetricHistory h(4);
  for (const double V : {20.0, 40.0, 60.0, 80.0}) {
    h.push(V);
  }
  const auto LEVELS = sparkLevels(h);
  ASSERT_EQ(LEVELS.size(), 4U);
  EXPECT_EQ(LEVELS.front(), 0);
  EXPECT_EQ(LEVELS.back(), 7);
  EXPECT_LE(LEVELS[1], LEVELS[2]);
}

/** @test A constant buffer draws the lowest glyph throughout. */
TEST(SparklineTest, ConstantHistory) {
  MetricHistory h(3);
  h.push(42.0);
  h.push(42.0);
  h.push(42.0);
  for (const int L : sparkLevels(h)) {
    EXPECT_EQ(L, 0);
  }
  EXPECT_TRUE(sparkLevels(MetricHistory(3)).empty());
}

/** @test Glyph lookup clamps. */
TEST(SparklineTest, Glyphs) {
  EXPECT_EQ(std::string(sparkGlyph(0)), "▁");
  EXPECT_EQ(std::string(sparkGlyph(7)), "█");
  EXPECT_EQ(std::string(sparkGlyph(-3)), SPARK_GLYPHS[0]);
  EXPECT_EQ(std::string(sparkGlyph(42)), SPARK_GLYPHS[7]);
}
