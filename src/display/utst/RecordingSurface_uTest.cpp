/**
 * @file RecordingSurface_uTest.cpp
 * @brief Unit tests for gpuwatch::display::RecordingSurface.
 */

#include "src/display/inc/RecordingSurface.hpp"

#include <gtest/gtest.h>

using gpuwatch::display::RecordingSurface;
using gpuwatch::display::Style;

/** @test A new surface is blank. */
TEST(RecordingSurfaceTest, StartsBlank) {
  const RecordingSurface S(2, 5);
  EXPECT_EQ(S.rows(), 2);
  EXPECT_EQ(S.cols(), 5);
  EXPECT_EQ(S.rowText(0), "     ");
  EXPECT_TRUE(S.writes().empty());
  EXPECT_EQ(S.clearCount(), 0U);
}

/** @test Writes land in the grid with their style and are logged. */
TEST(RecordingSurfaceTest, WriteAndInspect) {
  RecordingSurface s(3, 10);
  s.writeAt(1, 2, "abc", Style::HIGH);

  EXPECT_EQ(s.rowText(1), "  abc     ");
  EXPECT_EQ(s.glyphAt(1, 3), "b");
  EXPECT_EQ(s.styleAt(1, 3), Style::HIGH);
  EXPECT_EQ(s.styleAt(1, 0), Style::NORMAL);
  ASSERT_EQ(s.writes().size(), 1U);
  EXPECT_EQ(s.writes()[0].text, "abc");
  EXPECT_EQ(s.writes()[0].col, 2);
}

/** @test Multi-byte glyphs occupy one cell each. */
TEST(RecordingSurfaceTest, Utf8Cells) {
  RecordingSurface s(1, 4);
  s.writeAt(0, 0, "█░▁", Style::LOW);
  EXPECT_EQ(s.glyphAt(0, 0), "█");
  EXPECT_EQ(s.glyphAt(0, 1), "░");
  EXPECT_EQ(s.glyphAt(0, 2), "▁");
  EXPECT_EQ(s.glyphAt(0, 3), " ");
}

/** @test Text is clipped at the right edge; outside writes are ignored. */
TEST(RecordingSurfaceTest, ClippingAndBounds) {
  RecordingSurface s(2, 4);
  s.writeAt(0, 2, "wxyz", Style::NORMAL);
  EXPECT_EQ(s.rowText(0), "  wx");

  s.resetLog();
  s.writeAt(-1, 0, "a", Style::NORMAL);
  s.writeAt(0, 4, "a", Style::NORMAL);
  s.writeAt(2, 0, "a", Style::NORMAL);
  s.writeAt(0, 0, "", Style::NORMAL);
  EXPECT_TRUE(s.writes().empty());
  EXPECT_EQ(s.glyphAt(5, 5), "");
}

/** @test clear() blanks the grid and is counted; flush() is counted. */
TEST(RecordingSurfaceTest, ClearAndFlush) {
  RecordingSurface s(1, 3);
  s.writeAt(0, 0, "abc", Style::TITLE);
  s.clear();
  s.flush();
  s.flush();
  EXPECT_EQ(s.rowText(0), "   ");
  EXPECT_EQ(s.styleAt(0, 0), Style::NORMAL);
  EXPECT_EQ(s.clearCount(), 1U);
  EXPECT_EQ(s.flushCount(), 2U);
}

/** @test Style names. */
TEST(RecordingSurfaceTest, StyleNames) {
  EXPECT_STREQ(toString(Style::NORMAL), "NORMAL");
  EXPECT_STREQ(toString(Style::DIM), "DIM");
  EXPECT_STREQ(toString(Style::HIGH), "HIGH");
}
