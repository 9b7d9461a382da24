/**
 * @file Pressure_uTest.cpp
 * @brief Unit tests for zfree::memory::parsePressure.
 */

#include "src/memory/inc/Pressure.hpp"
#include "src/memory/inc/SourceStatus.hpp"

#include <gtest/gtest.h>

using zfree::memory::parsePressure;
using zfree::memory::PressureStats;
using zfree::memory::SourceStatus;

/** @test Both lines parse into their three windows. */
TEST(PressureParse, TwoLines) {
  PressureStats stats{};
  ASSERT_EQ(parsePressure("some avg10=1.50 avg60=0.25 avg300=0.00 total=12345\n"
                          "full avg10=0.75 avg60=0.10 avg300=0.01 total=678\n",
                          stats),
            SourceStatus::OK);
  EXPECT_DOUBLE_EQ(stats.some[0], 1.50);
  EXPECT_DOUBLE_EQ(stats.some[1], 0.25);
  EXPECT_DOUBLE_EQ(stats.some[2], 0.00);
  EXPECT_DOUBLE_EQ(stats.full[0], 0.75);
  EXPECT_DOUBLE_EQ(stats.full[1], 0.10);
  EXPECT_DOUBLE_EQ(stats.full[2], 0.01);
}

/** @test The total= column is not required. */
TEST(PressureParse, TotalOptional) {
  PressureStats stats{};
  EXPECT_EQ(parsePressure("some avg10=1 avg60=2 avg300=3\nfull avg10=4 avg60=5 avg300=6", stats),
            SourceStatus::OK);
  EXPECT_DOUBLE_EQ(stats.full[2], 6.0);
}

/** @test A single line is malformed. */
TEST(PressureParse, MissingFullLine) {
  PressureStats stats{};
  EXPECT_EQ(parsePressure("some avg10=0.00 avg60=0.00 avg300=0.00 total=0\n", stats),
            SourceStatus::MALFORMED);
}

/** @test Bad key=value tokens are malformed and leave output untouched. */
TEST(PressureParse, BadToken) {
  PressureStats stats{};
  stats.some[0] = 9.0;
  EXPECT_EQ(parsePressure("some avg10 avg60=0.00 avg300=0.00\n"
                          "full avg10=0.00 avg60=0.00 avg300=0.00\n",
                          stats),
            SourceStatus::MALFORMED);
  EXPECT_EQ(parsePressure("some avg10=x avg60=0.00 avg300=0.00\n"
                          "full avg10=0.00 avg60=0.00 avg300=0.00\n",
                          stats),
            SourceStatus::MALFORMED);
  EXPECT_DOUBLE_EQ(stats.some[0], 9.0);
}

/** @test Too few tokens on a line is malformed. */
TEST(PressureParse, ShortLine) {
  PressureStats stats{};
  EXPECT_EQ(parsePressure("some avg10=0.00\nfull avg10=0.00 avg60=0.00 avg300=0.00\n", stats),
            SourceStatus::MALFORMED);
}
