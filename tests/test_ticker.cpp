/**
 * Unit tests for the fixed-period Ticker.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>

#include "common/ticker.hpp"

using namespace std::chrono_literals;

TEST(Ticker, FirstTickOneIntervalAfterStart) {
  auto start = Ticker::Clock::now();
  Ticker t(100ms, start);
  EXPECT_EQ(t.nextRun(), start + 100ms);
  EXPECT_FALSE(t.due(start + 99ms));
  EXPECT_TRUE(t.due(start + 100ms));
}

TEST(Ticker, AdvanceKeepsThePeriodGrid) {
  auto start = Ticker::Clock::now();
  Ticker t(100ms, start);
  // served 30ms late: the next tick still lands on the grid, not 100ms later
  t.advance(start + 130ms);
  EXPECT_EQ(t.nextRun(), start + 200ms);
}

TEST(Ticker, MissedTicksCollapseIntoOne) {
  auto start = Ticker::Clock::now();
  Ticker t(100ms, start);
  t.advance(start + 350ms);
  EXPECT_EQ(t.nextRun(), start + 400ms);
  EXPECT_FALSE(t.due(start + 350ms));
}

TEST(Ticker, AdvanceExactlyOnBoundary) {
  auto start = Ticker::Clock::now();
  Ticker t(50ms, start);
  t.advance(start + 50ms);
  EXPECT_EQ(t.nextRun(), start + 100ms);
}

TEST(Ticker, AdvanceBeforeDueIsNoop) {
  auto start = Ticker::Clock::now();
  Ticker t(50ms, start);
  t.advance(start + 10ms);
  EXPECT_EQ(t.nextRun(), start + 50ms);
}

TEST(Ticker, RejectsNonPositiveInterval) {
  EXPECT_THROW(Ticker(0ms), std::invalid_argument);
}
