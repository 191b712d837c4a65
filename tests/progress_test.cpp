
#include "progress.hpp"
#include <gtest/gtest.h>

using namespace ferry;
using namespace std::chrono_literals;

TEST(Progress, PercentRoundsAndClamps) {
  EXPECT_EQ(ProgressMeter::percent_of(0, 1000), 0);
  EXPECT_EQ(ProgressMeter::percent_of(5, 1000), 1);
  EXPECT_EQ(ProgressMeter::percent_of(4, 1000), 0);
  EXPECT_EQ(ProgressMeter::percent_of(999, 1000), 100);
  EXPECT_EQ(ProgressMeter::percent_of(2000, 1000), 100);
  EXPECT_EQ(ProgressMeter::percent_of(0, 0), 100);
}

TEST(Progress, ThrottledToInterval) {
  auto t0 = ProgressMeter::Clock::now();
  ProgressMeter m(1000000, 200ms, t0);
  EXPECT_FALSE(m.update(1000, t0 + 50ms));
  EXPECT_FALSE(m.update(2000, t0 + 199ms));
  auto s = m.update(3000, t0 + 200ms);
  ASSERT_TRUE(s);
  EXPECT_EQ(s->done, 3000u);
  EXPECT_FALSE(m.update(4000, t0 + 300ms));
  EXPECT_TRUE(m.update(5000, t0 + 400ms));
}

TEST(Progress, SpeedSeededThenSmoothed) {
  auto t0 = ProgressMeter::Clock::now();
  ProgressMeter m(10000000, 200ms, t0);

  // 200 kB in 0.2 s: the first sample is the instantaneous rate.
  auto s1 = m.update(200000, t0 + 200ms);
  ASSERT_TRUE(s1);
  EXPECT_NEAR(s1->speed, 1000000.0, 1.0);

  // Next 0.2 s moves 400 kB (2 MB/s): 0.7 * 1 MB/s + 0.3 * 2 MB/s.
  auto s2 = m.update(600000, t0 + 400ms);
  ASSERT_TRUE(s2);
  EXPECT_NEAR(s2->speed, 1300000.0, 1.0);
  EXPECT_EQ(s2->percent, 6);
  // ceil(9.4 MB / 1.3 MB/s)
  EXPECT_EQ(s2->eta_s, 8u);
}

TEST(Progress, FinishAlwaysReportsFullPayload) {
  auto t0 = ProgressMeter::Clock::now();
  ProgressMeter m(4096, 200ms, t0);
  auto s = m.finish(t0 + 1ms);
  EXPECT_EQ(s.percent, 100);
  EXPECT_EQ(s.done, 4096u);
  EXPECT_EQ(s.eta_s, 0u);
}

TEST(Progress, EmptyPayloadFinishesAtHundred) {
  auto t0 = ProgressMeter::Clock::now();
  ProgressMeter m(0, 200ms, t0);
  auto s = m.finish(t0);
  EXPECT_EQ(s.percent, 100);
  EXPECT_EQ(s.speed, 0.0);
}
