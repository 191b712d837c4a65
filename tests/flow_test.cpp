
#include "flow.hpp"
#include "loopback_channel.hpp"
#include <gtest/gtest.h>

using namespace ferry;
using test::LoopbackChannel;
using namespace std::chrono_literals;

TEST(FlowController, NoPacingWithoutRateCap) {
  asio::io_context io;
  FlowController flow(io, FlowOptions{});
  auto t0 = FlowController::Clock::now();
  flow.start(t0);
  EXPECT_EQ(flow.pacing_delay(1 << 30, t0), FlowController::Clock::duration::zero());
}

TEST(FlowController, PacingDelayFollowsRateCap) {
  asio::io_context io;
  FlowOptions opts;
  opts.rate_limit = 1000000; // 1 MB/s
  FlowController flow(io, opts);
  auto t0 = FlowController::Clock::now();
  flow.start(t0);

  // 500 kB after 100 ms is 400 ms ahead of the cap.
  auto d = flow.pacing_delay(500000, t0 + 100ms);
  EXPECT_NEAR((std::chrono::duration<double, std::milli>(d).count()), 400.0, 1.0);

  // Behind schedule owes nothing.
  EXPECT_EQ(flow.pacing_delay(500000, t0 + 800ms), FlowController::Clock::duration::zero());
}

TEST(FlowController, ResumesImmediatelyUnderHighWater) {
  asio::io_context io;
  FlowOptions opts;
  opts.high_water = 1024;
  FlowController flow(io, opts);
  auto ch = std::make_shared<LoopbackChannel>(io, LoopbackChannel::Mode::Stuck);
  ch->send(std::vector<uint8_t>(512));

  bool ran = false;
  flow.wait_for_room(*ch, [&]() { ran = true; });
  EXPECT_FALSE(ran); // always deferred to the loop
  io.run_for(50ms);
  EXPECT_TRUE(ran);
  EXPECT_EQ(flow.suspensions(), 0u);
}

TEST(FlowController, PollsUntilDrainedWithoutNotification) {
  asio::io_context io;
  FlowOptions opts;
  opts.high_water = 1024;
  opts.drain_poll = 5ms;
  FlowController flow(io, opts);
  auto ch = std::make_shared<LoopbackChannel>(io, LoopbackChannel::Mode::Stuck);
  ch->send(std::vector<uint8_t>(4096));

  bool ran = false;
  flow.wait_for_room(*ch, [&]() { ran = true; });
  io.run_for(40ms);
  io.restart();
  EXPECT_FALSE(ran);
  EXPECT_EQ(flow.suspensions(), 1u);

  ch->release();
  io.run_for(40ms);
  EXPECT_TRUE(ran);
}

TEST(FlowController, UsesDrainNotificationWhenOffered) {
  asio::io_context io;
  FlowOptions opts;
  opts.high_water = 1024;
  opts.drain_poll = 10s; // a poll would never fire within the test
  FlowController flow(io, opts);
  auto ch = std::make_shared<LoopbackChannel>(io, LoopbackChannel::Mode::Stuck);
  ch->set_drain_support(true);
  ch->send(std::vector<uint8_t>(4096));

  bool ran = false;
  flow.wait_for_room(*ch, [&]() { ran = true; });
  io.poll();
  EXPECT_FALSE(ran);
  ch->release();
  EXPECT_TRUE(ran);
}

TEST(FlowController, ClosedChannelReleasesWaiter) {
  asio::io_context io;
  FlowOptions opts;
  opts.high_water = 10;
  opts.drain_poll = 5ms;
  FlowController flow(io, opts);
  auto ch = std::make_shared<LoopbackChannel>(io, LoopbackChannel::Mode::Stuck);
  ch->send(std::vector<uint8_t>(100));

  bool ran = false;
  flow.wait_for_room(*ch, [&]() { ran = true; });
  ch->close();
  io.run_for(30ms);
  EXPECT_TRUE(ran);
}

TEST(FlowController, CancelDropsPendingContinuation) {
  asio::io_context io;
  FlowOptions opts;
  opts.high_water = 10;
  opts.drain_poll = 5ms;
  FlowController flow(io, opts);
  auto ch = std::make_shared<LoopbackChannel>(io, LoopbackChannel::Mode::Stuck);
  ch->send(std::vector<uint8_t>(100));

  bool ran = false;
  flow.wait_for_room(*ch, [&]() { ran = true; });
  flow.cancel();
  ch->release();
  io.run_for(30ms);
  EXPECT_FALSE(ran);
}

TEST(FlowController, PaceWaitsOutTheOwedDelay) {
  asio::io_context io;
  FlowOptions opts;
  opts.rate_limit = 100000; // 100 kB/s
  FlowController flow(io, opts);
  auto t0 = FlowController::Clock::now();
  flow.start(t0);

  FlowController::Clock::time_point fired{};
  flow.pace(5000, [&]() { fired = FlowController::Clock::now(); });
  io.run_for(500ms);
  ASSERT_NE(fired, FlowController::Clock::time_point{});
  EXPECT_GE(fired - t0, 45ms);
}
