#include "corvid/timer-fd.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "corvid/event-loop.hpp"
#include "corvid/event.hpp"

using namespace corvid;
using namespace std::chrono_literals;

TEST(TimerFd, NothingToConsumeWhenDisarmed) {
  TimerFd timer;
  EventLoop loop(20ms);
  loop.addOrThrow(EventLoop::EventFd{EventIn, timer.fd()});
  EXPECT_TRUE(loop.poll().empty());
  EXPECT_EQ(timer.consumeExpirations(), 0U);
}

TEST(TimerFd, IntervalWakesTheLoop) {
  TimerFd timer;
  timer.setInterval(5ms);
  EventLoop loop(500ms);
  loop.addOrThrow(EventLoop::EventFd{EventIn, timer.fd()});

  auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, timer.fd());
  EXPECT_GE(timer.consumeExpirations(), 1U);
}

TEST(TimerFd, ExpirationsAccumulateUntilConsumed) {
  TimerFd timer;
  timer.setInterval(2ms);
  std::this_thread::sleep_for(30ms);
  EXPECT_GT(timer.consumeExpirations(), 1U);
}

TEST(TimerFd, ZeroIntervalDisarms) {
  TimerFd timer;
  timer.setInterval(5ms);
  timer.setInterval(SysDuration::zero());
  static_cast<void>(timer.consumeExpirations());
  EventLoop quiet(20ms);
  quiet.addOrThrow(EventLoop::EventFd{EventIn, timer.fd()});
  EXPECT_TRUE(quiet.poll().empty());
}
