#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <swipe/batch/periodic_timer.hpp>
#include <thread>

#include "fakes.hpp"

using namespace std::chrono_literals;
using swipe::batch::PeriodicTimer;
using swipe::batch::fakes::wait_until;

TEST(PeriodicTimerTest, RejectsInvalidArguments) {
  EXPECT_THROW(PeriodicTimer("t", 0ms, [] {}), std::invalid_argument);
  EXPECT_THROW(PeriodicTimer("t", 10ms, nullptr), std::invalid_argument);
}

TEST(PeriodicTimerTest, RunsImmediatelyWhenAsked) {
  std::atomic<int> runs{0};
  PeriodicTimer timer("immediate", 1h, [&] { ++runs; });

  timer.start(true);
  EXPECT_TRUE(wait_until([&] { return runs.load() == 1; }));
  timer.stop();
  EXPECT_EQ(runs.load(), 1);
  EXPECT_EQ(timer.ticks(), 1u);
}

TEST(PeriodicTimerTest, WaitsForFirstIntervalOtherwise) {
  std::atomic<int> runs{0};
  PeriodicTimer timer("delayed", 1h, [&] { ++runs; });

  timer.start(false);
  std::this_thread::sleep_for(50ms);
  timer.stop();
  EXPECT_EQ(runs.load(), 0);
}

TEST(PeriodicTimerTest, FiresRepeatedly) {
  std::atomic<int> runs{0};
  PeriodicTimer timer("repeat", 10ms, [&] { ++runs; });

  timer.start(false);
  EXPECT_TRUE(wait_until([&] { return runs.load() >= 3; }));
  timer.stop();
}

TEST(PeriodicTimerTest, StopIsPromptAndIdempotent) {
  std::atomic<int> runs{0};
  PeriodicTimer timer("stop", 1h, [&] { ++runs; });
  timer.start(false);
  EXPECT_TRUE(timer.running());

  auto begin = std::chrono::steady_clock::now();
  timer.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
  EXPECT_FALSE(timer.running());

  EXPECT_NO_THROW(timer.stop());
  EXPECT_EQ(runs.load(), 0);
}

TEST(PeriodicTimerTest, StopWaitsForInFlightTick) {
  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
  PeriodicTimer timer("slow", 1h, [&] {
    entered = true;
    std::this_thread::sleep_for(100ms);
    finished = true;
  });

  timer.start(true);
  ASSERT_TRUE(wait_until([&] { return entered.load(); }));
  timer.stop();
  EXPECT_TRUE(finished.load());
}

TEST(PeriodicTimerTest, SecondStartIsNoOp) {
  std::atomic<int> runs{0};
  PeriodicTimer timer("twice", 1h, [&] { ++runs; });

  timer.start(true);
  timer.start(true);
  EXPECT_TRUE(wait_until([&] { return runs.load() >= 1; }));
  std::this_thread::sleep_for(50ms);
  timer.stop();
  EXPECT_EQ(runs.load(), 1);
}

TEST(PeriodicTimerTest, Accessors) {
  PeriodicTimer timer("named", 250ms, [] {});
  EXPECT_EQ(timer.name(), "named");
  EXPECT_EQ(timer.interval(), 250ms);
  EXPECT_FALSE(timer.running());
}
