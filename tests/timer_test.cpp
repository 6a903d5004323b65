#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "utils/logger.hpp"
#include "utils/timer.hpp"

using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

}  // namespace

TEST(TimerTest, PeriodicTaskRepeats) {
  utils::Timer timer;
  std::atomic<int> ticks{0};
  timer.addPeriodicTask("tick", 0ms, 10ms, [&ticks]() { ++ticks; });
  timer.start();
  EXPECT_TRUE(eventually([&]() { return ticks.load() >= 3; }));
  timer.stop();
  int after = ticks.load();
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(ticks.load(), after);
}

TEST(TimerTest, OnceTaskRunsOnce) {
  utils::Timer timer;
  std::atomic<int> runs{0};
  timer.addOnceTask("once", 5ms, [&runs]() { ++runs; });
  timer.start();
  EXPECT_TRUE(eventually([&]() { return runs.load() == 1; }));
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(runs.load(), 1);
}

TEST(TimerTest, CancelledTaskDoesNotRun) {
  utils::Timer timer;
  std::atomic<int> runs{0};
  auto id = timer.addOnceTask("later", 50ms, [&runs]() { ++runs; });
  timer.start();
  EXPECT_TRUE(timer.cancel(id));
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(runs.load(), 0);
  EXPECT_FALSE(timer.cancel(id));
}

TEST(TimerTest, CancelIgnoresFinishedAndUnknownTasks) {
  utils::Timer timer;
  std::atomic<int> runs{0};
  auto id = timer.addOnceTask("quick", 0ms, [&runs]() { ++runs; });
  timer.start();
  ASSERT_TRUE(eventually([&]() { return runs.load() == 1; }));
  EXPECT_FALSE(timer.cancel(id));
  EXPECT_FALSE(timer.cancel(id + 1000));

  auto periodic = timer.addPeriodicTask("tick", 0ms, 5ms, []() {});
  EXPECT_TRUE(timer.cancel(periodic));
  timer.stop();
}

TEST(TimerTest, ThrowingCallbackIsLoggedAndTimerContinues) {
  std::ostringstream captured;
  utils::LogConfig cfg;
  cfg.toFile = false;
  auto logger = std::make_shared<utils::Logger>(cfg);
  logger->setConsoleStream(&captured);

  utils::Timer timer(logger);
  std::atomic<int> ticks{0};
  timer.addPeriodicTask("boom", 0ms, 10ms, [&ticks]() {
    ++ticks;
    throw std::runtime_error("render failed");
  });
  timer.start();
  EXPECT_TRUE(eventually([&]() { return ticks.load() >= 2; }));
  timer.stop();
  EXPECT_NE(captured.str().find("render failed"), std::string::npos);
}

TEST(TimerTest, NonStandardThrowIsLoggedAndTimerContinues) {
  std::ostringstream captured;
  utils::LogConfig cfg;
  cfg.toFile = false;
  auto logger = std::make_shared<utils::Logger>(cfg);
  logger->setConsoleStream(&captured);

  utils::Timer timer(logger);
  std::atomic<int> ticks{0};
  timer.addPeriodicTask("int-thrower", 0ms, 10ms, [&ticks]() {
    ++ticks;
    throw 42;
  });
  timer.start();
  EXPECT_TRUE(eventually([&]() { return ticks.load() >= 2; }));
  timer.stop();
  EXPECT_NE(captured.str().find("int-thrower' threw an unknown exception"),
            std::string::npos);
}

TEST(TimerTest, StopFromCallbackDoesNotDeadlock) {
  utils::Timer timer;
  std::atomic<bool> stopped{false};
  timer.addOnceTask("self-stop", 0ms, [&]() {
    timer.stop();
    stopped = true;
  });
  timer.start();
  EXPECT_TRUE(eventually([&]() { return stopped.load(); }));
  EXPECT_FALSE(timer.isRunning());
}
