#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "Progress/ProgressMap.hpp"
#include "Progress/ProgressTracker.hpp"

using namespace bucketdl;
using namespace std::chrono_literals;

TEST(ProgressMapTest, LastWriteWins) {
  ProgressMap map;
  EXPECT_FALSE(map.get("t1").has_value());
  map.set("t1", "transferred 10.00%");
  map.set("t1", "transferred 20.00%");
  EXPECT_EQ(map.get("t1").value(), "transferred 20.00%");
  EXPECT_EQ(map.size(), 1u);
}

TEST(ProgressMapTest, SnapshotIsSortedById) {
  ProgressMap map;
  map.set("c", "3");
  map.set("a", "1");
  map.set("b", "2");
  auto entries = map.snapshot();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0], (ProgressMap::Entry{"a", "1"}));
  EXPECT_EQ(entries[2], (ProgressMap::Entry{"c", "3"}));
}

TEST(ProgressMapTest, ConcurrentWritersAndSnapshots) {
  ProgressMap map;
  std::atomic<bool> done{false};
  std::thread reader([&]() {
    while (!done.load()) {
      for (const auto& entry : map.snapshot()) {
        ASSERT_EQ(entry.second.rfind("status ", 0), 0u);
      }
    }
  });

  std::vector<std::thread> writers;
  for (int w = 0; w < 4; ++w) {
    writers.emplace_back([&map, w]() {
      for (int i = 0; i < 2000; ++i) {
        map.set("task-" + std::to_string((w * 7 + i) % 50),
                "status " + std::to_string(i));
      }
    });
  }
  for (auto& t : writers) t.join();
  done = true;
  reader.join();
  EXPECT_EQ(map.size(), 50u);
}

TEST(ProgressTrackerTest, RenderOnceWritesEveryEntry) {
  auto map = std::make_shared<ProgressMap>();
  map->set("id-2", "transferred 50.00%  1.00MB/s");
  map->set("id-1", "transferred 100.00%  2.00MB/s");

  std::ostringstream out;
  TrackerOptions options;
  options.clearScreen = false;
  options.sink = &out;
  ProgressTracker tracker(map, options);
  tracker.renderOnce();

  EXPECT_EQ(out.str(),
            "Progress:\n"
            "id-1: transferred 100.00%  2.00MB/s\n"
            "id-2: transferred 50.00%  1.00MB/s\n");
  EXPECT_EQ(tracker.renderCount(), 1u);
}

TEST(ProgressTrackerTest, ClearsScreenBeforeEachFrame) {
  auto map = std::make_shared<ProgressMap>();
  std::ostringstream out;
  TrackerOptions options;
  options.sink = &out;
  ProgressTracker tracker(map, options);
  tracker.renderOnce();
  EXPECT_EQ(out.str().rfind("\033[2J\033[H", 0), 0u);
}

TEST(ProgressTrackerTest, RendersPeriodicallyUntilStopped) {
  auto map = std::make_shared<ProgressMap>();
  map->set("only", "transferred 1 bytes  0.00MB/s");
  std::ostringstream out;
  TrackerOptions options;
  options.interval = 10ms;
  options.clearScreen = false;
  options.sink = &out;

  ProgressTracker tracker(map, options);
  tracker.start();
  EXPECT_TRUE(tracker.isRunning());
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (tracker.renderCount() < 3 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  tracker.stop();
  EXPECT_FALSE(tracker.isRunning());
  size_t renders = tracker.renderCount();
  EXPECT_GE(renders, 3u);

  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(tracker.renderCount(), renders);
  tracker.stop();  // idempotent
}

TEST(ProgressTrackerTest, StopRacingWithRenderDoesNotDeadlock) {
  auto map = std::make_shared<ProgressMap>();
  for (int i = 0; i < 100; ++i) map->set(std::to_string(i), "x");
  std::ostringstream out;
  TrackerOptions options;
  options.interval = 1ms;
  options.clearScreen = false;
  options.sink = &out;

  for (int round = 0; round < 20; ++round) {
    ProgressTracker tracker(map, options);
    tracker.start();
    std::thread manual([&tracker]() { tracker.renderOnce(); });
    tracker.stop();
    manual.join();
  }
  SUCCEED();
}
