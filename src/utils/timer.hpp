#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "logger.hpp"

namespace utils {

// Runs once and periodic callbacks on a single background thread.
class Timer {
 public:
  using TaskId = uint64_t;

  struct TimerTask {
    TaskId id;
    std::string name;
    std::chrono::steady_clock::time_point execTimestamp;
    std::function<void()> callback;
    bool isPeriodic;
    std::chrono::milliseconds period;

    TimerTask(
        TaskId taskId, std::string taskName,
        std::chrono::steady_clock::time_point execTime,
        std::function<void()> cb, bool periodic = false,
        std::chrono::milliseconds periodDuration = std::chrono::milliseconds(0))
        : id(taskId),
          name(std::move(taskName)),
          execTimestamp(execTime),
          callback(std::move(cb)),
          isPeriodic(periodic),
          period(periodDuration) {}
    bool operator>(const TimerTask& other) const {
      return execTimestamp > other.execTimestamp;
    }
  };

  explicit Timer(LoggerPtr logger = nullptr);
  ~Timer();

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  TaskId addOnceTask(const std::string& name, std::chrono::milliseconds delay,
                     std::function<void()> callback);
  TaskId addPeriodicTask(const std::string& name,
                         std::chrono::milliseconds delay,
                         std::chrono::milliseconds period,
                         std::function<void()> callback);
  // Drops a queued task; a callback already executing finishes normally.
  // Returns false for ids that are no longer (or never were) queued.
  bool cancel(TaskId id);

  void start();
  void stop();
  bool isRunning() const;

 private:
  void run();
  void execute(TimerTask& task);

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  std::unordered_set<TaskId> queued_;
  std::unordered_set<TaskId> cancelled_;
  TaskId nextId_;
  mutable std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  bool running_;
  LoggerPtr logger_;
};

}  // namespace utils
