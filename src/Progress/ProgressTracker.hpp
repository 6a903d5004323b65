#ifndef BUCKETDL_PROGRESS_TRACKER_HPP_
#define BUCKETDL_PROGRESS_TRACKER_HPP_

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>

#include "ProgressMap.hpp"
#include "utils/logger.hpp"
#include "utils/timer.hpp"

namespace bucketdl {

struct TrackerOptions {
  std::chrono::milliseconds interval{2000};
  bool clearScreen = true;
  std::ostream* sink = &std::cout;
};

// Periodically redraws every entry of the progress map on its own timer
// thread.
class ProgressTracker {
 public:
  ProgressTracker(std::shared_ptr<ProgressMap> progress,
                  TrackerOptions options = TrackerOptions(),
                  utils::LoggerPtr logger = nullptr);
  ~ProgressTracker();

  ProgressTracker(const ProgressTracker&) = delete;
  ProgressTracker& operator=(const ProgressTracker&) = delete;

  void start();
  // Lets the render in progress finish, then joins the timer thread.
  void stop();
  bool isRunning() const;

  void renderOnce();
  size_t renderCount() const;

 private:
  std::shared_ptr<ProgressMap> progress_;
  TrackerOptions options_;
  utils::LoggerPtr logger_;
  utils::Timer timer_;

  mutable std::mutex renderMutex_;
  size_t renders_;
  bool started_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_PROGRESS_TRACKER_HPP_
