#ifndef BUCKETDL_OBSERVER_HPP_
#define BUCKETDL_OBSERVER_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Progress/ProgressMap.hpp"
#include "utils/logger.hpp"

namespace bucketdl {

class Task;
struct TaskSnapshot;
using TaskPtr = std::shared_ptr<Task>;
using TaskCallback = std::function<void(const TaskPtr&)>;

// Receives a task after each change of its transfer state.
class Listener {
 public:
  virtual ~Listener() = default;
  virtual void update(const TaskPtr& task) = 0;
};

using ListenerPtr = std::shared_ptr<Listener>;

/**
 * @brief Ordered, duplicate-free set of listeners.
 *
 * notify() calls listeners in attachment order on the caller's thread. A
 * listener that throws is logged and skipped; the rest still run.
 */
class Notifier {
 public:
  explicit Notifier(utils::LoggerPtr logger = nullptr);

  // Both return false when nothing changed.
  bool attach(ListenerPtr listener);
  bool detach(const ListenerPtr& listener);
  void notify(const TaskPtr& task) const;
  size_t size() const;

 private:
  std::vector<ListenerPtr> listeners_;
  mutable std::mutex mutex_;
  utils::LoggerPtr logger_;
};

// Fires once, when the task has completed with bytes transferred equal to
// its size. Byte equality alone is not enough: the client may still be
// flushing the destination file.
class CompletionObserver : public Listener {
 public:
  explicit CompletionObserver(TaskCallback callback = nullptr);
  void update(const TaskPtr& task) override;
  bool fired() const { return fired_.load(); }

 private:
  TaskCallback callback_;
  std::atomic<bool> fired_{false};
};

// Fires once, when the task enters the Failed state.
class FailureObserver : public Listener {
 public:
  explicit FailureObserver(TaskCallback callback = nullptr);
  void update(const TaskPtr& task) override;
  bool fired() const { return fired_.load(); }

 private:
  TaskCallback callback_;
  std::atomic<bool> fired_{false};
};

// Writes "transferred <pct>%  <rate>MB/s" into the progress map on every
// update.
class ProgressObserver : public Listener {
 public:
  explicit ProgressObserver(std::shared_ptr<ProgressMap> progress,
                            TaskCallback callback = nullptr);
  void update(const TaskPtr& task) override;

  static std::string formatStatus(const TaskSnapshot& snapshot,
                                  std::chrono::steady_clock::time_point now);

 private:
  std::shared_ptr<ProgressMap> progress_;
  TaskCallback callback_;
};

}  // namespace bucketdl

#endif  // BUCKETDL_OBSERVER_HPP_
